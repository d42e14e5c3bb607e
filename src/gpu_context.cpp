#include "gpu_context.h"
#include <glfw3webgpu.h>
#include <cstdio>

static void onDeviceError(WGPUErrorType type, const char* message, void* userdata) {
    // Errors outside a pushed error scope; shader rebuilds use their own scopes
    auto* diag = (Diagnostics*)userdata;
    diag->warnLimited("device-error", "WebGPU error type=%d: %s", (int)type, message ? message : "");
}

static WGPUAdapter requestAdapter(WGPUInstance instance, WGPUSurface surface, Diagnostics& diag) {
    WGPURequestAdapterOptions opts = {};
    opts.compatibleSurface = surface;
    opts.powerPreference = WGPUPowerPreference_HighPerformance;

    struct Request { WGPUAdapter adapter = nullptr; bool done = false; Diagnostics* diag; };
    Request req;
    req.diag = &diag;
    wgpuInstanceRequestAdapter(instance, &opts,
        [](WGPURequestAdapterStatus status, WGPUAdapter adapter, const char* message, void* ud) {
            auto* r = (Request*)ud;
            if (status == WGPURequestAdapterStatus_Success) r->adapter = adapter;
            else r->diag->error("Adapter request failed: %s", message ? message : "unknown");
            r->done = true;
        }, &req);

    // wgpu-native completes the request before returning
    if (!req.done) diag.error("Adapter request did not complete");
    return req.adapter;
}

static WGPUDevice requestDevice(WGPUAdapter adapter, const WGPURequiredLimits* limits, Diagnostics& diag) {
    WGPUDeviceDescriptor desc = {};
    desc.label = "fluoddity device";
    desc.requiredLimits = limits;

    struct Request { WGPUDevice device = nullptr; bool done = false; Diagnostics* diag; };
    Request req;
    req.diag = &diag;
    wgpuAdapterRequestDevice(adapter, &desc,
        [](WGPURequestDeviceStatus status, WGPUDevice device, const char* message, void* ud) {
            auto* r = (Request*)ud;
            if (status == WGPURequestDeviceStatus_Success) r->device = device;
            else r->diag->error("Device request failed: %s", message ? message : "unknown");
            r->done = true;
        }, &req);

    if (!req.done) diag.error("Device request did not complete");
    return req.device;
}

bool GpuContext::init(uint32_t w, uint32_t h, const char* title, Diagnostics& diag) {
    width = w;
    height = h;

    if (!glfwInit()) {
        diag.error("glfwInit failed");
        return false;
    }
    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);
    window = glfwCreateWindow(width, height, title, nullptr, nullptr);
    if (!window) {
        diag.error("Failed to create window");
        return false;
    }

    WGPUInstanceDescriptor instanceDesc = {};
    instance = wgpuCreateInstance(&instanceDesc);
    if (!instance) { diag.error("Failed to create WebGPU instance"); return false; }

    surface = glfwGetWGPUSurface(instance, window);
    if (!surface) { diag.error("Failed to get WebGPU surface"); return false; }

    adapter = requestAdapter(instance, surface, diag);
    if (!adapter) return false;

    WGPUAdapterProperties props = {};
    wgpuAdapterGetProperties(adapter, &props);
    diag.info("Adapter: %s (backend %d)", props.name ? props.name : "unknown", (int)props.backendType);

    // Ask for everything the adapter supports so large worlds get their storage buffers.
    // Requesting zero-initialized limits instead would be stricter than the adapter.
    WGPUSupportedLimits supported = {};
    WGPURequiredLimits required = {};
    const WGPURequiredLimits* requiredPtr = nullptr;
    if (wgpuAdapterGetLimits(adapter, &supported)) {
        required.limits = supported.limits;
        requiredPtr = &required;
    } else {
        diag.warnLimited("limits", "Adapter limits unavailable, using defaults");
    }

    device = requestDevice(adapter, requiredPtr, diag);
    if (!device) return false;

    wgpuDeviceSetUncapturedErrorCallback(device, onDeviceError, &diag);
    queue = wgpuDeviceGetQueue(device);

    WGPUSupportedLimits granted = {};
    if (wgpuDeviceGetLimits(device, &granted)) {
        maxStorageBindingSize = granted.limits.maxStorageBufferBindingSize;
        maxBufferSize = granted.limits.maxBufferSize;
    } else {
        // WebGPU defaults
        maxStorageBindingSize = 128ull << 20;
        maxBufferSize = 256ull << 20;
    }
    diag.info("Max storage binding %llu MiB", (unsigned long long)(maxStorageBindingSize >> 20));

    // Frames are assembled into rgba8unorm and sampled, so any 8-bit surface format presents them
    surfaceFormat = wgpuSurfaceGetPreferredFormat(surface, adapter);

    configureSurface();
    return true;
}

void GpuContext::configureSurface() {
    WGPUSurfaceConfiguration config = {};
    config.device = device;
    config.format = surfaceFormat;
    config.usage = WGPUTextureUsage_RenderAttachment;
    config.width = width;
    config.height = height;
    config.presentMode = WGPUPresentMode_Fifo;
    wgpuSurfaceConfigure(surface, &config);
}

void GpuContext::updateSize() {
    int w = 0, h = 0;
    glfwGetFramebufferSize(window, &w, &h);
    if (w <= 0 || h <= 0) return;
    if ((uint32_t)w == width && (uint32_t)h == height) return;
    width = (uint32_t)w;
    height = (uint32_t)h;
    configureSurface();
}

WGPUTextureView GpuContext::getNextSurfaceTextureView() {
    WGPUSurfaceTexture surfTex;
    wgpuSurfaceGetCurrentTexture(surface, &surfTex);
    if (surfTex.status != WGPUSurfaceGetCurrentTextureStatus_Success) {
        // Outdated or lost after a resize: reconfigure and skip this frame
        if (surfTex.texture) wgpuTextureRelease(surfTex.texture);
        configureSurface();
        return nullptr;
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = surfaceFormat;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.mipLevelCount = 1;
    viewDesc.arrayLayerCount = 1;
    return wgpuTextureCreateView(surfTex.texture, &viewDesc);
}

void GpuContext::present() {
    wgpuSurfacePresent(surface);
}

void GpuContext::shutdown() {
    if (queue) wgpuQueueRelease(queue);
    if (device) wgpuDeviceRelease(device);
    if (adapter) wgpuAdapterRelease(adapter);
    if (surface) wgpuSurfaceRelease(surface);
    if (instance) wgpuInstanceRelease(instance);
    if (window) glfwDestroyWindow(window);
    glfwTerminate();
}
