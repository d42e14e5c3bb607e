#pragma once
#include "diagnostics.h"
#include <webgpu/webgpu.h>
#include <GLFW/glfw3.h>

// Window, device and swapchain shared by every pass.
struct GpuContext {
    GLFWwindow* window = nullptr;
    WGPUInstance instance = nullptr;
    WGPUSurface surface = nullptr;
    WGPUAdapter adapter = nullptr;
    WGPUDevice device = nullptr;
    WGPUQueue queue = nullptr;
    WGPUTextureFormat surfaceFormat = WGPUTextureFormat_BGRA8Unorm;
    uint32_t width = 1280;
    uint32_t height = 1280;

    // Granted by the device; the entity buffer at the largest world size must fit
    uint64_t maxStorageBindingSize = 0;
    uint64_t maxBufferSize = 0;

    bool init(uint32_t w, uint32_t h, const char* title, Diagnostics& diag);
    // True when a buffer of `bytes` can be bound as one storage binding
    bool fitsStorageBinding(uint64_t bytes) const { return bytes <= maxStorageBindingSize && bytes <= maxBufferSize; }

    void configureSurface();
    // Follows the framebuffer; no-op while minimized
    void updateSize();
    WGPUTextureView getNextSurfaceTextureView();
    void present();
    void shutdown();
};
