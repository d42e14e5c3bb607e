#include "compute_pass.h"
#include <fstream>
#include <sstream>
#include <cstdio>

uint32_t bytesPerPixel(WGPUTextureFormat format) {
    switch (format) {
        case WGPUTextureFormat_RGBA16Float: return 8;
        case WGPUTextureFormat_RGBA32Float: return 16;
        default: return 4;
    }
}

WGPUTexture createTexture(WGPUDevice device, uint32_t w, uint32_t h, WGPUTextureFormat format,
                          WGPUTextureUsageFlags usage, const char* label) {
    WGPUTextureDescriptor desc = {};
    desc.size = { w, h, 1 };
    desc.format = format;
    desc.usage = usage;
    desc.dimension = WGPUTextureDimension_2D;
    desc.mipLevelCount = 1;
    desc.sampleCount = 1;
    desc.label = label;
    return wgpuDeviceCreateTexture(device, &desc);
}

void PingPongTextures::init(WGPUDevice device, uint32_t w, uint32_t h,
                            WGPUTextureFormat format, const char* label) {
    width = w;
    height = h;
    bytesPerPixel = ::bytesPerPixel(format);
    current = 0;

    WGPUTextureUsageFlags usage = WGPUTextureUsage_StorageBinding | WGPUTextureUsage_TextureBinding |
                                  WGPUTextureUsage_CopySrc | WGPUTextureUsage_CopyDst;
    std::string name = label;
    texA = createTexture(device, w, h, format, usage, (name + "_A").c_str());
    texB = createTexture(device, w, h, format, usage, (name + "_B").c_str());
    viewA = wgpuTextureCreateView(texA, nullptr);
    viewB = wgpuTextureCreateView(texB, nullptr);
}

void PingPongTextures::swap() { current = 1 - current; }
WGPUTextureView PingPongTextures::readView() const { return current == 0 ? viewA : viewB; }
WGPUTextureView PingPongTextures::writeView() const { return current == 0 ? viewB : viewA; }

void PingPongTextures::clear(WGPUQueue queue) {
    clearTexture(queue, texA, width, height, bytesPerPixel);
    clearTexture(queue, texB, width, height, bytesPerPixel);
    current = 0;
}

void PingPongTextures::destroy() {
    if (viewA) wgpuTextureViewRelease(viewA);
    if (viewB) wgpuTextureViewRelease(viewB);
    if (texA) { wgpuTextureDestroy(texA); wgpuTextureRelease(texA); }
    if (texB) { wgpuTextureDestroy(texB); wgpuTextureRelease(texB); }
    viewA = viewB = nullptr;
    texA = texB = nullptr;
}

void clearTexture(WGPUQueue queue, WGPUTexture texture, uint32_t w, uint32_t h, uint32_t bpp) {
    if (!texture) return;
    std::vector<uint8_t> zeros((size_t)w * h * bpp, 0);
    WGPUImageCopyTexture dst = {};
    dst.texture = texture;
    WGPUTextureDataLayout layout = {};
    layout.bytesPerRow = w * bpp;
    layout.rowsPerImage = h;
    WGPUExtent3D size = { w, h, 1 };
    wgpuQueueWriteTexture(queue, &dst, zeros.data(), zeros.size(), &layout, &size);
}

WGPUBuffer createBuffer(WGPUDevice device, uint64_t size, WGPUBufferUsageFlags usage, const char* label) {
    WGPUBufferDescriptor desc = {};
    desc.size = size;
    desc.usage = usage;
    desc.label = label;
    return wgpuDeviceCreateBuffer(device, &desc);
}

void destroyBuffer(WGPUBuffer& buffer) {
    if (!buffer) return;
    wgpuBufferDestroy(buffer);
    wgpuBufferRelease(buffer);
    buffer = nullptr;
}

std::string loadShaderFile(const char* path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        fprintf(stderr, "Failed to load shader: %s\n", path);
        return "";
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

WGPUBindGroupLayoutEntry uniformEntry(uint32_t binding, uint64_t minSize, WGPUShaderStageFlags stages) {
    WGPUBindGroupLayoutEntry e = {};
    e.binding = binding;
    e.visibility = stages;
    e.buffer.type = WGPUBufferBindingType_Uniform;
    e.buffer.minBindingSize = minSize;
    return e;
}

WGPUBindGroupLayoutEntry storageEntry(uint32_t binding, bool readOnly, WGPUShaderStageFlags stages) {
    WGPUBindGroupLayoutEntry e = {};
    e.binding = binding;
    e.visibility = stages;
    e.buffer.type = readOnly ? WGPUBufferBindingType_ReadOnlyStorage : WGPUBufferBindingType_Storage;
    return e;
}

WGPUBindGroupLayoutEntry textureEntry(uint32_t binding, WGPUShaderStageFlags stages) {
    WGPUBindGroupLayoutEntry e = {};
    e.binding = binding;
    e.visibility = stages;
    e.texture.sampleType = WGPUTextureSampleType_UnfilterableFloat;
    e.texture.viewDimension = WGPUTextureViewDimension_2D;
    return e;
}

WGPUBindGroupLayoutEntry storageTextureEntry(uint32_t binding, WGPUTextureFormat format) {
    WGPUBindGroupLayoutEntry e = {};
    e.binding = binding;
    e.visibility = WGPUShaderStage_Compute;
    e.storageTexture.access = WGPUStorageTextureAccess_WriteOnly;
    e.storageTexture.format = format;
    e.storageTexture.viewDimension = WGPUTextureViewDimension_2D;
    return e;
}

WGPUBindGroupLayout createBindGroupLayout(WGPUDevice device, const std::vector<WGPUBindGroupLayoutEntry>& entries,
                                          const char* label) {
    WGPUBindGroupLayoutDescriptor desc = {};
    desc.label = label;
    desc.entryCount = entries.size();
    desc.entries = entries.data();
    return wgpuDeviceCreateBindGroupLayout(device, &desc);
}

WGPUPipelineLayout createPipelineLayout(WGPUDevice device, WGPUBindGroupLayout layout) {
    WGPUPipelineLayoutDescriptor desc = {};
    desc.bindGroupLayoutCount = 1;
    desc.bindGroupLayouts = &layout;
    return wgpuDeviceCreatePipelineLayout(device, &desc);
}

WGPUBindGroupEntry bufferBinding(uint32_t binding, WGPUBuffer buffer, uint64_t size) {
    WGPUBindGroupEntry e = {};
    e.binding = binding;
    e.buffer = buffer;
    e.size = size;
    return e;
}

WGPUBindGroupEntry textureBinding(uint32_t binding, WGPUTextureView view) {
    WGPUBindGroupEntry e = {};
    e.binding = binding;
    e.textureView = view;
    return e;
}

WGPUBindGroup createBindGroup(WGPUDevice device, WGPUBindGroupLayout layout,
                              const std::vector<WGPUBindGroupEntry>& entries) {
    WGPUBindGroupDescriptor desc = {};
    desc.layout = layout;
    desc.entryCount = entries.size();
    desc.entries = entries.data();
    return wgpuDeviceCreateBindGroup(device, &desc);
}

void dispatchCompute(WGPUCommandEncoder encoder, WGPUComputePipeline pipeline, WGPUBindGroup group,
                     uint32_t x, uint32_t y, uint32_t z) {
    WGPUComputePassEncoder pass = wgpuCommandEncoderBeginComputePass(encoder, nullptr);
    wgpuComputePassEncoderSetPipeline(pass, pipeline);
    wgpuComputePassEncoderSetBindGroup(pass, 0, group, 0, nullptr);
    wgpuComputePassEncoderDispatchWorkgroups(pass, x, y, z);
    wgpuComputePassEncoderEnd(pass);
    wgpuComputePassEncoderRelease(pass);
}
