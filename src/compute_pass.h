#pragma once
#include <webgpu/webgpu.h>
#include <string>
#include <vector>

// Pair of storage textures used as front/back buffers by the compute passes
struct PingPongTextures {
    WGPUTexture texA = nullptr;
    WGPUTexture texB = nullptr;
    WGPUTextureView viewA = nullptr;
    WGPUTextureView viewB = nullptr;
    uint32_t width = 0;
    uint32_t height = 0;
    uint32_t bytesPerPixel = 0;
    int current = 0; // slot being read this tick; the other one is written

    void init(WGPUDevice device, uint32_t w, uint32_t h,
              WGPUTextureFormat format, const char* label);
    void swap();
    WGPUTextureView readView() const;
    WGPUTextureView writeView() const;
    WGPUTextureView view(int slot) const { return slot == 0 ? viewA : viewB; }
    WGPUTexture texture(int slot) const { return slot == 0 ? texA : texB; }
    WGPUTexture readTexture() const { return texture(current); }
    void clear(WGPUQueue queue);
    void destroy();
};

uint32_t bytesPerPixel(WGPUTextureFormat format);

WGPUTexture createTexture(WGPUDevice device, uint32_t w, uint32_t h, WGPUTextureFormat format,
                          WGPUTextureUsageFlags usage, const char* label);
// Zero-fill via CPU upload
void clearTexture(WGPUQueue queue, WGPUTexture texture, uint32_t w, uint32_t h, uint32_t bpp);

WGPUBuffer createBuffer(WGPUDevice device, uint64_t size, WGPUBufferUsageFlags usage, const char* label);
void destroyBuffer(WGPUBuffer& buffer);

// Reads a text file; empty string if it can't be opened
std::string loadShaderFile(const char* path);

// Bind group layout entry shorthands
WGPUBindGroupLayoutEntry uniformEntry(uint32_t binding, uint64_t minSize,
                                      WGPUShaderStageFlags stages = WGPUShaderStage_Compute);
WGPUBindGroupLayoutEntry storageEntry(uint32_t binding, bool readOnly,
                                      WGPUShaderStageFlags stages = WGPUShaderStage_Compute);
WGPUBindGroupLayoutEntry textureEntry(uint32_t binding,
                                      WGPUShaderStageFlags stages = WGPUShaderStage_Compute);
WGPUBindGroupLayoutEntry storageTextureEntry(uint32_t binding, WGPUTextureFormat format);

WGPUBindGroupLayout createBindGroupLayout(WGPUDevice device, const std::vector<WGPUBindGroupLayoutEntry>& entries,
                                          const char* label);
WGPUPipelineLayout createPipelineLayout(WGPUDevice device, WGPUBindGroupLayout layout);

WGPUBindGroupEntry bufferBinding(uint32_t binding, WGPUBuffer buffer, uint64_t size);
WGPUBindGroupEntry textureBinding(uint32_t binding, WGPUTextureView view);
WGPUBindGroup createBindGroup(WGPUDevice device, WGPUBindGroupLayout layout,
                              const std::vector<WGPUBindGroupEntry>& entries);

// One compute pass: set pipeline + group 0, dispatch, end
void dispatchCompute(WGPUCommandEncoder encoder, WGPUComputePipeline pipeline, WGPUBindGroup group,
                     uint32_t x, uint32_t y = 1, uint32_t z = 1);
