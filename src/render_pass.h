#pragma once
#include <webgpu/webgpu.h>
#include "diagnostics.h"
#include "shader_program.h"
#include "view_transform.h"

// Fullscreen quad that presents the finished frame with the view transform applied
class RenderPass {
public:
    bool init(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat surfaceFormat, Diagnostics& diag);
    WGPUBindGroup createBindGroup(WGPUTextureView textureView);
    void setTransform(const ViewTransform& view, float aspectRatio);
    // Records the quad into an open render pass
    void draw(WGPURenderPassEncoder pass, WGPUBindGroup bindGroup);
    void shutdown();

private:
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    ShaderProgram m_program;
    WGPUBindGroupLayout m_bindGroupLayout = nullptr;
    WGPUPipelineLayout m_pipelineLayout = nullptr;
    WGPUSampler m_sampler = nullptr;
    WGPUBuffer m_uniformBuffer = nullptr;
};
