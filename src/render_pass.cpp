#include "render_pass.h"
#include "compute_pass.h"

bool RenderPass::init(WGPUDevice device, WGPUQueue queue, WGPUTextureFormat surfaceFormat, Diagnostics& diag) {
    m_device = device;
    m_queue = queue;

    // Bind group layout: sampler + texture + uniform
    WGPUBindGroupLayoutEntry samplerEntry = {};
    samplerEntry.binding = 0;
    samplerEntry.visibility = WGPUShaderStage_Fragment;
    samplerEntry.sampler.type = WGPUSamplerBindingType_Filtering;

    WGPUBindGroupLayoutEntry texEntry = textureEntry(1, WGPUShaderStage_Fragment);
    texEntry.texture.sampleType = WGPUTextureSampleType_Float;

    m_bindGroupLayout = createBindGroupLayout(device, {
        samplerEntry, texEntry, uniformEntry(2, 16, WGPUShaderStage_Fragment),
    }, "present_layout");
    m_pipelineLayout = createPipelineLayout(device, m_bindGroupLayout);

    // Nearest neighbor for crisp pixels when zoomed
    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.magFilter = WGPUFilterMode_Nearest;
    samplerDesc.minFilter = WGPUFilterMode_Nearest;
    samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.maxAnisotropy = 1;
    m_sampler = wgpuDeviceCreateSampler(device, &samplerDesc);

    m_uniformBuffer = createBuffer(device, 16, WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst, "present_transform");
    setTransform(ViewTransform{}, 1.0f);

    RenderTarget target;
    target.format = surfaceFormat;
    m_program.init(device, diag, "present", "shaders/fullscreen_quad.wgsl");
    return m_program.buildRender(m_pipelineLayout, target);
}

WGPUBindGroup RenderPass::createBindGroup(WGPUTextureView textureView) {
    WGPUBindGroupEntry samplerBinding = {};
    samplerBinding.binding = 0;
    samplerBinding.sampler = m_sampler;
    return ::createBindGroup(m_device, m_bindGroupLayout, {
        samplerBinding, textureBinding(1, textureView), bufferBinding(2, m_uniformBuffer, 16),
    });
}

void RenderPass::setTransform(const ViewTransform& view, float aspectRatio) {
    float data[4] = { view.offsetX, view.offsetY, view.zoom, aspectRatio };
    wgpuQueueWriteBuffer(m_queue, m_uniformBuffer, 0, data, 16);
}

void RenderPass::draw(WGPURenderPassEncoder pass, WGPUBindGroup bindGroup) {
    if (!m_program.ready()) return;
    wgpuRenderPassEncoderSetPipeline(pass, m_program.render());
    wgpuRenderPassEncoderSetBindGroup(pass, 0, bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 6, 1, 0, 0); // fullscreen quad (2 triangles)
}

void RenderPass::shutdown() {
    destroyBuffer(m_uniformBuffer);
    if (m_sampler) wgpuSamplerRelease(m_sampler);
    m_program.release();
    if (m_pipelineLayout) wgpuPipelineLayoutRelease(m_pipelineLayout);
    if (m_bindGroupLayout) wgpuBindGroupLayoutRelease(m_bindGroupLayout);
}
