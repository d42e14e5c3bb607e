#include "frame_assembler.h"

static const WGPUTextureFormat kAccumFormat = WGPUTextureFormat_RGBA16Float;
static const WGPUTextureFormat kOutputFormat = WGPUTextureFormat_RGBA8Unorm;

bool FrameAssembler::init(WGPUDevice device, WGPUQueue queue) {
    m_device = device;
    m_queue = queue;

    m_uniformBuffer = createBuffer(device, sizeof(GpuParams), WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst,
                                   "frame_assembly_params");

    // uniform, raw, accum read/write, emboss source, history read/write, output
    m_layout = createBindGroupLayout(device, {
        uniformEntry(0, sizeof(GpuParams)),
        textureEntry(1),
        textureEntry(2),
        storageTextureEntry(3, kAccumFormat),
        textureEntry(4),
        textureEntry(5),
        storageTextureEntry(6, kAccumFormat),
        storageTextureEntry(7, kOutputFormat),
    }, "frame_assembly_layout");
    m_pipelineLayout = createPipelineLayout(device, m_layout);

    m_program.init(device, m_diag, "frame_assembly", "shaders/frame_assembly.wgsl");
    return reloadShaders();
}

bool FrameAssembler::reloadShaders() {
    return m_program.buildCompute(m_pipelineLayout, { "accumulate", "finish" });
}

void FrameAssembler::createTextures(uint32_t w, uint32_t h) {
    m_accum.init(m_device, w, h, kAccumFormat, "accumulation");
    m_history.init(m_device, w, h, kAccumFormat, "exposure_history");
    m_output = createTexture(m_device, w, h, kOutputFormat,
                             WGPUTextureUsage_StorageBinding | WGPUTextureUsage_TextureBinding |
                             WGPUTextureUsage_CopySrc, "frame_output");
    m_outputView = wgpuTextureCreateView(m_output, nullptr);
}

void FrameAssembler::destroyTextures() {
    m_accum.destroy();
    m_history.destroy();
    if (m_outputView) wgpuTextureViewRelease(m_outputView);
    if (m_output) { wgpuTextureDestroy(m_output); wgpuTextureRelease(m_output); }
    m_outputView = nullptr;
    m_output = nullptr;
}

WGPUBindGroup FrameAssembler::buildGroup(WGPUTextureView raw, WGPUTextureView embossSource) {
    return createBindGroup(m_device, m_layout, {
        bufferBinding(0, m_uniformBuffer, sizeof(GpuParams)),
        textureBinding(1, raw),
        textureBinding(2, m_accum.readView()),
        textureBinding(3, m_accum.writeView()),
        textureBinding(4, embossSource),
        textureBinding(5, m_history.readView()),
        textureBinding(6, m_history.writeView()),
        textureBinding(7, m_outputView),
    });
}

WGPUTextureView FrameAssembler::assemble(WGPUCommandEncoder encoder, WGPUTextureView raw,
                                         WGPUTextureView embossSource, uint32_t width, uint32_t height,
                                         uint32_t totalSamples, uint32_t sampleIndex, const FrameStyle& style) {
    WGPUComputePipeline accumulate = m_program.compute("accumulate");
    WGPUComputePipeline finish = m_program.compute("finish");
    if (!accumulate || !finish) {
        m_diag.warnLimited("frame_assembly.missing_program", "frame_assembly: program missing, frame dropped");
        return nullptr;
    }

    auto step = m_state.advance(totalSamples, sampleIndex, width, height);
    if (!step) return nullptr;

    if (step->recreate) {
        destroyTextures();
        createTextures(width, height);
        m_diag.info("frame_assembly: %ux%u, %u samples per frame", width, height, totalSamples);
    }

    GpuParams gp = {};
    gp.width = width;
    gp.height = height;
    gp.firstSample = step->firstSample ? 1u : 0u;
    gp.watercolor = style.watercolor ? 1u : 0u;
    gp.weight = step->weight;
    gp.brightness = style.brightness;
    gp.exposure = style.exposure;
    gp.inkWeight = style.inkWeight;
    gp.embossIntensity = style.embossIntensity;
    gp.embossSmoothness = style.embossSmoothness;
    gp.reticleVisible = style.reticle.visible ? 1u : 0u;
    gp.reticle[0] = style.reticle.u;
    gp.reticle[1] = style.reticle.v;
    wgpuQueueWriteBuffer(m_queue, m_uniformBuffer, 0, &gp, sizeof(gp));

    uint32_t wg = (width + 7) / 8;
    uint32_t hg = (height + 7) / 8;

    WGPUBindGroup bg = buildGroup(raw, embossSource);
    dispatchCompute(encoder, accumulate, bg, wg, hg);
    wgpuBindGroupRelease(bg);
    m_accum.swap();

    if (!step->finalSample) return nullptr;

    // Styling and gamma run once per window, on the completed sum
    bg = buildGroup(raw, embossSource);
    dispatchCompute(encoder, finish, bg, wg, hg);
    wgpuBindGroupRelease(bg);
    m_history.swap();
    return m_outputView;
}

void FrameAssembler::reset() {
    m_state.reset();
}

void FrameAssembler::shutdown() {
    destroyTextures();
    destroyBuffer(m_uniformBuffer);
    m_program.release();
    if (m_pipelineLayout) wgpuPipelineLayoutRelease(m_pipelineLayout);
    if (m_layout) wgpuBindGroupLayoutRelease(m_layout);
}
