#include "particle_view.h"
#include "compute_pass.h"
#include "entity_picker.h"

static const WGPUTextureFormat kTargetFormat = WGPUTextureFormat_RGBA16Float;
static constexpr float kDotScale = 2.0f; // dot half-size in canvas texels, same footprint as the brush

bool ParticleView::init(WGPUDevice device, WGPUQueue queue) {
    m_device = device;
    m_queue = queue;

    m_paramsBuffer = createBuffer(device, sizeof(GpuParams), WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst,
                                  "particle_view_params");
    m_layout = createBindGroupLayout(device, {
        uniformEntry(0, sizeof(GpuParams), WGPUShaderStage_Vertex),
        storageEntry(1, true, WGPUShaderStage_Vertex),
    }, "particle_view_layout");
    m_pipelineLayout = createPipelineLayout(device, m_layout);

    m_program.init(device, m_diag, "particle_view", "shaders/particle_view.wgsl");
    return reloadShaders();
}

bool ParticleView::reloadShaders() {
    RenderTarget target;
    target.format = kTargetFormat;
    target.additive = true;
    return m_program.buildRender(m_pipelineLayout, target);
}

void ParticleView::createTarget(uint32_t w, uint32_t h) {
    m_target = createTexture(m_device, w, h, kTargetFormat,
                             WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_TextureBinding |
                             WGPUTextureUsage_CopySrc, "particle_view");
    m_targetView = wgpuTextureCreateView(m_target, nullptr);
    m_width = w;
    m_height = h;
}

void ParticleView::destroyTarget() {
    if (m_targetView) wgpuTextureViewRelease(m_targetView);
    if (m_target) { wgpuTextureDestroy(m_target); wgpuTextureRelease(m_target); }
    m_targetView = nullptr;
    m_target = nullptr;
    m_width = 0;
    m_height = 0;
}

void ParticleView::render(WGPUCommandEncoder encoder, WGPUBuffer entities, uint32_t entityCount, uint32_t canvasDim,
                          uint32_t width, uint32_t height, const ViewTransform& view, bool tiled) {
    if (width == 0 || height == 0) return;
    if (width != m_width || height != m_height) {
        destroyTarget();
        createTarget(width, height);
    }

    float aspect = (float)width / (float)height;
    TileRange tiles;
    if (tiled) tiles = tileRange(visibleCanvasRect(view, aspect));

    GpuParams p = {};
    p.screenWidth = (float)width;
    p.screenHeight = (float)height;
    p.canvasDim = (float)canvasDim;
    p.pointScale = kDotScale;
    p.offset[0] = view.offsetX;
    p.offset[1] = view.offsetY;
    p.zoom = view.zoom;
    p.aspect = aspect;
    p.tileOrigin[0] = tiles.originU;
    p.tileOrigin[1] = tiles.originV;
    p.tilesX = (uint32_t)tiles.countU;
    p.entityCount = entityCount;
    wgpuQueueWriteBuffer(m_queue, m_paramsBuffer, 0, &p, sizeof(p));

    WGPURenderPassColorAttachment colorAtt = {};
    colorAtt.view = m_targetView;
    colorAtt.loadOp = WGPULoadOp_Clear;
    colorAtt.storeOp = WGPUStoreOp_Store;
    colorAtt.clearValue = { 0.0, 0.0, 0.0, 0.0 };

    WGPURenderPassDescriptor rpDesc = {};
    rpDesc.colorAttachmentCount = 1;
    rpDesc.colorAttachments = &colorAtt;

    // The entity buffer is reallocated on resize, so the group is built per pass
    WGPUBindGroup group = nullptr;
    if (entities && entityCount > 0) {
        group = createBindGroup(m_device, m_layout, {
            bufferBinding(0, m_paramsBuffer, sizeof(GpuParams)),
            bufferBinding(1, entities, (uint64_t)entityCount * sizeof(GpuEntity)),
        });
    }

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &rpDesc);
    if (m_program.ready() && group) {
        wgpuRenderPassEncoderSetPipeline(pass, m_program.render());
        wgpuRenderPassEncoderSetBindGroup(pass, 0, group, 0, nullptr);
        wgpuRenderPassEncoderDraw(pass, 6, entityCount * (uint32_t)tiles.count(), 0, 0);
    }
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
    if (group) wgpuBindGroupRelease(group);
}

void ParticleView::shutdown() {
    destroyTarget();
    destroyBuffer(m_paramsBuffer);
    m_program.release();
    if (m_pipelineLayout) wgpuPipelineLayoutRelease(m_pipelineLayout);
    if (m_layout) wgpuBindGroupLayoutRelease(m_layout);
}
