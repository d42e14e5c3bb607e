#include "trail_sim.h"
#include "export.h"
#include <cstring>

static const WGPUTextureFormat kFieldFormat = WGPUTextureFormat_RGBA16Float;
static constexpr uint32_t kEntityWorkgroup = 64;
static constexpr float kPointScale = 2.0f; // brush footprint half-size in texels

bool TrailSim::init(WGPUDevice device, WGPUQueue queue, float worldSize) {
    m_device = device;
    m_queue = queue;
    m_worldSize = worldSize;

    m_entityProgram.init(device, m_diag, "entity_update", "shaders/entity_update.wgsl",
                         { kSweepWgsl, kRuleWgsl, kMultiLoadWgsl });
    m_canvasProgram.init(device, m_diag, "canvas_update", "shaders/canvas_update.wgsl", { kSweepWgsl });
    m_brushProgram.init(device, m_diag, "brush", "shaders/brush.wgsl");

    createLayouts();
    createResources();
    bool ok = buildPrograms();
    applyRule(m_rule);
    reset();
    return ok;
}

void TrailSim::createLayouts() {
    // Entity update: params, front trail, entities, picked rule, base rule, multi-load params/configs/rules
    m_entityLayout = createBindGroupLayout(m_device, {
        uniformEntry(0, sizeof(GpuEntityParams)),
        textureEntry(1),
        storageEntry(2, false),
        storageEntry(3, false),
        uniformEntry(4, kRuleBytes),
        uniformEntry(5, sizeof(GpuMultiLoadParams)),
        storageEntry(6, true),
        storageEntry(7, true),
    }, "entity_update_layout");

    // Canvas update: params, front trail, brush, back trail
    m_canvasLayout = createBindGroupLayout(m_device, {
        uniformEntry(0, sizeof(GpuCanvasParams)),
        textureEntry(1),
        textureEntry(2),
        storageTextureEntry(3, kFieldFormat),
    }, "canvas_update_layout");

    // Brush: params + entities, read in the vertex stage
    m_brushLayout = createBindGroupLayout(m_device, {
        uniformEntry(0, sizeof(GpuBrushParams), WGPUShaderStage_Vertex),
        storageEntry(1, true, WGPUShaderStage_Vertex),
    }, "brush_layout");

    m_entityPipelineLayout = createPipelineLayout(m_device, m_entityLayout);
    m_canvasPipelineLayout = createPipelineLayout(m_device, m_canvasLayout);
    m_brushPipelineLayout = createPipelineLayout(m_device, m_brushLayout);
}

bool TrailSim::buildPrograms() {
    bool entityOk = m_entityProgram.buildCompute(m_entityPipelineLayout, { "update_entities", "read_entity_rule" });
    bool canvasOk = m_canvasProgram.buildCompute(m_canvasPipelineLayout, { "update_canvas" });

    RenderTarget target;
    target.format = kFieldFormat;
    target.additive = true;
    bool brushOk = m_brushProgram.buildRender(m_brushPipelineLayout, target);
    return entityOk && canvasOk && brushOk;
}

bool TrailSim::reloadShaders() {
    m_diag.resetWarnings();
    return buildPrograms();
}

void TrailSim::createResources() {
    m_entityCount = entityCountFor(m_worldSize);
    m_canvasDim = canvasDimFor(m_worldSize);

    m_trail.init(m_device, m_canvasDim, m_canvasDim, kFieldFormat, "trail");
    m_brush = createTexture(m_device, m_canvasDim, m_canvasDim, kFieldFormat,
                            WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_TextureBinding |
                            WGPUTextureUsage_CopySrc | WGPUTextureUsage_CopyDst, "brush");
    m_brushView = wgpuTextureCreateView(m_brush, nullptr);

    WGPUBufferUsageFlags uniform = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    WGPUBufferUsageFlags storage = WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst | WGPUBufferUsage_CopySrc;

    m_entityBuffer = createBuffer(m_device, (uint64_t)m_entityCount * sizeof(GpuEntity), storage, "entities");
    m_pickedRuleBuffer = createBuffer(m_device, kRuleBytes, storage, "picked_rule");
    m_entityParamsBuffer = createBuffer(m_device, sizeof(GpuEntityParams), uniform, "entity_params");
    m_ruleBuffer = createBuffer(m_device, kRuleBytes, uniform, "base_rule");
    m_multiLoadParamsBuffer = createBuffer(m_device, sizeof(GpuMultiLoadParams), uniform, "multi_load_params");
    m_multiConfigBuffer = createBuffer(m_device, sizeof(GpuMultiLoadConfig) * kMaxMultiLoadConfigs, storage,
                                       "multi_configs");
    m_multiRuleBuffer = createBuffer(m_device, kRuleBytes * kMaxMultiLoadConfigs, storage, "multi_rules");
    m_canvasParamsBuffer = createBuffer(m_device, sizeof(GpuCanvasParams), uniform, "canvas_params");
    m_brushParamsBuffer = createBuffer(m_device, sizeof(GpuBrushParams), uniform, "brush_params");

    GpuBrushParams bp = {};
    bp.canvasWidth = (float)m_canvasDim;
    bp.canvasHeight = (float)m_canvasDim;
    bp.entityCount = m_entityCount;
    bp.pointScale = kPointScale;
    wgpuQueueWriteBuffer(m_queue, m_brushParamsBuffer, 0, &bp, sizeof(bp));

    m_brushGroup = createBindGroup(m_device, m_brushLayout, {
        bufferBinding(0, m_brushParamsBuffer, sizeof(GpuBrushParams)),
        bufferBinding(1, m_entityBuffer, (uint64_t)m_entityCount * sizeof(GpuEntity)),
    });

    m_diag.info("trail_sim: %u entities, %ux%u canvas", m_entityCount, m_canvasDim, m_canvasDim);
}

void TrailSim::destroyResources() {
    if (m_brushGroup) wgpuBindGroupRelease(m_brushGroup);
    m_brushGroup = nullptr;

    destroyBuffer(m_entityBuffer);
    destroyBuffer(m_pickedRuleBuffer);
    destroyBuffer(m_entityParamsBuffer);
    destroyBuffer(m_ruleBuffer);
    destroyBuffer(m_multiLoadParamsBuffer);
    destroyBuffer(m_multiConfigBuffer);
    destroyBuffer(m_multiRuleBuffer);
    destroyBuffer(m_canvasParamsBuffer);
    destroyBuffer(m_brushParamsBuffer);

    if (m_brushView) wgpuTextureViewRelease(m_brushView);
    if (m_brush) { wgpuTextureDestroy(m_brush); wgpuTextureRelease(m_brush); }
    m_brushView = nullptr;
    m_brush = nullptr;
    m_trail.destroy();
}

void TrailSim::resize(float worldSize) {
    m_worldSize = worldSize;
    destroyResources();
    createResources();
    applyRule(m_rule);
    reset();
}

void TrailSim::reset() {
    m_trail.clear(m_queue);
    clearTexture(m_queue, m_brush, m_canvasDim, m_canvasDim, bytesPerPixel(kFieldFormat));
    m_tick = 0;
}

void TrailSim::applyRule(const Rule& rule) {
    m_rule = rule;
    wgpuQueueWriteBuffer(m_queue, m_ruleBuffer, 0, m_rule.values.data(), kRuleBytes);
}

void TrailSim::uploadEntityParams(const SimState& state, bool multiLoadActive) {
    const PhysicsConfig& c = state.config;
    GpuEntityParams& p = m_entityParams;
    for (int i = 0; i < kParamCount; i++)
        p.settings[i] = packSetting(c.effectiveSetting((ParamId)i));
    p.entityCount = m_entityCount;
    p.frameCount = m_tick;
    p.canvasWidth = m_canvasDim;
    p.canvasHeight = m_canvasDim;
    p.disableSymmetry = c.disableSymmetry ? 1u : 0u;
    p.orientationMode = (uint32_t)c.orientation;
    p.boundaryMode = (uint32_t)c.boundary;
    p.initialConditions = (uint32_t)c.initial;
    p.cohorts = c.cohorts;
    p.colorByCohort = c.colorByCohort ? 1u : 0u;
    p.hueSensitivity = c.hueSensitivity;
    p.orientationMix = c.orientationMix;
    p.ruleSeed = c.ruleSeed;
    p.multiLoadActive = multiLoadActive ? 1u : 0u;
    wgpuQueueWriteBuffer(m_queue, m_entityParamsBuffer, 0, &p, sizeof(p));
}

void TrailSim::uploadCanvasParams(const SimState& state, const MultiLoadRegistry& multiLoad,
                                  bool multiLoadActive, bool stampDrawing) {
    const PhysicsConfig& c = state.config;
    GpuCanvasParams p = {};
    if (multiLoadActive) {
        // The field is shared, so it runs on the window-weighted average of the loaded configs
        TrailSettings t = multiLoad.weightedTrailSettings();
        PhysicsSetting persistence = c.setting(ParamId::TrailPersistence);
        PhysicsSetting diffusion = c.setting(ParamId::TrailDiffusion);
        persistence.value = t.persistence;
        diffusion.value = t.diffusion;
        p.persistence = packSetting(persistence, false, false);
        p.diffusion = packSetting(diffusion, false, false);
    } else {
        p.persistence = packSetting(c.effectiveSetting(ParamId::TrailPersistence));
        p.diffusion = packSetting(c.effectiveSetting(ParamId::TrailDiffusion));
    }
    p.width = m_canvasDim;
    p.height = m_canvasDim;
    p.boundaryMode = (uint32_t)c.boundary;
    p.drawActive = stampDrawing ? 1u : 0u;
    p.mouse[0] = state.draw.mouseU;
    p.mouse[1] = state.draw.mouseV;
    p.prevMouse[0] = state.draw.prevU;
    p.prevMouse[1] = state.draw.prevV;
    p.drawSize = state.draw.size;
    p.drawPower = state.draw.power;
    wgpuQueueWriteBuffer(m_queue, m_canvasParamsBuffer, 0, &p, sizeof(p));
}

void TrailSim::uploadMultiLoad(MultiLoadRegistry& multiLoad) {
    GpuMultiLoadParams params = multiLoad.gpuParams();
    wgpuQueueWriteBuffer(m_queue, m_multiLoadParamsBuffer, 0, &params, sizeof(params));

    if (!multiLoad.dirty()) return;
    if (!m_entityProgram.hasUniform("multi_configs") || !m_entityProgram.hasUniform("multi_rules")) {
        m_diag.warnLimited("entity_update.multi_load",
                           "entity_update: program declares no multi-load arrays, upload skipped");
        return;
    }

    multiLoad.packGpu(m_packedConfigs, m_packedRules);
    wgpuQueueWriteBuffer(m_queue, m_multiConfigBuffer, 0, m_packedConfigs.data(),
                         m_packedConfigs.size() * sizeof(GpuMultiLoadConfig));
    wgpuQueueWriteBuffer(m_queue, m_multiRuleBuffer, 0, m_packedRules.data(),
                         m_packedRules.size() * sizeof(Rule));
    multiLoad.clearDirty();
    m_diag.info("multi_load: uploaded %d configs", multiLoad.count());
}

WGPUBindGroup TrailSim::buildEntityGroup(int trailRead) {
    return createBindGroup(m_device, m_entityLayout, {
        bufferBinding(0, m_entityParamsBuffer, sizeof(GpuEntityParams)),
        textureBinding(1, m_trail.view(trailRead)),
        bufferBinding(2, m_entityBuffer, (uint64_t)m_entityCount * sizeof(GpuEntity)),
        bufferBinding(3, m_pickedRuleBuffer, kRuleBytes),
        bufferBinding(4, m_ruleBuffer, kRuleBytes),
        bufferBinding(5, m_multiLoadParamsBuffer, sizeof(GpuMultiLoadParams)),
        bufferBinding(6, m_multiConfigBuffer, sizeof(GpuMultiLoadConfig) * kMaxMultiLoadConfigs),
        bufferBinding(7, m_multiRuleBuffer, kRuleBytes * kMaxMultiLoadConfigs),
    });
}

WGPUBindGroup TrailSim::buildCanvasGroup(int trailRead, int trailWrite) {
    return createBindGroup(m_device, m_canvasLayout, {
        bufferBinding(0, m_canvasParamsBuffer, sizeof(GpuCanvasParams)),
        textureBinding(1, m_trail.view(trailRead)),
        textureBinding(2, m_brushView),
        textureBinding(3, m_trail.view(trailWrite)),
    });
}

void TrailSim::encodeDeposit(WGPUCommandEncoder encoder) {
    WGPURenderPassColorAttachment colorAtt = {};
    colorAtt.view = m_brushView;
    colorAtt.loadOp = WGPULoadOp_Clear;
    colorAtt.storeOp = WGPUStoreOp_Store;
    colorAtt.clearValue = { 0.0, 0.0, 0.0, 0.0 };

    WGPURenderPassDescriptor rpDesc = {};
    rpDesc.colorAttachmentCount = 1;
    rpDesc.colorAttachments = &colorAtt;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &rpDesc);
    // Tick 0 only clears: entities are spawned by the update that follows
    if (m_tick > 0) {
        wgpuRenderPassEncoderSetPipeline(pass, m_brushProgram.render());
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_brushGroup, 0, nullptr);
        wgpuRenderPassEncoderDraw(pass, 6, m_entityCount, 0, 0);
    }
    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);
}

bool TrailSim::step(WGPUCommandEncoder encoder, const SimState& state, MultiLoadRegistry& multiLoad) {
    if (!m_entityProgram.ready() || !m_canvasProgram.ready() || !m_brushProgram.ready()) {
        m_diag.warnLimited("tick.missing_program", "trail_sim: tick skipped, a stage program is missing");
        return false;
    }

    bool multiLoadActive = state.multiLoadActive(multiLoad.isActive());
    TickPlan plan = planTick(m_trail.current, state.drawActive());

    if (multiLoadActive) uploadMultiLoad(multiLoad);
    uploadEntityParams(state, multiLoadActive);
    uploadCanvasParams(state, multiLoad, multiLoadActive, plan.passes[2].stampsDrawing);

    for (const TickPass& pass : plan.passes) {
        switch (pass.stage) {
            case TickStage::Deposit:
                encodeDeposit(encoder);
                break;
            case TickStage::EntityUpdate: {
                WGPUBindGroup bg = buildEntityGroup(pass.trailRead);
                dispatchCompute(encoder, m_entityProgram.compute("update_entities"), bg,
                                (m_entityCount + kEntityWorkgroup - 1) / kEntityWorkgroup);
                wgpuBindGroupRelease(bg);
                break;
            }
            case TickStage::TrailUpdate: {
                WGPUBindGroup bg = buildCanvasGroup(pass.trailRead, pass.trailWrite);
                dispatchCompute(encoder, m_canvasProgram.compute("update_canvas"), bg,
                                (m_canvasDim + 7) / 8, (m_canvasDim + 7) / 8);
                wgpuBindGroupRelease(bg);
                break;
            }
        }
    }

    m_trail.current = plan.frontAfter;
    m_tick++;
    if (multiLoadActive) multiLoad.incrementProgress();
    return true;
}

bool TrailSim::readbackEntities(std::vector<float>& out) {
    std::vector<uint8_t> bytes;
    uint64_t size = (uint64_t)m_entityCount * sizeof(GpuEntity);
    if (!readbackBuffer(m_device, m_queue, m_entityBuffer, size, bytes)) {
        m_diag.error("trail_sim: entity readback failed");
        return false;
    }
    out.resize(bytes.size() / sizeof(float));
    memcpy(out.data(), bytes.data(), out.size() * sizeof(float));
    return true;
}

std::optional<PickResult> TrailSim::pickNearest(float u, float v) {
    std::vector<float> data;
    if (!readbackEntities(data)) return std::nullopt;
    return findNearestEntity(data.data(), data.size() / kEntityFloats, u, v);
}

std::optional<Rule> TrailSim::readbackRule(uint32_t index) {
    if (index >= m_entityCount) {
        m_diag.error("trail_sim: rule readback index %u out of range", index);
        return std::nullopt;
    }
    WGPUComputePipeline readRule = m_entityProgram.compute("read_entity_rule");
    if (!readRule || !m_entityProgram.hasUniform("picked_rule")) {
        m_diag.warnLimited("entity_update.picked_rule", "entity_update: no rule readback entry, readback skipped");
        return std::nullopt;
    }

    m_entityParams.pickedIndex = index;
    wgpuQueueWriteBuffer(m_queue, m_entityParamsBuffer, 0, &m_entityParams, sizeof(m_entityParams));

    WGPUCommandEncoderDescriptor encDesc = {};
    WGPUCommandEncoder encoder = wgpuDeviceCreateCommandEncoder(m_device, &encDesc);
    WGPUBindGroup bg = buildEntityGroup(m_trail.current);
    dispatchCompute(encoder, readRule, bg, 1);
    wgpuBindGroupRelease(bg);

    WGPUCommandBufferDescriptor cbDesc = {};
    WGPUCommandBuffer cmdBuf = wgpuCommandEncoderFinish(encoder, &cbDesc);
    wgpuQueueSubmit(m_queue, 1, &cmdBuf);
    wgpuCommandBufferRelease(cmdBuf);
    wgpuCommandEncoderRelease(encoder);

    std::vector<uint8_t> bytes;
    if (!readbackBuffer(m_device, m_queue, m_pickedRuleBuffer, kRuleBytes, bytes)) {
        m_diag.error("trail_sim: rule readback failed");
        return std::nullopt;
    }
    Rule rule;
    memcpy(rule.values.data(), bytes.data(), kRuleBytes);
    return rule;
}

WGPUTextureView TrailSim::viewFor(ViewOption view) const {
    return view == ViewOption::Brush ? m_brushView : m_trail.readView();
}

void TrailSim::shutdown() {
    destroyResources();
    m_entityProgram.release();
    m_canvasProgram.release();
    m_brushProgram.release();
    if (m_entityPipelineLayout) wgpuPipelineLayoutRelease(m_entityPipelineLayout);
    if (m_canvasPipelineLayout) wgpuPipelineLayoutRelease(m_canvasPipelineLayout);
    if (m_brushPipelineLayout) wgpuPipelineLayoutRelease(m_brushPipelineLayout);
    if (m_entityLayout) wgpuBindGroupLayoutRelease(m_entityLayout);
    if (m_canvasLayout) wgpuBindGroupLayoutRelease(m_canvasLayout);
    if (m_brushLayout) wgpuBindGroupLayoutRelease(m_brushLayout);
}
