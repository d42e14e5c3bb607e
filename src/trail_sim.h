#pragma once
#include "compute_pass.h"
#include "diagnostics.h"
#include "entity_picker.h"
#include "multi_load.h"
#include "rule.h"
#include "shader_program.h"
#include "sim_state.h"
#include "simulation.h"
#include "tick_schedule.h"
#include <optional>
#include <vector>

// Owns the entity buffer, the trail field and the brush, and advances them one tick at a time.
class TrailSim : public Simulation {
public:
    explicit TrailSim(Diagnostics& diag) : m_diag(diag) {}

    bool init(WGPUDevice device, WGPUQueue queue, float worldSize);
    // Reallocates for a new world size, re-applies the active rule and resets.
    void resize(float worldSize) override;
    // Clears trails and brush, restarts the tick counter. Entities respawn on the next tick.
    void reset() override;
    // Re-reads every shader file; programs that fail keep their previous version.
    bool reloadShaders();

    void applyRule(const Rule& rule) override;
    const Rule& activeRule() const override { return m_rule; }

    // Encodes one tick. A tick with any stage program missing does nothing and returns false.
    bool step(WGPUCommandEncoder encoder, const SimState& state, MultiLoadRegistry& multiLoad);

    // Blocking readbacks, only for user interaction
    bool readbackEntities(std::vector<float>& out);
    std::optional<PickResult> pickNearest(float u, float v) override;
    std::optional<Rule> readbackRule(uint32_t index) override;

    // Canvas texture a canvas view shows; dot views render from entityBuffer() instead
    WGPUTextureView viewFor(ViewOption view) const;
    WGPUTextureView trailView() const { return m_trail.readView(); }
    WGPUTextureView brushView() const { return m_brushView; }
    // Storage buffer of GpuEntity, replaced on resize
    WGPUBuffer entityBuffer() const { return m_entityBuffer; }

    uint32_t entityCount() const { return m_entityCount; }
    uint32_t canvasDim() const { return m_canvasDim; }
    float worldSize() const override { return m_worldSize; }
    uint32_t tick() const { return m_tick; }

    void shutdown();

private:
    void createLayouts();
    bool buildPrograms();
    void createResources();
    void destroyResources();

    void uploadEntityParams(const SimState& state, bool multiLoadActive);
    void uploadCanvasParams(const SimState& state, const MultiLoadRegistry& multiLoad,
                            bool multiLoadActive, bool stampDrawing);
    void uploadMultiLoad(MultiLoadRegistry& multiLoad);

    void encodeDeposit(WGPUCommandEncoder encoder);
    WGPUBindGroup buildEntityGroup(int trailRead);
    WGPUBindGroup buildCanvasGroup(int trailRead, int trailWrite);

    Diagnostics& m_diag;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;

    // Textures
    PingPongTextures m_trail;           // rgba16float, current = front
    WGPUTexture m_brush = nullptr;      // rgba16float render target
    WGPUTextureView m_brushView = nullptr;

    // Buffers
    WGPUBuffer m_entityBuffer = nullptr;
    WGPUBuffer m_pickedRuleBuffer = nullptr;
    WGPUBuffer m_entityParamsBuffer = nullptr;
    WGPUBuffer m_ruleBuffer = nullptr;
    WGPUBuffer m_multiLoadParamsBuffer = nullptr;
    WGPUBuffer m_multiConfigBuffer = nullptr;
    WGPUBuffer m_multiRuleBuffer = nullptr;
    WGPUBuffer m_canvasParamsBuffer = nullptr;
    WGPUBuffer m_brushParamsBuffer = nullptr;

    // Programs and layouts
    ShaderProgram m_entityProgram;
    ShaderProgram m_canvasProgram;
    ShaderProgram m_brushProgram;
    WGPUBindGroupLayout m_entityLayout = nullptr;
    WGPUBindGroupLayout m_canvasLayout = nullptr;
    WGPUBindGroupLayout m_brushLayout = nullptr;
    WGPUPipelineLayout m_entityPipelineLayout = nullptr;
    WGPUPipelineLayout m_canvasPipelineLayout = nullptr;
    WGPUPipelineLayout m_brushPipelineLayout = nullptr;
    WGPUBindGroup m_brushGroup = nullptr; // entities + params, stable until resize

    Rule m_rule;
    std::vector<GpuMultiLoadConfig> m_packedConfigs;
    std::vector<Rule> m_packedRules;

    float m_worldSize = 1.0f;
    uint32_t m_entityCount = 0;
    uint32_t m_canvasDim = 0;
    uint32_t m_tick = 0;

    // GPU uniform structs (must match shaders)
    struct GpuEntityParams {
        GpuPhysicsSetting settings[kParamCount];
        uint32_t entityCount, frameCount, canvasWidth, canvasHeight;
        uint32_t disableSymmetry, orientationMode, boundaryMode, initialConditions;
        int32_t cohorts;
        uint32_t colorByCohort;
        float hueSensitivity, orientationMix;
        float ruleSeed;
        uint32_t multiLoadActive, pickedIndex;
        float _pad;
    };
    static_assert(sizeof(GpuEntityParams) == 448, "GpuEntityParams must be 448 bytes");

    struct GpuCanvasParams {
        GpuPhysicsSetting persistence;
        GpuPhysicsSetting diffusion;
        uint32_t width, height, boundaryMode, drawActive;
        float mouse[2];
        float prevMouse[2];
        float drawSize, drawPower;
        float _pad[2];
    };
    static_assert(sizeof(GpuCanvasParams) == 112, "GpuCanvasParams must be 112 bytes");

    struct GpuBrushParams {
        float canvasWidth, canvasHeight;
        uint32_t entityCount;
        float pointScale;
    };
    static_assert(sizeof(GpuBrushParams) == 16, "GpuBrushParams must be 16 bytes");

    GpuEntityParams m_entityParams = {};
};
