#pragma once
#include <webgpu/webgpu.h>
#include "diagnostics.h"
#include "shader_program.h"
#include "view_transform.h"
#include <cstdint>

// Window-sized dot rendering of the entity buffer, used by the camera views.
// The result is a raw additive frame for the FrameAssembler, like the brush.
class ParticleView {
public:
    explicit ParticleView(Diagnostics& diag) : m_diag(diag) {}

    bool init(WGPUDevice device, WGPUQueue queue);
    bool reloadShaders();

    // Clears the target and draws every entity, once per visible tile when `tiled`.
    // The target follows the window size.
    void render(WGPUCommandEncoder encoder, WGPUBuffer entities, uint32_t entityCount, uint32_t canvasDim,
                uint32_t width, uint32_t height, const ViewTransform& view, bool tiled);

    WGPUTextureView targetView() const { return m_targetView; }
    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }

    void shutdown();

private:
    void createTarget(uint32_t w, uint32_t h);
    void destroyTarget();

    Diagnostics& m_diag;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;

    ShaderProgram m_program;
    WGPUBindGroupLayout m_layout = nullptr;
    WGPUPipelineLayout m_pipelineLayout = nullptr;
    WGPUBuffer m_paramsBuffer = nullptr;

    WGPUTexture m_target = nullptr;     // rgba16float
    WGPUTextureView m_targetView = nullptr;
    uint32_t m_width = 0, m_height = 0;

    struct GpuParams {
        float screenWidth, screenHeight, canvasDim, pointScale;
        float offset[2];
        float zoom, aspect;
        int32_t tileOrigin[2];
        uint32_t tilesX, entityCount;
    };
    static_assert(sizeof(GpuParams) == 48, "ParticleView GpuParams must be 48 bytes");
};
