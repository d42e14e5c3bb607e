#pragma once
#include <webgpu/webgpu.h>
#include "compute_pass.h"
#include "diagnostics.h"
#include "frame_accumulation.h"
#include "physics_config.h"
#include "shader_program.h"
#include <cstdint>

struct FrameStyle {
    float brightness = 1.0f;
    float exposure = 0.0f;       // blend with the previous finished frame, 0 = off
    float inkWeight = 1.0f;
    bool watercolor = false;
    float embossIntensity = 0.0f;
    float embossSmoothness = 0.1f;
    SweepReticle reticle;
};

// Averages raw simulation frames over a sample window and styles the result once per window.
class FrameAssembler {
public:
    explicit FrameAssembler(Diagnostics& diag) : m_diag(diag) {}

    bool init(WGPUDevice device, WGPUQueue queue);
    bool reloadShaders();

    // Adds `raw` to the running average. On the final sample of the window the styled frame is
    // written and its view returned; every other call returns nullptr.
    WGPUTextureView assemble(WGPUCommandEncoder encoder, WGPUTextureView raw, WGPUTextureView embossSource,
                             uint32_t width, uint32_t height, uint32_t totalSamples, uint32_t sampleIndex,
                             const FrameStyle& style);

    // Last finished frame, rgba8unorm
    WGPUTexture outputTexture() const { return m_output; }
    WGPUTextureView outputView() const { return m_outputView; }
    uint32_t width() const { return m_state.width(); }
    uint32_t height() const { return m_state.height(); }
    const AccumulationState& state() const { return m_state; }

    // Drops the buffers; the next sample reallocates them
    void reset();
    void shutdown();

private:
    void createTextures(uint32_t w, uint32_t h);
    void destroyTextures();
    WGPUBindGroup buildGroup(WGPUTextureView raw, WGPUTextureView embossSource);

    Diagnostics& m_diag;
    WGPUDevice m_device = nullptr;
    WGPUQueue m_queue = nullptr;
    AccumulationState m_state;

    PingPongTextures m_accum;    // rgba16float running sum
    PingPongTextures m_history;  // rgba16float previous finished frame (exposure)
    WGPUTexture m_output = nullptr;
    WGPUTextureView m_outputView = nullptr;

    ShaderProgram m_program;
    WGPUBindGroupLayout m_layout = nullptr;
    WGPUPipelineLayout m_pipelineLayout = nullptr;
    WGPUBuffer m_uniformBuffer = nullptr;

    struct GpuParams {
        uint32_t width, height, firstSample, watercolor;
        float weight, brightness, exposure, inkWeight;
        float embossIntensity, embossSmoothness;
        uint32_t reticleVisible;
        float _pad;
        float reticle[2];
        float _pad2[2];
    };
    static_assert(sizeof(GpuParams) == 64, "FrameAssembler GpuParams must be 64 bytes");
};
