#pragma once
#include "gpu_context.h"
#include <webgpu/webgpu.h>

struct StatsOverlay {
    float fps = 0.0f;
    uint32_t canvasDim = 0;
    uint32_t entityCount = 0;
    uint32_t tick = 0;
    float zoom = 1.0f;
    int warnings = 0;
    int errors = 0;
};

struct UI {
    bool init(GpuContext& ctx);
    void beginFrame();
    void endFrame(WGPURenderPassEncoder renderPass);
    void shutdown();

    // Corner overlay, shown while Tab is held
    void drawStats(const StatsOverlay& stats);

    bool wantsMouse() const;
    bool wantsKeyboard() const;
};
