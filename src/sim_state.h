#pragma once
#include "physics_config.h"
#include <cstdint>

// Particles draws entities as dots at the current pan and zoom; TiledParticles repeats
// them across every visible copy of the canvas.
enum class ViewOption : int { Canvas = 0, Brush = 1, Particles = 2, TiledParticles = 3 };

struct DrawInput {
    float mouseU = 0.0f, mouseV = 0.0f;  // canvas UV
    float prevU = 0.0f, prevV = 0.0f;
    float size = 0.1f;
    float power = 0.0f;  // 0 unless the button is held
    bool requested = false;
};

// Everything the stepper needs for one tick, captured from the UI before the tick starts.
struct SimState {
    PhysicsConfig config;
    ViewOption view = ViewOption::Particles;
    DrawInput draw;
    bool multiLoadEnabled = false;
    bool previewActive = false;

    // Off while spatial sweeps or multi-load assignment run
    bool drawActive() const { return draw.requested && !config.sweepsEnabled && !multiLoadEnabled; }
    // A rule preview suspends multi-load
    bool multiLoadActive(bool registryHasConfigs) const {
        return multiLoadEnabled && registryHasConfigs && !previewActive;
    }
};

constexpr uint32_t kBaseEntityCount = 600000;
constexpr uint32_t kBaseCanvasDim = 1024;

uint32_t entityCountFor(float worldSize);
uint32_t canvasDimFor(float worldSize);
