#pragma once
#include "physics_config.h"
#include <string>
#include <vector>

constexpr int kMaxMultiLoadConfigs = 64;

enum class AssignmentMode : int { Cohorts = 0, Random = 1 };

struct TrailSettings {
    float persistence;
    float diffusion;
};

// Fallback when nothing is loaded; matches the default config.
constexpr TrailSettings kDefaultTrailSettings = {0.938f, 1.0f};

// Per-config GPU record (must match shader)
struct GpuMultiLoadConfig {
    GpuPhysicsSetting settings[kParamCount];
    int32_t disableSymmetry;
    int32_t orientationMode;
    int32_t boundaryMode;
    int32_t initialConditions;
    int32_t cohorts;
    int32_t colorByCohort;
    float hueSensitivity;
    float orientationMix;
    float ruleSeed;
    float _pad;
};
static_assert(sizeof(GpuMultiLoadConfig) == 424, "GpuMultiLoadConfig must be 424 bytes");

// Window state uniform (must match shader)
struct GpuMultiLoadParams {
    uint32_t count;
    uint32_t assignmentMode;
    uint32_t perConfigInitial;
    uint32_t perConfigCohorts;
    uint32_t perConfigHazard;
    float simultaneous;
    float progress;
    float _pad;
};
static_assert(sizeof(GpuMultiLoadParams) == 32, "GpuMultiLoadParams must be 32 bytes");

// Length of [cfgStart, cfgEnd) covered by the window [winStart, winEnd) on a ring of size ringSize.
// Window bounds may be raw (negative or >= ringSize); they are wrapped here.
float circularOverlap(float cfgStart, float cfgEnd, float winStart, float winEnd, float ringSize);

// Ordered set of presets that entities are spread across, plus the sliding window over them.
// Configs are unit intervals [i, i+1) on a ring of circumference count().
class MultiLoadRegistry {
public:
    bool addConfig(const PhysicsConfig& config, const std::string& name);
    bool removeConfig(int index);
    void clear();

    int count() const { return (int)m_configs.size(); }
    bool isActive() const { return !m_configs.empty(); }
    const PhysicsConfig* config(int index) const;
    std::string name(int index) const;

    float simultaneous() const { return m_simultaneous; }
    void setSimultaneous(float v);
    float progress() const { return m_progress; }
    void setProgress(float v);
    // Advance by pace/1000 per tick, wrapping once past 1.
    void incrementProgress();

    // Window bounds as raw floats: [center - halfWidth, center + halfWidth)
    float windowStart() const;
    float windowEnd() const;

    // Config index for an entity's assignment coordinate u in [0,1); -1 when empty.
    int configIndexAt(float u) const;

    TrailSettings weightedTrailSettings() const;

    // Set by add/remove/clear; the GPU mirror is re-packed only while dirty.
    bool dirty() const { return m_dirty; }
    void markDirty() { m_dirty = true; }
    void clearDirty() { m_dirty = false; }

    void packGpu(std::vector<GpuMultiLoadConfig>& configs, std::vector<Rule>& rules) const;
    GpuMultiLoadParams gpuParams() const;

    float pace = 0.0f;
    AssignmentMode assignment = AssignmentMode::Cohorts;
    bool perConfigInitialConditions = false;
    bool perConfigCohorts = false;
    bool perConfigHazardRate = false;

private:
    float halfWidth() const { return m_simultaneous * 0.5f + 1e-3f; }

    std::vector<PhysicsConfig> m_configs;
    std::vector<std::string> m_names;
    float m_simultaneous = 1.0f;
    float m_progress = 0.0f;
    bool m_dirty = false;
};

// WGSL twin of MultiLoadRegistry::configIndexAt()
extern const char* const kMultiLoadWgsl;
