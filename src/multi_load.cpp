#include "multi_load.h"
#include <algorithm>
#include <cmath>
#include <cstdio>

static float overlap(float a0, float a1, float b0, float b1) {
    return std::max(0.0f, std::min(a1, b1) - std::max(a0, b0));
}

static float wrap(float x, float n) {
    float m = std::fmod(x, n);
    return m < 0.0f ? m + n : m;
}

float circularOverlap(float cfgStart, float cfgEnd, float winStart, float winEnd, float ringSize) {
    if (winEnd - winStart >= ringSize) return cfgEnd - cfgStart;

    float s = wrap(winStart, ringSize);
    float e = wrap(winEnd, ringSize);
    if (s <= e) return overlap(cfgStart, cfgEnd, s, e);

    // Window wraps: [s, ringSize) and [0, e)
    float total = 0.0f;
    if (cfgEnd > s) total += overlap(cfgStart, cfgEnd, s, ringSize);
    if (cfgStart < e) total += overlap(cfgStart, cfgEnd, 0.0f, e);
    return total;
}

bool MultiLoadRegistry::addConfig(const PhysicsConfig& config, const std::string& name) {
    if (count() >= kMaxMultiLoadConfigs) {
        fprintf(stderr, "Cannot add config: maximum of %d configs reached\n", kMaxMultiLoadConfigs);
        return false;
    }
    m_configs.push_back(config);
    m_names.push_back(name);
    if (m_simultaneous > (float)count()) m_simultaneous = (float)count();
    m_dirty = true;
    return true;
}

bool MultiLoadRegistry::removeConfig(int index) {
    if (index < 0 || index >= count()) return false;
    m_configs.erase(m_configs.begin() + index);
    m_names.erase(m_names.begin() + index);
    if (m_configs.empty()) m_simultaneous = 1.0f;
    else m_simultaneous = std::min(m_simultaneous, (float)count());
    m_dirty = true;
    return true;
}

void MultiLoadRegistry::clear() {
    m_configs.clear();
    m_names.clear();
    m_simultaneous = 1.0f;
    m_progress = 0.0f;
    m_dirty = true;
}

const PhysicsConfig* MultiLoadRegistry::config(int index) const {
    if (index < 0 || index >= count()) return nullptr;
    return &m_configs[index];
}

std::string MultiLoadRegistry::name(int index) const {
    if (index < 0 || index >= count()) return "";
    return m_names[index];
}

void MultiLoadRegistry::setSimultaneous(float v) {
    float upper = m_configs.empty() ? 1.0f : (float)count();
    m_simultaneous = std::clamp(v, 0.0f, upper);
}

void MultiLoadRegistry::setProgress(float v) {
    // Progress lives on the unit ring [0, 1)
    m_progress = v - std::floor(v);
    if (m_progress >= 1.0f) m_progress = 0.0f;
}

void MultiLoadRegistry::incrementProgress() {
    if (pace <= 0.0f) return;
    m_progress += pace / 1000.0f;
    if (m_progress >= 1.0f) m_progress -= 1.0f;
}

float MultiLoadRegistry::windowStart() const {
    float center = m_progress * (float)count() + halfWidth();
    return center - halfWidth();
}

float MultiLoadRegistry::windowEnd() const {
    float center = m_progress * (float)count() + halfWidth();
    return center + halfWidth();
}

int MultiLoadRegistry::configIndexAt(float u) const {
    if (m_configs.empty()) return -1;
    float n = (float)count();
    float pos = windowStart() + u * (2.0f * halfWidth());
    int idx = (int)std::floor(wrap(pos, n));
    return std::min(idx, count() - 1);
}

TrailSettings MultiLoadRegistry::weightedTrailSettings() const {
    if (m_configs.empty()) return kDefaultTrailSettings;

    float n = (float)count();
    float start = windowStart();
    float end = windowEnd();

    float totalWeight = 0.0f;
    float persistence = 0.0f;
    float diffusion = 0.0f;
    for (int i = 0; i < count(); i++) {
        float w = circularOverlap((float)i, (float)(i + 1), start, end, n);
        if (w <= 0.0f) continue;
        totalWeight += w;
        persistence += w * m_configs[i].value(ParamId::TrailPersistence);
        diffusion += w * m_configs[i].value(ParamId::TrailDiffusion);
    }

    if (totalWeight <= 0.0f) {
        return {m_configs[0].value(ParamId::TrailPersistence), m_configs[0].value(ParamId::TrailDiffusion)};
    }
    return {persistence / totalWeight, diffusion / totalWeight};
}

void MultiLoadRegistry::packGpu(std::vector<GpuMultiLoadConfig>& configs, std::vector<Rule>& rules) const {
    configs.assign(kMaxMultiLoadConfigs, GpuMultiLoadConfig{});
    rules.assign(kMaxMultiLoadConfigs, Rule{});

    for (int i = 0; i < count(); i++) {
        const PhysicsConfig& c = m_configs[i];
        GpuMultiLoadConfig& g = configs[i];
        // X/Y sweeps only travel with configs saved with sweeps on; cohort sweeps always do.
        for (int p = 0; p < kParamCount; p++)
            g.settings[p] = packSetting(c.settings[p], c.sweepsEnabled, true);
        g.disableSymmetry = c.disableSymmetry ? 1 : 0;
        g.orientationMode = (int32_t)c.orientation;
        g.boundaryMode = (int32_t)c.boundary;
        g.initialConditions = (int32_t)c.initial;
        g.cohorts = c.cohorts;
        g.colorByCohort = c.colorByCohort ? 1 : 0;
        g.hueSensitivity = c.hueSensitivity;
        g.orientationMix = c.orientationMix;
        g.ruleSeed = c.ruleSeed;
        rules[i] = c.rule;
    }
}

GpuMultiLoadParams MultiLoadRegistry::gpuParams() const {
    GpuMultiLoadParams p = {};
    p.count = (uint32_t)count();
    p.assignmentMode = (uint32_t)assignment;
    p.perConfigInitial = perConfigInitialConditions ? 1u : 0u;
    p.perConfigCohorts = perConfigCohorts ? 1u : 0u;
    p.perConfigHazard = perConfigHazardRate ? 1u : 0u;
    p.simultaneous = m_simultaneous;
    p.progress = m_progress;
    return p;
}

const char* const kMultiLoadWgsl = R"(
struct MultiLoadParams {
    count: u32,
    assignment_mode: u32,
    per_config_initial: u32,
    per_config_cohorts: u32,
    per_config_hazard: u32,
    simultaneous: f32,
    progress: f32,
    _pad: f32,
}

fn multi_load_index(ml: MultiLoadParams, u: f32) -> u32 {
    let n = f32(ml.count);
    let half_width = ml.simultaneous * 0.5 + 1e-3;
    let center = ml.progress * n + half_width;
    let pos = (center - half_width) + u * (2.0 * half_width);
    let wrapped = pos - n * floor(pos / n);
    return min(u32(floor(wrapped)), ml.count - 1u);
}
)";
