#include "physics_config.h"
#include <algorithm>

const char* boundaryModeName(BoundaryMode m) {
    switch (m) {
        case BoundaryMode::Bounce: return "Bounce";
        case BoundaryMode::Reset: return "Reset";
        case BoundaryMode::Wrap: return "Wrap";
    }
    return "?";
}

const char* initialConditionName(InitialCondition c) {
    switch (c) {
        case InitialCondition::Grid: return "Grid";
        case InitialCondition::Random: return "Random";
        case InitialCondition::Ring: return "Ring";
    }
    return "?";
}

const char* orientationModeName(OrientationMode m) {
    switch (m) {
        case OrientationMode::Off: return "Off";
        case OrientationMode::YAxis: return "Y-Axis";
        case OrientationMode::Radial: return "Radial";
    }
    return "?";
}

const char* embossModeName(EmbossMode m) {
    switch (m) {
        case EmbossMode::Off: return "Off";
        case EmbossMode::Canvas: return "Canvas";
        case EmbossMode::Brush: return "Brush";
    }
    return "?";
}

PhysicsConfig::PhysicsConfig() {
    for (int i = 0; i < kParamCount; i++) {
        settings[i] = defaultSetting((ParamId)i);
        sliderDefaults[i].min = settings[i].min;
        sliderDefaults[i].max = settings[i].max;
    }
}

PhysicsSetting PhysicsConfig::effectiveSetting(ParamId id) const {
    PhysicsSetting s = setting(id);
    if (!sweepsEnabled) s.xSweep = s.ySweep = s.cohortSweep = 0.0f;
    return s;
}

void PhysicsConfig::setSweep(SweepAxis axis, ParamId id, float mode) {
    if (mode != 0.0f) {
        for (auto& s : settings) s.setSweep(axis, 0.0f);
    }
    setting(id).setSweep(axis, mode);
}

std::optional<ParamId> PhysicsConfig::sweptParam(SweepAxis axis) const {
    for (int i = 0; i < kParamCount; i++)
        if (settings[i].sweep(axis) != 0.0f) return (ParamId)i;
    return std::nullopt;
}

void PhysicsConfig::clearSweeps() {
    for (auto& s : settings) s.xSweep = s.ySweep = s.cohortSweep = 0.0f;
}

bool PhysicsConfig::hasActiveXYSweep() const {
    if (!sweepsEnabled) return false;
    return sweptParam(SweepAxis::X).has_value() || sweptParam(SweepAxis::Y).has_value();
}

bool PhysicsConfig::hasActiveCohortSweep() const {
    return sweepsEnabled && sweptParam(SweepAxis::Cohort).has_value();
}

void PhysicsConfig::applyEffectiveValues(float worldX, float worldY, float cohort) {
    if (!sweepsEnabled) return;
    for (auto& s : settings) {
        if (s.hasSweep()) s.value = effectiveValue(s, worldX, worldY, cohort);
    }
}

static float sweepPosition(const PhysicsSetting& s, float mode) {
    float range = s.max - s.min;
    float t = range == 0.0f ? 0.5f : (s.value - s.min) / range;
    return mode < 0.0f ? 1.0f - t : t;
}

SweepReticle PhysicsConfig::sweepReticle() const {
    SweepReticle r;
    if (!sweepsEnabled) return r;
    if (auto x = sweptParam(SweepAxis::X)) {
        r.u = sweepPosition(setting(*x), setting(*x).xSweep);
        r.visible = true;
    }
    if (auto y = sweptParam(SweepAxis::Y)) {
        r.v = sweepPosition(setting(*y), setting(*y).ySweep);
        r.visible = true;
    }
    return r;
}

void PhysicsConfig::resetSliderRange(ParamId id) {
    setting(id).min = sliderDefaults[(int)id].min;
    setting(id).max = sliderDefaults[(int)id].max;
}

void PhysicsConfig::clampCategoricals() {
    cohorts = std::clamp(cohorts, kMinCohorts, kMaxCohorts);
    boundary = (BoundaryMode)std::clamp((int)boundary, 0, 2);
    initial = (InitialCondition)std::clamp((int)initial, 0, 2);
    orientation = (OrientationMode)std::clamp((int)orientation, 0, 2);
    emboss = (EmbossMode)std::clamp((int)emboss, 0, 2);
}
