#include "physics_setting.h"

static const ParamInfo PARAMS[kParamCount] = {
    {"AXIAL_FORCE",       "Axial Force",       0.371f, -1.0f, 1.0f},
    {"LATERAL_FORCE",     "Lateral Force",    -0.707f, -1.0f, 1.0f},
    {"SENSOR_GAIN",       "Sensor Gain",       0.116f,  0.0f, 5.0f},
    {"MUTATION_SCALE",    "Mutation Scale",    0.0f,   -0.5f, 0.5f},
    {"DRAG",              "Drag",              0.504f, -1.0f, 1.0f},
    {"STRAFE_POWER",      "Strafe Power",      0.224f,  0.0f, 0.5f},
    {"SENSOR_ANGLE",      "Sensor Angle",      0.45f,  -1.0f, 1.0f},
    {"GLOBAL_FORCE_MULT", "Global Force Mult", 1.0f,    0.0f, 2.0f},
    {"SENSOR_DISTANCE",   "Sensor Distance",   1.0f,    0.0f, 4.0f},
    {"TRAIL_PERSISTENCE", "Trail Persistence", 0.938f,  0.0f, 1.0f},
    {"TRAIL_DIFFUSION",   "Trail Diffusion",   1.0f,    0.0f, 1.0f},
    {"HAZARD_RATE",       "Hazard Rate",       0.0f,    0.0f, 0.05f},
};

const ParamInfo& paramInfo(ParamId id) {
    return PARAMS[(int)id];
}

std::optional<ParamId> paramFromKey(const std::string& key) {
    for (int i = 0; i < kParamCount; i++)
        if (key == PARAMS[i].key) return (ParamId)i;
    return std::nullopt;
}

float PhysicsSetting::sweep(SweepAxis axis) const {
    switch (axis) {
        case SweepAxis::X: return xSweep;
        case SweepAxis::Y: return ySweep;
        case SweepAxis::Cohort: return cohortSweep;
    }
    return 0.0f;
}

void PhysicsSetting::setSweep(SweepAxis axis, float mode) {
    float v = mode > 0.0f ? 1.0f : (mode < 0.0f ? -1.0f : 0.0f);
    switch (axis) {
        case SweepAxis::X: xSweep = v; break;
        case SweepAxis::Y: ySweep = v; break;
        case SweepAxis::Cohort: cohortSweep = v; break;
    }
}

PhysicsSetting defaultSetting(ParamId id) {
    const ParamInfo& info = paramInfo(id);
    PhysicsSetting s;
    s.value = info.defaultValue;
    s.min = info.defaultMin;
    s.max = info.defaultMax;
    return s;
}

static float sweepLerp(const PhysicsSetting& s, float mode, float t) {
    if (mode > 0.0f) return s.min + (s.max - s.min) * t;
    return s.max + (s.min - s.max) * t;
}

float effectiveValue(const PhysicsSetting& s, float worldX, float worldY, float cohort) {
    if (s.xSweep == 0.0f && s.ySweep == 0.0f && s.cohortSweep == 0.0f) return s.value;

    float sum = 0.0f;
    float count = 0.0f;
    if (s.xSweep != 0.0f) {
        sum += sweepLerp(s, s.xSweep, (worldX + 1.0f) * 0.5f);
        count += 1.0f;
    }
    if (s.ySweep != 0.0f) {
        sum += sweepLerp(s, s.ySweep, (worldY + 1.0f) * 0.5f);
        count += 1.0f;
    }
    if (s.cohortSweep != 0.0f) {
        sum += sweepLerp(s, s.cohortSweep, cohort);
        count += 1.0f;
    }
    return sum / count;
}

const char* const kSweepWgsl = R"(
struct PhysicsSetting {
    value: f32,
    min_value: f32,
    max_value: f32,
    x_sweep: f32,
    y_sweep: f32,
    cohort_sweep: f32,
    _pad0: f32,
    _pad1: f32,
}

fn sweep_lerp(s: PhysicsSetting, mode: f32, t: f32) -> f32 {
    if (mode > 0.0) { return s.min_value + (s.max_value - s.min_value) * t; }
    return s.max_value + (s.min_value - s.max_value) * t;
}

fn effective_value(s: PhysicsSetting, world_pos: vec2<f32>, cohort: f32) -> f32 {
    if (s.x_sweep == 0.0 && s.y_sweep == 0.0 && s.cohort_sweep == 0.0) { return s.value; }
    var sum = 0.0;
    var count = 0.0;
    if (s.x_sweep != 0.0) {
        sum += sweep_lerp(s, s.x_sweep, (world_pos.x + 1.0) * 0.5);
        count += 1.0;
    }
    if (s.y_sweep != 0.0) {
        sum += sweep_lerp(s, s.y_sweep, (world_pos.y + 1.0) * 0.5);
        count += 1.0;
    }
    if (s.cohort_sweep != 0.0) {
        sum += sweep_lerp(s, s.cohort_sweep, cohort);
        count += 1.0;
    }
    return sum / count;
}
)";

GpuPhysicsSetting packSetting(const PhysicsSetting& s, bool includeXY, bool includeCohort) {
    GpuPhysicsSetting g = {};
    g.value = s.value;
    g.min = s.min;
    g.max = s.max;
    g.xSweep = includeXY ? s.xSweep : 0.0f;
    g.ySweep = includeXY ? s.ySweep : 0.0f;
    g.cohortSweep = includeCohort ? s.cohortSweep : 0.0f;
    return g;
}
