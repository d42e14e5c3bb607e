#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Canonical parameter order. Matches the setting arrays in every shader.
enum class ParamId : int {
    AxialForce,
    LateralForce,
    SensorGain,
    MutationScale,
    Drag,
    StrafePower,
    SensorAngle,
    GlobalForceMult,
    SensorDistance,
    TrailPersistence,
    TrailDiffusion,
    HazardRate,
    Count
};
constexpr int kParamCount = (int)ParamId::Count;

struct ParamInfo {
    const char* key;    // persisted name, e.g. "AXIAL_FORCE"
    const char* label;  // slider label
    float defaultValue;
    float defaultMin;
    float defaultMax;
};

const ParamInfo& paramInfo(ParamId id);
std::optional<ParamId> paramFromKey(const std::string& key);

enum class SweepAxis { X, Y, Cohort };

// One tunable parameter. Sweeps are -1 (inverse), 0 (off) or 1 (normal).
// min > max is legal and simply inverts the sweep direction.
struct PhysicsSetting {
    float value = 0.0f;
    float min = 0.0f;
    float max = 1.0f;
    float xSweep = 0.0f;
    float ySweep = 0.0f;
    float cohortSweep = 0.0f;

    float sweep(SweepAxis axis) const;
    void setSweep(SweepAxis axis, float mode);
    bool hasSweep() const { return xSweep != 0.0f || ySweep != 0.0f || cohortSweep != 0.0f; }
};

PhysicsSetting defaultSetting(ParamId id);

// Value of `s` for an entity at worldPos ([-1,1]^2) belonging to cohort ([0,1]).
// Active axes are averaged; with no active axis the plain value is returned.
float effectiveValue(const PhysicsSetting& s, float worldX, float worldY, float cohort);

// WGSL twin of effectiveValue(), same operation order. Prepended to shaders that read settings.
extern const char* const kSweepWgsl;

// GPU mirror of PhysicsSetting (must match shader)
struct GpuPhysicsSetting {
    float value, min, max;
    float xSweep, ySweep, cohortSweep;
    float _pad[2];
};
static_assert(sizeof(GpuPhysicsSetting) == 32, "GpuPhysicsSetting must be 32 bytes");

GpuPhysicsSetting packSetting(const PhysicsSetting& s, bool includeXY = true, bool includeCohort = true);
