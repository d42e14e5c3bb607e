#pragma once
#include "physics_setting.h"
#include "rule.h"
#include <array>
#include <optional>

enum class BoundaryMode : int { Bounce = 0, Reset = 1, Wrap = 2 };
enum class InitialCondition : int { Grid = 0, Random = 1, Ring = 2 };
enum class OrientationMode : int { Off = 0, YAxis = 1, Radial = 2 };
enum class EmbossMode : int { Off = 0, Canvas = 1, Brush = 2 };

constexpr int kMinCohorts = 1;
constexpr int kMaxCohorts = 144;

const char* boundaryModeName(BoundaryMode m);
const char* initialConditionName(InitialCondition c);
const char* orientationModeName(OrientationMode m);
const char* embossModeName(EmbossMode m);

// Slider bounds the UI resets to. The current bounds live in PhysicsSetting::min/max.
struct SliderDefaults {
    float min = 0.0f;
    float max = 1.0f;
};

struct SweepReticle {
    float u = 0.5f;
    float v = 0.5f;
    bool visible = false;
};

// Complete, self-contained simulation state: everything a preset file stores.
struct PhysicsConfig {
    std::array<PhysicsSetting, kParamCount> settings;
    std::array<SliderDefaults, kParamCount> sliderDefaults;
    bool sweepsEnabled = false;

    bool disableSymmetry = false;
    OrientationMode orientation = OrientationMode::Off;
    float orientationMix = 1.0f;
    BoundaryMode boundary = BoundaryMode::Bounce;
    InitialCondition initial = InitialCondition::Grid;
    int cohorts = 64;
    float ruleSeed = 0.42f;

    float inkWeight = 1.0f;
    float hueSensitivity = 0.5f;
    bool colorByCohort = true;
    bool watercolor = false;
    EmbossMode emboss = EmbossMode::Off;
    float embossIntensity = 0.5f;
    float embossSmoothness = 0.1f;

    Rule rule;

    PhysicsConfig();

    PhysicsSetting& setting(ParamId id) { return settings[(int)id]; }
    const PhysicsSetting& setting(ParamId id) const { return settings[(int)id]; }
    float value(ParamId id) const { return settings[(int)id].value; }

    // Setting as the shader should see it: sweeps stripped while sweeps are disabled.
    PhysicsSetting effectiveSetting(ParamId id) const;

    // Sweeps are exclusive per axis: a non-zero mode clears that axis on every other parameter.
    void setSweep(SweepAxis axis, ParamId id, float mode);
    std::optional<ParamId> sweptParam(SweepAxis axis) const;
    void clearSweeps();
    bool hasActiveXYSweep() const;
    bool hasActiveCohortSweep() const;

    // Bake the swept values at (worldX, worldY, cohort) into the plain slider values.
    void applyEffectiveValues(float worldX, float worldY, float cohort);

    // Where the current slider values sit on the active X/Y sweeps, in canvas UV.
    SweepReticle sweepReticle() const;

    float effectiveEmbossIntensity() const { return emboss == EmbossMode::Off ? 0.0f : embossIntensity; }

    void resetSliderRange(ParamId id);
    void clampCategoricals();
};
