#include <catch2/catch.hpp>
#include "physics_config.h"

using Catch::Matchers::WithinAbs;

constexpr float TEST_EPSILON = 1e-5f;

static PhysicsSetting rangeSetting(float value, float lo, float hi) {
    PhysicsSetting s;
    s.value = value;
    s.min = lo;
    s.max = hi;
    return s;
}

TEST_CASE("Sweep evaluation", "[sweep]") {
    SECTION("No active axis returns the plain value") {
        PhysicsSetting s = rangeSetting(3.5f, 0.0f, 10.0f);
        for (float x : {-1.0f, 0.0f, 0.3f, 1.0f})
            for (float cohort : {0.0f, 0.5f, 1.0f})
                REQUIRE(effectiveValue(s, x, -x, cohort) == 3.5f);
    }

    SECTION("Normal X sweep hits the range endpoints") {
        PhysicsSetting s = rangeSetting(3.5f, 0.0f, 10.0f);
        s.xSweep = 1.0f;
        REQUIRE_THAT(effectiveValue(s, -1.0f, 0.0f, 0.0f), WithinAbs(0.0f, TEST_EPSILON));
        REQUIRE_THAT(effectiveValue(s, 1.0f, 0.0f, 0.0f), WithinAbs(10.0f, TEST_EPSILON));
        REQUIRE_THAT(effectiveValue(s, 0.0f, 0.0f, 0.0f), WithinAbs(5.0f, TEST_EPSILON));
    }

    SECTION("Inverse X sweep flips the endpoints") {
        PhysicsSetting s = rangeSetting(3.5f, 0.0f, 10.0f);
        s.xSweep = -1.0f;
        REQUIRE_THAT(effectiveValue(s, -1.0f, 0.0f, 0.0f), WithinAbs(10.0f, TEST_EPSILON));
        REQUIRE_THAT(effectiveValue(s, 1.0f, 0.0f, 0.0f), WithinAbs(0.0f, TEST_EPSILON));
        REQUIRE_THAT(effectiveValue(s, 0.0f, 0.0f, 0.0f), WithinAbs(5.0f, TEST_EPSILON));
    }

    SECTION("Y sweep reads the vertical position") {
        PhysicsSetting s = rangeSetting(0.0f, 2.0f, 4.0f);
        s.ySweep = 1.0f;
        REQUIRE_THAT(effectiveValue(s, -1.0f, 1.0f, 0.0f), WithinAbs(4.0f, TEST_EPSILON));
        REQUIRE_THAT(effectiveValue(s, 1.0f, -1.0f, 0.0f), WithinAbs(2.0f, TEST_EPSILON));
    }

    SECTION("Several active axes are averaged") {
        PhysicsSetting s = rangeSetting(0.0f, 0.0f, 10.0f);
        s.xSweep = 1.0f;
        s.cohortSweep = 1.0f;
        REQUIRE_THAT(effectiveValue(s, 1.0f, 0.0f, 0.0f), WithinAbs(5.0f, TEST_EPSILON));
        REQUIRE_THAT(effectiveValue(s, 1.0f, 0.0f, 1.0f), WithinAbs(10.0f, TEST_EPSILON));
    }

    SECTION("Zero-width range yields the bound everywhere") {
        PhysicsSetting s = rangeSetting(7.0f, 2.0f, 2.0f);
        s.xSweep = 1.0f;
        s.ySweep = -1.0f;
        REQUIRE_THAT(effectiveValue(s, -0.7f, 0.2f, 0.4f), WithinAbs(2.0f, TEST_EPSILON));
    }

    SECTION("Inverted range reverses a normal sweep") {
        PhysicsSetting s = rangeSetting(0.0f, 10.0f, 0.0f);
        s.xSweep = 1.0f;
        REQUIRE_THAT(effectiveValue(s, -1.0f, 0.0f, 0.0f), WithinAbs(10.0f, TEST_EPSILON));
        REQUIRE_THAT(effectiveValue(s, 1.0f, 0.0f, 0.0f), WithinAbs(0.0f, TEST_EPSILON));
    }

    SECTION("Sweep modes are normalized to -1, 0, 1") {
        PhysicsSetting s;
        s.setSweep(SweepAxis::Cohort, 0.3f);
        REQUIRE(s.cohortSweep == 1.0f);
        s.setSweep(SweepAxis::Cohort, -4.0f);
        REQUIRE(s.cohortSweep == -1.0f);
        s.setSweep(SweepAxis::Cohort, 0.0f);
        REQUIRE_FALSE(s.hasSweep());
    }
}

TEST_CASE("Parameter table", "[sweep]") {
    REQUIRE(kParamCount == 12);
    REQUIRE(paramFromKey("TRAIL_PERSISTENCE") == ParamId::TrailPersistence);
    REQUIRE(paramFromKey("HAZARD_RATE") == ParamId::HazardRate);
    REQUIRE_FALSE(paramFromKey("NOT_A_PARAM").has_value());

    PhysicsSetting s = defaultSetting(ParamId::SensorDistance);
    REQUIRE(s.value == paramInfo(ParamId::SensorDistance).defaultValue);
    REQUIRE_FALSE(s.hasSweep());
}

TEST_CASE("Sweep exclusivity", "[sweep][config]") {
    PhysicsConfig c;

    SECTION("Turning a sweep on clears that axis everywhere else") {
        c.setSweep(SweepAxis::X, ParamId::AxialForce, 1.0f);
        c.setSweep(SweepAxis::Y, ParamId::AxialForce, 1.0f);
        c.setSweep(SweepAxis::X, ParamId::Drag, -1.0f);

        REQUIRE(c.setting(ParamId::AxialForce).xSweep == 0.0f);
        REQUIRE(c.setting(ParamId::AxialForce).ySweep == 1.0f);
        REQUIRE(c.setting(ParamId::Drag).xSweep == -1.0f);
        REQUIRE(c.sweptParam(SweepAxis::X) == ParamId::Drag);
        REQUIRE(c.sweptParam(SweepAxis::Y) == ParamId::AxialForce);
        REQUIRE_FALSE(c.sweptParam(SweepAxis::Cohort).has_value());
    }

    SECTION("Turning a sweep off leaves other parameters alone") {
        c.setSweep(SweepAxis::X, ParamId::Drag, 1.0f);
        c.setSweep(SweepAxis::X, ParamId::SensorGain, 0.0f);
        REQUIRE(c.sweptParam(SweepAxis::X) == ParamId::Drag);
    }

    SECTION("clearSweeps resets every axis") {
        c.setSweep(SweepAxis::X, ParamId::Drag, 1.0f);
        c.setSweep(SweepAxis::Cohort, ParamId::SensorAngle, -1.0f);
        c.clearSweeps();
        for (const auto& s : c.settings) REQUIRE_FALSE(s.hasSweep());
    }
}

TEST_CASE("Sweeps enabled switch", "[sweep][config]") {
    PhysicsConfig c;
    c.setting(ParamId::Drag) = rangeSetting(0.5f, 0.0f, 1.0f);
    c.setSweep(SweepAxis::X, ParamId::Drag, 1.0f);
    c.setSweep(SweepAxis::Cohort, ParamId::SensorGain, 1.0f);

    SECTION("Disabled sweeps are stripped from the effective setting") {
        c.sweepsEnabled = false;
        REQUIRE_FALSE(c.effectiveSetting(ParamId::Drag).hasSweep());
        REQUIRE(c.setting(ParamId::Drag).xSweep == 1.0f);
        REQUIRE_FALSE(c.hasActiveXYSweep());
        REQUIRE_FALSE(c.hasActiveCohortSweep());
    }

    SECTION("Enabled sweeps pass through") {
        c.sweepsEnabled = true;
        REQUIRE(c.effectiveSetting(ParamId::Drag).xSweep == 1.0f);
        REQUIRE(c.hasActiveXYSweep());
        REQUIRE(c.hasActiveCohortSweep());
    }

    SECTION("Baking swept values at a position") {
        c.sweepsEnabled = true;
        c.applyEffectiveValues(1.0f, 0.0f, 0.0f);
        REQUIRE_THAT(c.value(ParamId::Drag), WithinAbs(1.0f, TEST_EPSILON));
        // Unswept parameters keep their values
        REQUIRE(c.value(ParamId::AxialForce) == paramInfo(ParamId::AxialForce).defaultValue);
    }

    SECTION("Baking is a no-op while sweeps are disabled") {
        c.sweepsEnabled = false;
        c.applyEffectiveValues(1.0f, 0.0f, 0.0f);
        REQUIRE(c.value(ParamId::Drag) == 0.5f);
    }
}

TEST_CASE("Sweep reticle", "[sweep][config]") {
    PhysicsConfig c;
    c.sweepsEnabled = true;
    c.setting(ParamId::Drag) = rangeSetting(0.25f, 0.0f, 1.0f);

    SECTION("Hidden without X/Y sweeps") {
        REQUIRE_FALSE(c.sweepReticle().visible);
    }

    SECTION("Normal sweep places the reticle at the value") {
        c.setSweep(SweepAxis::X, ParamId::Drag, 1.0f);
        SweepReticle r = c.sweepReticle();
        REQUIRE(r.visible);
        REQUIRE_THAT(r.u, WithinAbs(0.25f, TEST_EPSILON));
        REQUIRE_THAT(r.v, WithinAbs(0.5f, TEST_EPSILON));
    }

    SECTION("Inverse sweep mirrors it") {
        c.setSweep(SweepAxis::Y, ParamId::Drag, -1.0f);
        SweepReticle r = c.sweepReticle();
        REQUIRE(r.visible);
        REQUIRE_THAT(r.v, WithinAbs(0.75f, TEST_EPSILON));
    }

    SECTION("Disabled sweeps hide it") {
        c.setSweep(SweepAxis::X, ParamId::Drag, 1.0f);
        c.sweepsEnabled = false;
        REQUIRE_FALSE(c.sweepReticle().visible);
    }
}

TEST_CASE("Config housekeeping", "[config]") {
    PhysicsConfig c;

    SECTION("Slider ranges reset to their defaults") {
        c.setting(ParamId::SensorGain).min = -3.0f;
        c.setting(ParamId::SensorGain).max = 30.0f;
        c.resetSliderRange(ParamId::SensorGain);
        REQUIRE(c.setting(ParamId::SensorGain).min == paramInfo(ParamId::SensorGain).defaultMin);
        REQUIRE(c.setting(ParamId::SensorGain).max == paramInfo(ParamId::SensorGain).defaultMax);
    }

    SECTION("Categoricals are clamped") {
        c.cohorts = 500;
        c.boundary = (BoundaryMode)9;
        c.emboss = (EmbossMode)-1;
        c.clampCategoricals();
        REQUIRE(c.cohorts == kMaxCohorts);
        REQUIRE(c.boundary == BoundaryMode::Wrap);
        REQUIRE(c.emboss == EmbossMode::Off);
    }

    SECTION("Emboss intensity is zero while emboss is off") {
        c.embossIntensity = 0.8f;
        c.emboss = EmbossMode::Off;
        REQUIRE(c.effectiveEmbossIntensity() == 0.0f);
        c.emboss = EmbossMode::Brush;
        REQUIRE(c.effectiveEmbossIntensity() == 0.8f);
    }

    SECTION("GPU packing can drop sweep axes") {
        PhysicsSetting s = rangeSetting(1.0f, 0.0f, 2.0f);
        s.xSweep = 1.0f;
        s.cohortSweep = -1.0f;
        GpuPhysicsSetting g = packSetting(s, false, true);
        REQUIRE(g.value == 1.0f);
        REQUIRE(g.xSweep == 0.0f);
        REQUIRE(g.cohortSweep == -1.0f);
    }
}
