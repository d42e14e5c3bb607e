#include <catch2/catch.hpp>
#include "frame_accumulation.h"

TEST_CASE("Frame accumulation", "[accumulation]") {
    AccumulationState state;
    REQUIRE(state.phase() == AccumulationState::Phase::Empty);

    SECTION("Single sample finishes on every call") {
        for (int i = 0; i < 3; i++) {
            auto step = state.advance(1, 0, 64, 64);
            REQUIRE(step.has_value());
            REQUIRE(step->firstSample);
            REQUIRE(step->finalSample);
            REQUIRE(step->weight == 1.0f);
            REQUIRE(step->recreate == (i == 0));
            REQUIRE(state.phase() == AccumulationState::Phase::Ready);
        }
    }

    SECTION("Only the last of four samples finishes") {
        for (uint32_t i = 0; i < 3; i++) {
            auto step = state.advance(4, i, 64, 64);
            REQUIRE(step.has_value());
            REQUIRE_FALSE(step->finalSample);
            REQUIRE(step->firstSample == (i == 0));
            REQUIRE(step->weight == 0.25f);
            REQUIRE(state.phase() == AccumulationState::Phase::Accumulating);
            REQUIRE(state.samplesAccumulated() == i + 1);
        }
        auto last = state.advance(4, 3, 64, 64);
        REQUIRE(last.has_value());
        REQUIRE(last->finalSample);
        REQUIRE(state.phase() == AccumulationState::Phase::Ready);
        REQUIRE(state.samplesAccumulated() == 4);
    }

    SECTION("Buffers are recreated when the shape changes") {
        REQUIRE(state.advance(2, 0, 64, 64)->recreate);
        REQUIRE_FALSE(state.advance(2, 1, 64, 64)->recreate);
        REQUIRE(state.advance(2, 0, 128, 64)->recreate);
        REQUIRE(state.width() == 128);
        REQUIRE(state.advance(3, 0, 128, 64)->recreate);
        REQUIRE(state.totalSamples() == 3);
    }

    SECTION("Reset forces a recreate") {
        state.advance(1, 0, 32, 32);
        state.reset();
        REQUIRE(state.phase() == AccumulationState::Phase::Empty);
        REQUIRE(state.advance(1, 0, 32, 32)->recreate);
    }

    SECTION("Out-of-range samples are refused") {
        REQUIRE_FALSE(state.advance(0, 0, 32, 32).has_value());
        REQUIRE_FALSE(state.advance(4, 4, 32, 32).has_value());
        REQUIRE(state.phase() == AccumulationState::Phase::Empty);
    }
}

TEST_CASE("Sample schedule", "[accumulation]") {
    SECTION("Motion blur samples every cadence-th step") {
        SampleSchedule s = makeSampleSchedule(8, true, 2);
        REQUIRE(s.stepsPerFrame == 8);
        REQUIRE(s.totalSamples == 4);
        uint32_t samples = 0;
        for (uint32_t step = 0; step < s.stepsPerFrame; step++) {
            if (!s.rendersAfterStep(step)) continue;
            REQUIRE(step / s.cadence == samples);
            samples++;
        }
        REQUIRE(samples == s.totalSamples);
    }

    SECTION("Uneven step counts still fill the window") {
        SampleSchedule s = makeSampleSchedule(5, true, 2);
        REQUIRE(s.totalSamples == 3);
        uint32_t lastIndex = 0;
        for (uint32_t step = 0; step < s.stepsPerFrame; step++)
            if (s.rendersAfterStep(step)) lastIndex = step / s.cadence;
        REQUIRE(lastIndex == s.totalSamples - 1);
    }

    SECTION("Without motion blur only the last step renders") {
        SampleSchedule s = makeSampleSchedule(6, false, 3);
        REQUIRE(s.totalSamples == 1);
        for (uint32_t step = 0; step < 5; step++) REQUIRE_FALSE(s.rendersAfterStep(step));
        REQUIRE(s.rendersAfterStep(5));
    }

    SECTION("Degenerate inputs are clamped") {
        SampleSchedule s = makeSampleSchedule(0, true, 0);
        REQUIRE(s.stepsPerFrame == 1);
        REQUIRE(s.cadence == 1);
        REQUIRE(s.totalSamples == 1);
        REQUIRE(s.rendersAfterStep(0));
    }
}
