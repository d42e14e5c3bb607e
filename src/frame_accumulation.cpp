#include "frame_accumulation.h"
#include <algorithm>
#include <cstdio>

std::optional<AccumulationStep> AccumulationState::advance(uint32_t totalSamples, uint32_t sampleIndex,
                                                           uint32_t width, uint32_t height) {
    if (totalSamples == 0 || sampleIndex >= totalSamples) {
        fprintf(stderr, "Frame assembler: sample %u out of range for %u samples\n", sampleIndex, totalSamples);
        return std::nullopt;
    }

    AccumulationStep step = {};
    step.recreate = !m_allocated || totalSamples != m_totalSamples || width != m_width || height != m_height;
    if (step.recreate) {
        m_allocated = true;
        m_totalSamples = totalSamples;
        m_width = width;
        m_height = height;
        m_samples = 0;
    }

    step.firstSample = sampleIndex == 0;
    step.finalSample = sampleIndex == totalSamples - 1;
    step.weight = 1.0f / (float)totalSamples;

    m_samples = step.firstSample ? 1 : m_samples + 1;
    m_phase = step.finalSample ? Phase::Ready : Phase::Accumulating;
    return step;
}

void AccumulationState::reset() {
    m_allocated = false;
    m_samples = 0;
    m_phase = Phase::Empty;
}

bool SampleSchedule::rendersAfterStep(uint32_t step) const {
    if (!motionBlur) return step + 1 == stepsPerFrame;
    return step % cadence == 0;
}

SampleSchedule makeSampleSchedule(int speedmult, bool motionBlur, int blurQuality) {
    SampleSchedule s;
    s.stepsPerFrame = (uint32_t)std::max(1, speedmult);
    s.cadence = (uint32_t)std::max(1, blurQuality);
    s.motionBlur = motionBlur;
    s.totalSamples = motionBlur ? (s.stepsPerFrame + s.cadence - 1) / s.cadence : 1;
    return s;
}
