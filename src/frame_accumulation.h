#pragma once
#include <cstdint>
#include <optional>

// What the assembler must do for one incoming sample.
struct AccumulationStep {
    bool recreate;     // (re)allocate buffers before this sample
    bool firstSample;  // ignore previous buffer contents
    bool finalSample;  // apply styling + gamma and emit the frame
    float weight;      // 1 / totalSamples
};

// Host-side bookkeeping for temporal accumulation. The GPU work lives in FrameAssembler.
class AccumulationState {
public:
    enum class Phase { Empty, Accumulating, Ready };

    // nullopt when totalSamples is 0 or sampleIndex is out of range.
    std::optional<AccumulationStep> advance(uint32_t totalSamples, uint32_t sampleIndex,
                                            uint32_t width, uint32_t height);
    // Drops the buffers; the next sample recreates them.
    void reset();

    Phase phase() const { return m_phase; }
    uint32_t totalSamples() const { return m_totalSamples; }
    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }
    uint32_t samplesAccumulated() const { return m_samples; }

private:
    bool m_allocated = false;
    uint32_t m_totalSamples = 0;
    uint32_t m_width = 0;
    uint32_t m_height = 0;
    uint32_t m_samples = 0;
    Phase m_phase = Phase::Empty;
};

// How many physics steps run per displayed frame and which of them are sampled.
struct SampleSchedule {
    uint32_t stepsPerFrame = 1;
    uint32_t cadence = 1;       // render every cadence-th step
    uint32_t totalSamples = 1;  // samples per finished frame
    bool motionBlur = true;

    // With motion blur off a single sample is taken after the last step.
    bool rendersAfterStep(uint32_t step) const;
};

SampleSchedule makeSampleSchedule(int speedmult, bool motionBlur, int blurQuality);
