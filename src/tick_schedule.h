#pragma once
#include <array>

enum class TickStage { Deposit, EntityUpdate, TrailUpdate };

// One GPU pass of a tick. Trail slots index the two trail buffers (-1 = not bound).
// Consecutive passes are separate GPU passes, so each observes the previous one's writes.
struct TickPass {
    TickStage stage;
    int trailRead;
    int trailWrite;
    bool writesBrush;
    bool readsBrush;
    bool stampsDrawing;
};

struct TickPlan {
    std::array<TickPass, 3> passes;
    int frontAfter;  // trail slot that holds the persistent field once the tick is done
};

// Fixed order: deposit entity footprints, update entities from the front trail,
// then write front + brush into the back trail and swap.
TickPlan planTick(int frontSlot, bool drawActive);

const char* tickStageName(TickStage stage);
