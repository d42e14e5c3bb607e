#include "tick_schedule.h"

TickPlan planTick(int frontSlot, bool drawActive) {
    int front = frontSlot == 0 ? 0 : 1;
    int back = 1 - front;

    TickPlan plan = {};
    plan.passes[0] = {TickStage::Deposit, -1, -1, true, false, false};
    plan.passes[1] = {TickStage::EntityUpdate, front, -1, false, false, false};
    plan.passes[2] = {TickStage::TrailUpdate, front, back, false, true, drawActive};
    plan.frontAfter = back;
    return plan;
}

const char* tickStageName(TickStage stage) {
    switch (stage) {
        case TickStage::Deposit: return "deposit";
        case TickStage::EntityUpdate: return "entity_update";
        case TickStage::TrailUpdate: return "trail_update";
    }
    return "?";
}
