#include "entity_picker.h"

std::optional<PickResult> findNearestEntity(const float* data, size_t entityCount, float u, float v) {
    if (!data || entityCount == 0) return std::nullopt;

    bool found = false;
    size_t best = 0;
    float bestDist = 0.0f;
    for (size_t i = 0; i < entityCount; i++) {
        const float* e = data + i * kEntityFloats;
        float du = (e[0] * 0.5f + 0.5f) - u;
        float dv = (e[1] * 0.5f + 0.5f) - v;
        float d = du * du + dv * dv;
        if (d != d) continue; // NaN position from a diverged entity
        if (!found || d < bestDist) {
            found = true;
            best = i;
            bestDist = d;
        }
    }
    if (!found) return std::nullopt;

    const float* e = data + best * kEntityFloats;
    return PickResult{(uint32_t)best, e[0], e[1], e[kEntityCohortIndex]};
}
