#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

// GPU entity record (must match shader)
struct GpuEntity {
    float position[2];  // world space, [-1, 1]
    float velocity[2];
    float size;
    float cohort;       // normalized to [0, 1]
    float _pad[2];
    float color[4];
};
static_assert(sizeof(GpuEntity) == 48, "GpuEntity must be 48 bytes");

constexpr size_t kEntityFloats = sizeof(GpuEntity) / sizeof(float);
constexpr size_t kEntityCohortIndex = 5;

struct PickResult {
    uint32_t index;
    float worldX;
    float worldY;
    float cohort;
};

// Entity closest to (u, v) in canvas UV. `data` is a raw readback of the entity buffer.
std::optional<PickResult> findNearestEntity(const float* data, size_t entityCount, float u, float v);
