#pragma once
#include "entity_picker.h"
#include "rule.h"
#include <cstdint>
#include <optional>

// The part of a running simulation that user actions reach. TrailSim is the GPU implementation.
class Simulation {
public:
    virtual ~Simulation() = default;
    virtual void reset() = 0;
    virtual void resize(float worldSize) = 0;
    virtual float worldSize() const = 0;
    virtual void applyRule(const Rule& rule) = 0;
    virtual const Rule& activeRule() const = 0;
    virtual std::optional<PickResult> pickNearest(float u, float v) = 0;
    virtual std::optional<Rule> readbackRule(uint32_t index) = 0;
};
