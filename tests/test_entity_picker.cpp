#include <catch2/catch.hpp>
#include "entity_picker.h"
#include <cmath>
#include <vector>

static void placeEntity(std::vector<float>& data, size_t i, float x, float y, float cohort) {
    if (data.size() < (i + 1) * kEntityFloats) data.resize((i + 1) * kEntityFloats, 0.0f);
    float* e = &data[i * kEntityFloats];
    e[0] = x;
    e[1] = y;
    e[kEntityCohortIndex] = cohort;
}

TEST_CASE("Nearest entity picking", "[picker]") {
    std::vector<float> data;
    placeEntity(data, 0, -0.5f, -0.5f, 0.0f);
    placeEntity(data, 1, 0.5f, 0.5f, 0.5f);
    placeEntity(data, 2, 0.9f, -0.9f, 1.0f);

    SECTION("Picks by canvas UV") {
        auto hit = findNearestEntity(data.data(), 3, 0.74f, 0.76f);
        REQUIRE(hit.has_value());
        REQUIRE(hit->index == 1);
        REQUIRE(hit->worldX == 0.5f);
        REQUIRE(hit->cohort == 0.5f);
    }

    SECTION("Lower-left corner") {
        auto hit = findNearestEntity(data.data(), 3, 0.0f, 0.0f);
        REQUIRE(hit.has_value());
        REQUIRE(hit->index == 0);
    }

    SECTION("Diverged entities are skipped") {
        placeEntity(data, 3, std::nanf(""), 0.0f, 0.0f);
        auto hit = findNearestEntity(data.data(), 4, 0.95f, 0.05f);
        REQUIRE(hit.has_value());
        REQUIRE(hit->index == 2);
    }

    SECTION("Nothing to pick") {
        REQUIRE_FALSE(findNearestEntity(data.data(), 0, 0.5f, 0.5f).has_value());
        REQUIRE_FALSE(findNearestEntity(nullptr, 3, 0.5f, 0.5f).has_value());
    }
}
