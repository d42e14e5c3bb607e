#pragma once
#include <array>
#include <cstdint>

constexpr int kRuleCenters = 10;
constexpr int kRuleFloats = kRuleCenters * 8;
constexpr uint64_t kRuleBytes = kRuleFloats * sizeof(float);

// Force rule: 10 Fourier centers, each a vec4 frequency followed by a vec4 amplitude.
// The all-zero rule means "no directed behavior"; the shader then generates per-cohort centers.
struct Rule {
    std::array<float, kRuleFloats> values{};

    float* frequency(int center) { return &values[center * 8]; }
    const float* frequency(int center) const { return &values[center * 8]; }
    float* amplitude(int center) { return &values[center * 8 + 4]; }
    const float* amplitude(int center) const { return &values[center * 8 + 4]; }

    bool isZero() const;
    bool operator==(const Rule& o) const { return values == o.values; }
    bool operator!=(const Rule& o) const { return values != o.values; }
};
static_assert(sizeof(Rule) == kRuleBytes, "Rule must be 320 bytes");

// Same test the shader uses: center 0 frequency and center 5 amplitude both zero.
bool usesGeneratedCenters(const Rule& rule);

uint32_t pcgHash(uint32_t seed);
float hash2(float x, float y); // [0, 1]

Rule generateRandomCenters(float seed);

// Host reference for kRuleWgsl's mutation. The app reads entity rules back from the
// GPU pick pass; these two exist so the tests can check the shader's arithmetic.
void mutateRule(Rule& rule, float amount, float cohortSeed);
// Rule entity `index` runs with, bit-compatible with kRuleWgsl.
Rule computeEntityRule(const Rule& base, float ruleSeed, float mutationScale,
                       int cohorts, uint32_t index, uint32_t entityCount);

// WGSL twin of the functions above.
extern const char* const kRuleWgsl;
