#include "rule.h"
#include <cmath>
#include <cstring>

bool Rule::isZero() const {
    for (float v : values)
        if (v != 0.0f) return false;
    return true;
}

bool usesGeneratedCenters(const Rule& rule) {
    const float* f0 = rule.frequency(0);
    const float* a5 = rule.amplitude(5);
    for (int i = 0; i < 4; i++)
        if (f0[i] != 0.0f || a5[i] != 0.0f) return false;
    return true;
}

uint32_t pcgHash(uint32_t seed) {
    uint32_t state = seed * 747796405u + 2891336453u;
    uint32_t word = ((state >> ((state >> 28u) + 4u)) ^ state) * 277803737u;
    return (word >> 22u) ^ word;
}

static uint32_t floatBits(float f) {
    uint32_t u;
    memcpy(&u, &f, sizeof(u));
    return u;
}

float hash2(float x, float y) {
    uint32_t h = pcgHash(floatBits(x) ^ pcgHash(floatBits(y)));
    return (float)h / 4294967295.0f;
}

static void hash4(float x, float y, float out[4]) {
    out[0] = hash2(x, y);
    out[1] = hash2(-x + 5.0f, -y + 5.0f);
    out[2] = hash2(y - 100.0f, x - 100.0f);
    out[3] = hash2(-y + 25.0f, -x + 25.0f);
}

Rule generateRandomCenters(float seed) {
    Rule rule;
    for (int i = 0; i < kRuleCenters; i++) {
        float* f = rule.frequency(i);
        float* a = rule.amplitude(i);
        float h0 = hash2(seed, (float)(i * 8));
        float freqScale = 1.0f + 2.0f * (h0 * h0);
        f[0] = (h0 * 2.0f - 1.0f) * freqScale;
        for (int c = 1; c < 4; c++)
            f[c] = (hash2(seed, (float)(i * 8 + c)) * 2.0f - 1.0f) * freqScale;
        for (int c = 0; c < 4; c++)
            a[c] = hash2(seed, (float)(i * 8 + 4 + c)) * 2.0f - 1.0f;
    }
    return rule;
}

void mutateRule(Rule& rule, float amount, float cohortSeed) {
    // Seeded from a few fixed components so the same base rule always mutates the same way.
    float sx = (rule.frequency(4)[0] + rule.amplitude(7)[1]) + rule.frequency(1)[2];
    float sy = (rule.frequency(4)[1] + rule.amplitude(7)[0]) + rule.frequency(1)[3];
    float seed = hash2(sx, sy) + cohortSeed;

    for (int i = 0; i < kRuleCenters; i++) {
        float ampMut[4];
        hash4(-0.5f + (-(float)i + seed), -0.5f + (float)i, ampMut);
        float* a = rule.amplitude(i);
        for (int c = 0; c < 4; c++)
            a[c] = a[c] + amount * (-1.0f + 2.0f * ampMut[c]);

        float freqMut = 1.0f + (amount * 0.5f) * (hash2(seed, (float)i) - 0.5f);
        float* f = rule.frequency(i);
        for (int c = 0; c < 4; c++)
            f[c] = f[c] * freqMut;
    }
}

Rule computeEntityRule(const Rule& base, float ruleSeed, float mutationScale,
                       int cohorts, uint32_t index, uint32_t entityCount) {
    Rule rule = base;
    float cohort = ((float)cohorts * (float)index) / (float)entityCount;
    float cohortSeed = ruleSeed + std::floor(cohort);
    if (usesGeneratedCenters(rule))
        rule = generateRandomCenters(cohortSeed);
    mutateRule(rule, mutationScale, cohortSeed);
    return rule;
}

const char* const kRuleWgsl = R"(
struct FourierCenter {
    frequency: vec4<f32>,
    amplitude: vec4<f32>,
}

struct Rule {
    centers: array<FourierCenter, 10>,
}

fn pcg_hash(seed: u32) -> u32 {
    let state = seed * 747796405u + 2891336453u;
    let word = ((state >> ((state >> 28u) + 4u)) ^ state) * 277803737u;
    return (word >> 22u) ^ word;
}

fn hash2(p: vec2<f32>) -> f32 {
    let h = pcg_hash(bitcast<u32>(p.x) ^ pcg_hash(bitcast<u32>(p.y)));
    return f32(h) / 4294967295.0;
}

fn hash4(p: vec2<f32>) -> vec4<f32> {
    return vec4<f32>(
        hash2(p),
        hash2(vec2<f32>(-p.x + 5.0, -p.y + 5.0)),
        hash2(vec2<f32>(p.y - 100.0, p.x - 100.0)),
        hash2(vec2<f32>(-p.y + 25.0, -p.x + 25.0)));
}

fn uses_generated_centers(rule: Rule) -> bool {
    return all(rule.centers[0].frequency == vec4<f32>(0.0)) && all(rule.centers[5].amplitude == vec4<f32>(0.0));
}

fn generate_random_centers(seed: f32) -> Rule {
    var rule: Rule;
    for (var i = 0; i < 10; i++) {
        let b = f32(i * 8);
        let h0 = hash2(vec2<f32>(seed, b));
        let freq_scale = 1.0 + 2.0 * (h0 * h0);
        rule.centers[i].frequency = vec4<f32>(
            (h0 * 2.0 - 1.0) * freq_scale,
            (hash2(vec2<f32>(seed, b + 1.0)) * 2.0 - 1.0) * freq_scale,
            (hash2(vec2<f32>(seed, b + 2.0)) * 2.0 - 1.0) * freq_scale,
            (hash2(vec2<f32>(seed, b + 3.0)) * 2.0 - 1.0) * freq_scale);
        rule.centers[i].amplitude = vec4<f32>(
            hash2(vec2<f32>(seed, b + 4.0)) * 2.0 - 1.0,
            hash2(vec2<f32>(seed, b + 5.0)) * 2.0 - 1.0,
            hash2(vec2<f32>(seed, b + 6.0)) * 2.0 - 1.0,
            hash2(vec2<f32>(seed, b + 7.0)) * 2.0 - 1.0);
    }
    return rule;
}

fn mutate_rule(base: Rule, amount: f32, cohort_seed: f32) -> Rule {
    var rule = base;
    let s = rule.centers[4].frequency.xy + rule.centers[7].amplitude.yx + rule.centers[1].frequency.zw;
    let seed = hash2(s) + cohort_seed;
    for (var i = 0; i < 10; i++) {
        let fi = f32(i);
        let amp_mut = hash4(vec2<f32>(-0.5 + (-fi + seed), -0.5 + fi));
        rule.centers[i].amplitude = rule.centers[i].amplitude + amount * (-1.0 + 2.0 * amp_mut);
        let freq_mut = 1.0 + (amount * 0.5) * (hash2(vec2<f32>(seed, fi)) - 0.5);
        rule.centers[i].frequency = rule.centers[i].frequency * freq_mut;
    }
    return rule;
}

fn compute_entity_rule(base: Rule, rule_seed: f32, mutation_scale: f32, cohorts: i32, index: u32, entity_count: u32) -> Rule {
    let cohort = (f32(cohorts) * f32(index)) / f32(entity_count);
    let cohort_seed = rule_seed + floor(cohort);
    var rule = base;
    if (uses_generated_centers(rule)) {
        rule = generate_random_centers(cohort_seed);
    }
    return mutate_rule(rule, mutation_scale, cohort_seed);
}
)";
