#include <catch2/catch.hpp>
#include "rule.h"
#include <cmath>

TEST_CASE("Rule basics", "[rule]") {
    Rule zero;
    REQUIRE(zero.isZero());
    REQUIRE(usesGeneratedCenters(zero));

    SECTION("Center layout") {
        Rule r;
        r.frequency(2)[1] = 3.0f;
        r.amplitude(2)[3] = -1.0f;
        REQUIRE(r.values[17] == 3.0f);
        REQUIRE(r.values[23] == -1.0f);
        REQUIRE_FALSE(r.isZero());
        REQUIRE(usesGeneratedCenters(r));
    }

    SECTION("Only center 0 frequency and center 5 amplitude mark a real rule") {
        Rule r;
        r.frequency(0)[0] = 0.5f;
        REQUIRE_FALSE(usesGeneratedCenters(r));
        Rule s;
        s.amplitude(5)[2] = 0.5f;
        REQUIRE_FALSE(usesGeneratedCenters(s));
    }

    SECTION("Hashes are deterministic and in range") {
        REQUIRE(pcgHash(12345u) == pcgHash(12345u));
        REQUIRE(pcgHash(1u) != pcgHash(2u));
        for (int i = 0; i < 100; i++) {
            float h = hash2((float)i * 0.37f, (float)i);
            REQUIRE(h >= 0.0f);
            REQUIRE(h <= 1.0f);
        }
    }
}

TEST_CASE("Random centers", "[rule]") {
    Rule a = generateRandomCenters(0.42f);
    Rule b = generateRandomCenters(0.42f);
    Rule c = generateRandomCenters(1.42f);
    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE_FALSE(usesGeneratedCenters(a));

    for (int i = 0; i < kRuleCenters; i++) {
        for (int k = 0; k < 4; k++) {
            REQUIRE(std::abs(a.frequency(i)[k]) <= 3.0f);
            REQUIRE(std::abs(a.amplitude(i)[k]) <= 1.0f);
        }
    }
}

TEST_CASE("Mutation", "[rule]") {
    Rule base = generateRandomCenters(7.0f);

    SECTION("Zero amount leaves the rule unchanged") {
        Rule r = base;
        mutateRule(r, 0.0f, 3.0f);
        REQUIRE(r == base);
    }

    SECTION("Same inputs mutate the same way") {
        Rule r1 = base, r2 = base;
        mutateRule(r1, 0.1f, 3.0f);
        mutateRule(r2, 0.1f, 3.0f);
        REQUIRE(r1 == r2);
        REQUIRE(r1 != base);
    }

    SECTION("Cohort seed changes the mutation") {
        Rule r1 = base, r2 = base;
        mutateRule(r1, 0.1f, 3.0f);
        mutateRule(r2, 0.1f, 4.0f);
        REQUIRE(r1 != r2);
    }
}

TEST_CASE("Per-entity rule reconstruction", "[rule]") {
    SECTION("Entities in the same cohort share a rule") {
        Rule zero;
        Rule r0 = computeEntityRule(zero, 0.42f, 0.05f, 4, 0, 100);
        Rule r24 = computeEntityRule(zero, 0.42f, 0.05f, 4, 24, 100);
        Rule r25 = computeEntityRule(zero, 0.42f, 0.05f, 4, 25, 100);
        REQUIRE(r0 == r24);
        REQUIRE(r0 != r25);
        REQUIRE_FALSE(usesGeneratedCenters(r0));
    }

    SECTION("A zero base generates centers from the cohort seed") {
        Rule expected = generateRandomCenters(0.42f);
        mutateRule(expected, 0.05f, 0.42f);
        REQUIRE(computeEntityRule(Rule{}, 0.42f, 0.05f, 4, 0, 100) == expected);
    }

    SECTION("A real base with no mutation is used as is") {
        Rule base = generateRandomCenters(9.0f);
        REQUIRE(computeEntityRule(base, 0.42f, 0.0f, 8, 500, 1000) == base);
    }

    SECTION("A single cohort gives every entity the same rule") {
        Rule base = generateRandomCenters(9.0f);
        REQUIRE(computeEntityRule(base, 0.1f, 0.2f, 1, 0, 1000) ==
                computeEntityRule(base, 0.1f, 0.2f, 1, 999, 1000));
    }
}
