#include <catch2/catch.hpp>
#include "rule_history.h"
#include "rule_preview.h"

static Rule tagged(float tag) {
    Rule r;
    r.values[0] = tag;
    return r;
}

TEST_CASE("Rule history", "[history]") {
    RuleHistory h;

    SECTION("Popping the only rule means the zero rule") {
        h.push(tagged(1.0f));
        REQUIRE_FALSE(h.pop().has_value());
        REQUIRE_FALSE(h.current().has_value());
        REQUIRE(h.empty());
        REQUIRE(h.currentOrZero().isZero());
    }

    SECTION("Popping an empty history is harmless") {
        REQUIRE_FALSE(h.pop().has_value());
        REQUIRE(h.empty());
    }

    SECTION("Pop returns the new tail") {
        h.push(tagged(1.0f));
        h.push(tagged(2.0f));
        h.push(tagged(3.0f));
        auto r = h.pop();
        REQUIRE(r.has_value());
        REQUIRE(r->values[0] == 2.0f);
        REQUIRE(h.current()->values[0] == 2.0f);
    }

    SECTION("Capacity keeps the newest entries in order") {
        for (int i = 0; i < 250; i++) h.push(tagged((float)i));
        REQUIRE(h.size() == kMaxRuleHistory);
        REQUIRE(h.at(0).values[0] == 50.0f);
        REQUIRE(h.at(199).values[0] == 249.0f);
        for (size_t i = 1; i < h.size(); i++)
            REQUIRE(h.at(i).values[0] == h.at(i - 1).values[0] + 1.0f);
    }

    SECTION("Push reports the entry the cap evicted") {
        for (int i = 0; i < (int)kMaxRuleHistory; i++)
            REQUIRE_FALSE(h.push(tagged((float)i)).has_value());
        auto dropped = h.push(tagged(500.0f));
        REQUIRE(dropped.has_value());
        REQUIRE(dropped->values[0] == 0.0f);
        h.pop();
        h.pushFront(*dropped);
        REQUIRE(h.size() == kMaxRuleHistory);
        REQUIRE(h.at(0).values[0] == 0.0f);
        REQUIRE(h.current()->values[0] == 199.0f);
    }

    SECTION("Take removes one entry") {
        h.push(tagged(1.0f));
        h.push(tagged(2.0f));
        h.push(tagged(3.0f));
        auto r = h.take(1);
        REQUIRE(r.has_value());
        REQUIRE(r->values[0] == 2.0f);
        REQUIRE(h.size() == 2);
        REQUIRE(h.at(1).values[0] == 3.0f);
        REQUIRE_FALSE(h.take(5).has_value());
        REQUIRE(h.size() == 2);
    }

    SECTION("Zero rule entries are real entries") {
        h.push(tagged(1.0f));
        h.pushZeroRule();
        REQUIRE(h.size() == 2);
        REQUIRE(h.current()->isZero());
    }
}

TEST_CASE("Rule preview", "[history][preview]") {
    RuleHistory h;
    RulePreview preview(h);
    h.push(tagged(1.0f));

    SECTION("End restores the previous rule") {
        Rule shown = preview.begin(PreviewSource::History, tagged(7.0f));
        REQUIRE(shown.values[0] == 7.0f);
        REQUIRE(preview.active());
        REQUIRE(h.size() == 2);

        auto restored = preview.end();
        REQUIRE(restored.has_value());
        REQUIRE(restored->values[0] == 1.0f);
        REQUIRE_FALSE(preview.active());
        REQUIRE(h.size() == 1);
    }

    SECTION("A second begin replaces the first preview") {
        preview.begin(PreviewSource::ConfigFile, tagged(7.0f));
        preview.begin(PreviewSource::History, tagged(8.0f));
        REQUIRE(h.size() == 2);
        REQUIRE(h.current()->values[0] == 8.0f);
        REQUIRE(preview.source() == PreviewSource::History);
    }

    SECTION("End without a preview changes nothing") {
        REQUIRE_FALSE(preview.end().has_value());
        REQUIRE(h.size() == 1);
    }

    SECTION("Commit keeps the previewed rule") {
        preview.begin(PreviewSource::ConfigFile, tagged(9.0f));
        preview.commit();
        REQUIRE_FALSE(preview.active());
        REQUIRE_FALSE(preview.end().has_value());
        REQUIRE(h.size() == 2);
        REQUIRE(h.current()->values[0] == 9.0f);
    }

    SECTION("Ending a preview over an empty history yields the zero rule") {
        h.clear();
        preview.begin(PreviewSource::History, tagged(3.0f));
        auto restored = preview.end();
        REQUIRE(restored.has_value());
        REQUIRE(restored->isZero());
        REQUIRE(h.empty());
    }

    SECTION("Ending a preview over a full history keeps the oldest entry") {
        h.clear();
        for (int i = 0; i < (int)kMaxRuleHistory; i++) h.push(tagged((float)i));
        preview.begin(PreviewSource::History, tagged(900.0f));
        REQUIRE(h.size() == kMaxRuleHistory);
        REQUIRE(h.current()->values[0] == 900.0f);

        auto restored = preview.end();
        REQUIRE(restored.has_value());
        REQUIRE(restored->values[0] == 199.0f);
        REQUIRE(h.size() == kMaxRuleHistory);
        REQUIRE(h.at(0).values[0] == 0.0f);
        REQUIRE(h.at(kMaxRuleHistory - 1).values[0] == 199.0f);
    }

    SECTION("Committing over a full history keeps the eviction") {
        h.clear();
        for (int i = 0; i < (int)kMaxRuleHistory; i++) h.push(tagged((float)i));
        preview.begin(PreviewSource::ConfigFile, tagged(900.0f));
        preview.commit();
        REQUIRE(h.size() == kMaxRuleHistory);
        REQUIRE(h.at(0).values[0] == 1.0f);
        REQUIRE(h.current()->values[0] == 900.0f);
    }

    SECTION("The previewed rule is reported") {
        preview.begin(PreviewSource::ConfigFile, tagged(4.0f));
        REQUIRE(preview.previewedRule() == tagged(4.0f));
    }
}
