#include <catch2/catch.hpp>
#include "config_codec.h"
#include <cstdio>
#include <cstring>
#include <string>
#include <vector>

using Catch::Matchers::WithinAbs;

// Little-endian writer for the packed pre-v7 layout
struct LegacyWriter {
    std::vector<uint8_t> bytes;

    void f32(float f) {
        uint32_t u;
        memcpy(&u, &f, sizeof(u));
        for (int i = 0; i < 4; i++) bytes.push_back((uint8_t)(u >> (8 * i)));
    }
    void i32(int32_t v) {
        for (int i = 0; i < 4; i++) bytes.push_back((uint8_t)((uint32_t)v >> (8 * i)));
    }
    void flag(bool b) { bytes.push_back(b ? 1 : 0); }
    void sweep(const std::string& name, float direction) {
        bytes.push_back((uint8_t)name.size());
        bytes.insert(bytes.end(), name.begin(), name.end());
        f32(direction);
        f32(0.0f);
        f32(1.0f);
    }
    void noSweep() { bytes.push_back(0); }
};

// Physics values and rule: the 360-byte core every version shares
static LegacyWriter legacyCore() {
    LegacyWriter w;
    for (int i = 0; i < 10; i++) w.f32(0.1f * (float)i);
    for (int i = 0; i < kRuleFloats; i++) w.f32((float)i);
    return w;
}

static void legacySettings(LegacyWriter& w) {
    w.flag(true);   // disable symmetry
    w.flag(true);   // absolute orientation
    w.i32(2);       // wrap
    w.i32(2);       // ring
    w.i32(12);      // cohorts
    w.f32(0.75f);   // rule seed
}

static std::string clipboardFor(const std::vector<uint8_t>& payload, int version) {
    std::vector<uint8_t> compressed;
    REQUIRE(zlibCompress(payload, compressed));
    return "SIM" + std::to_string(version) + ":" + base64UrlEncode(compressed);
}

static PhysicsConfig sampleConfig() {
    PhysicsConfig c;
    c.setting(ParamId::AxialForce).value = 0.123456789f;
    c.setting(ParamId::Drag).min = -0.25f;
    c.setting(ParamId::Drag).max = 0.75f;
    c.sliderDefaults[(int)ParamId::Drag].min = -2.0f;
    c.setSweep(SweepAxis::X, ParamId::Drag, -1.0f);
    c.setSweep(SweepAxis::Cohort, ParamId::SensorAngle, 1.0f);
    c.sweepsEnabled = true;
    c.disableSymmetry = true;
    c.orientation = OrientationMode::Radial;
    c.orientationMix = 0.3f;
    c.boundary = BoundaryMode::Reset;
    c.initial = InitialCondition::Ring;
    c.cohorts = 17;
    c.ruleSeed = 1.5f;
    c.inkWeight = 2.25f;
    c.hueSensitivity = 0.9f;
    c.colorByCohort = false;
    c.watercolor = true;
    c.emboss = EmbossMode::Brush;
    c.embossIntensity = 1.1f;
    c.embossSmoothness = 0.4f;
    c.rule = generateRandomCenters(3.0f);
    return c;
}

static void requireSameConfig(const PhysicsConfig& a, const PhysicsConfig& b) {
    for (int i = 0; i < kParamCount; i++) {
        REQUIRE(a.settings[i].value == b.settings[i].value);
        REQUIRE(a.settings[i].min == b.settings[i].min);
        REQUIRE(a.settings[i].max == b.settings[i].max);
        REQUIRE(a.settings[i].xSweep == b.settings[i].xSweep);
        REQUIRE(a.settings[i].ySweep == b.settings[i].ySweep);
        REQUIRE(a.settings[i].cohortSweep == b.settings[i].cohortSweep);
        REQUIRE(a.sliderDefaults[i].min == b.sliderDefaults[i].min);
        REQUIRE(a.sliderDefaults[i].max == b.sliderDefaults[i].max);
    }
    REQUIRE(a.sweepsEnabled == b.sweepsEnabled);
    REQUIRE(a.disableSymmetry == b.disableSymmetry);
    REQUIRE(a.orientation == b.orientation);
    REQUIRE(a.orientationMix == b.orientationMix);
    REQUIRE(a.boundary == b.boundary);
    REQUIRE(a.initial == b.initial);
    REQUIRE(a.cohorts == b.cohorts);
    REQUIRE(a.ruleSeed == b.ruleSeed);
    REQUIRE(a.inkWeight == b.inkWeight);
    REQUIRE(a.hueSensitivity == b.hueSensitivity);
    REQUIRE(a.colorByCohort == b.colorByCohort);
    REQUIRE(a.watercolor == b.watercolor);
    REQUIRE(a.emboss == b.emboss);
    REQUIRE(a.embossIntensity == b.embossIntensity);
    REQUIRE(a.embossSmoothness == b.embossSmoothness);
    REQUIRE(a.rule == b.rule);
}

TEST_CASE("Version 7 config text", "[codec]") {
    SECTION("Every field survives a save and load") {
        PhysicsConfig c = sampleConfig();
        auto decoded = decodeConfig(encodeConfig(c));
        REQUIRE(decoded.has_value());
        requireSameConfig(c, *decoded);
    }

    SECTION("Missing keys take defaults") {
        auto decoded = decodeConfig("version 7\nsettings.num_cohorts 5\n");
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->cohorts == 5);
        REQUIRE(decoded->value(ParamId::Drag) == paramInfo(ParamId::Drag).defaultValue);
        REQUIRE(decoded->rule.isZero());
    }

    SECTION("Unknown versions are rejected") {
        REQUIRE_FALSE(decodeConfig("version 5\n").has_value());
        REQUIRE_FALSE(decodeConfig("settings.num_cohorts 5\n").has_value());
    }

    SECTION("A rule of the wrong length is rejected") {
        REQUIRE_FALSE(decodeConfig("version 7\nrule 1 2 3\n").has_value());
    }

    SECTION("Out-of-range categoricals are clamped") {
        auto decoded = decodeConfig("version 7\nsettings.num_cohorts 9000\nsettings.boundary_conditions 7\n");
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->cohorts == kMaxCohorts);
        REQUIRE(decoded->boundary == BoundaryMode::Wrap);
    }
}

TEST_CASE("Legacy binary payloads", "[codec][legacy]") {
    SECTION("Physics and rule only") {
        LegacyWriter w = legacyCore();
        REQUIRE(w.bytes.size() == 360);
        auto c = decodeLegacyPayload(w.bytes, 1);
        REQUIRE(c.has_value());
        REQUIRE_THAT(c->value(ParamId::LateralForce), WithinAbs(0.1f, 1e-6f));
        REQUIRE_THAT(c->value(ParamId::TrailPersistence), WithinAbs(0.9f, 1e-6f));
        REQUIRE(c->value(ParamId::TrailDiffusion) == 1.0f);
        REQUIRE(c->value(ParamId::HazardRate) == 0.0f);
        REQUIRE(c->rule.values[79] == 79.0f);
        REQUIRE_FALSE(c->disableSymmetry);
    }

    SECTION("With simulation settings") {
        LegacyWriter w = legacyCore();
        legacySettings(w);
        REQUIRE(w.bytes.size() == 378);
        auto c = decodeLegacyPayload(w.bytes, 4);
        REQUIRE(c.has_value());
        REQUIRE(c->disableSymmetry);
        REQUIRE(c->orientation == OrientationMode::YAxis);
        REQUIRE(c->boundary == BoundaryMode::Wrap);
        REQUIRE(c->initial == InitialCondition::Ring);
        REQUIRE(c->cohorts == 12);
        REQUIRE(c->ruleSeed == 0.75f);
    }

    SECTION("Version 5 appearance and sweeps") {
        LegacyWriter w = legacyCore();
        legacySettings(w);
        w.f32(0.0f);
        w.f32(2.0f);    // ink weight
        w.f32(0.3f);    // hue sensitivity
        w.flag(false);  // color by cohort
        w.flag(true);   // watercolor
        w.f32(0.7f);    // emboss intensity
        w.f32(0.2f);    // emboss smoothness
        w.flag(true);   // sweeps enabled
        REQUIRE(w.bytes.size() == 401);
        w.sweep("DRAG", -1.0f);
        w.noSweep();
        w.sweep("SENSOR_GAIN", 1.0f);

        auto c = decodeLegacyPayload(w.bytes, 5);
        REQUIRE(c.has_value());
        REQUIRE(c->inkWeight == 2.0f);
        REQUIRE_FALSE(c->colorByCohort);
        REQUIRE(c->watercolor);
        REQUIRE(c->embossIntensity == 0.7f);
        REQUIRE(c->sweepsEnabled);
        REQUIRE(c->setting(ParamId::Drag).xSweep == -1.0f);
        REQUIRE_FALSE(c->sweptParam(SweepAxis::Y).has_value());
        REQUIRE(c->setting(ParamId::SensorGain).cohortSweep == 1.0f);
    }

    SECTION("Version 6 adds the emboss mode") {
        LegacyWriter w = legacyCore();
        legacySettings(w);
        w.f32(0.0f);
        w.f32(1.5f);
        w.f32(0.5f);
        w.flag(true);
        w.flag(false);
        w.f32(0.6f);
        w.f32(0.1f);
        w.i32(1);       // emboss canvas
        w.flag(false);
        REQUIRE(w.bytes.size() == 405);
        w.noSweep();
        w.noSweep();
        w.noSweep();

        auto c = decodeLegacyPayload(w.bytes, 6);
        REQUIRE(c.has_value());
        REQUIRE(c->emboss == EmbossMode::Canvas);
        REQUIRE(c->inkWeight == 1.5f);
        REQUIRE_FALSE(c->sweepsEnabled);
    }

    SECTION("Truncated sweep section is rejected") {
        LegacyWriter w = legacyCore();
        legacySettings(w);
        for (int i = 0; i < 23; i++) w.bytes.push_back(0);
        REQUIRE(w.bytes.size() == 401);
        w.bytes.push_back(4);  // name length with no name behind it
        REQUIRE_FALSE(decodeLegacyPayload(w.bytes, 5).has_value());
    }

    SECTION("Short payloads and unknown versions are rejected") {
        std::vector<uint8_t> shortPayload(100, 0);
        REQUIRE_FALSE(decodeLegacyPayload(shortPayload, 3).has_value());
        LegacyWriter w = legacyCore();
        REQUIRE_FALSE(decodeLegacyPayload(w.bytes, 0).has_value());
        REQUIRE_FALSE(decodeLegacyPayload(w.bytes, 7).has_value());
    }
}

TEST_CASE("Clipboard strings", "[codec][clipboard]") {
    SECTION("Current version round trip") {
        PhysicsConfig c = sampleConfig();
        std::string text = encodeClipboard(c);
        REQUIRE(text.rfind("SIM7:", 0) == 0);
        auto decoded = decodeClipboard("  " + text + "\n");
        REQUIRE(decoded.has_value());
        requireSameConfig(c, *decoded);
    }

    SECTION("Legacy clipboard strings decode") {
        LegacyWriter w = legacyCore();
        legacySettings(w);
        auto c = decodeClipboard(clipboardFor(w.bytes, 3));
        REQUIRE(c.has_value());
        REQUIRE(c->cohorts == 12);
    }

    SECTION("Malformed strings are rejected") {
        REQUIRE_FALSE(decodeClipboard("").has_value());
        REQUIRE_FALSE(decodeClipboard("hello").has_value());
        REQUIRE_FALSE(decodeClipboard("SIM:abcd").has_value());
        REQUIRE_FALSE(decodeClipboard("SIMx:abcd").has_value());
        REQUIRE_FALSE(decodeClipboard("SIM7:!!!!").has_value());
        REQUIRE_FALSE(decodeClipboard("SIM7:" + base64UrlEncode({1, 2, 3, 4, 5})).has_value());
    }

    SECTION("Unsupported version is rejected") {
        std::string payload = encodeConfig(PhysicsConfig{});
        std::string text = clipboardFor(std::vector<uint8_t>(payload.begin(), payload.end()), 42);
        REQUIRE_FALSE(decodeClipboard(text).has_value());
    }
}

TEST_CASE("Base64 and zlib helpers", "[codec]") {
    SECTION("URL-safe alphabet with padding") {
        REQUIRE(base64UrlEncode({'f', 'o', 'o', 'b'}) == "Zm9vYg==");
        REQUIRE(base64UrlEncode({'f', 'o', 'o'}) == "Zm9v");
        REQUIRE(base64UrlEncode({0xFB, 0xFF}) == "-_8=");
    }

    SECTION("Decoding accepts both alphabets") {
        std::vector<uint8_t> out;
        REQUIRE(base64UrlDecode("-_8=", out));
        REQUIRE(out == std::vector<uint8_t>{0xFB, 0xFF});
        REQUIRE(base64UrlDecode("+/8=", out));
        REQUIRE(out == std::vector<uint8_t>{0xFB, 0xFF});
        REQUIRE_FALSE(base64UrlDecode("Zm9v*", out));
        REQUIRE_FALSE(base64UrlDecode("Z", out));
    }

    SECTION("zlib round trip and garbage input") {
        std::vector<uint8_t> in(1000, 7), packed, unpacked;
        REQUIRE(zlibCompress(in, packed));
        REQUIRE(packed.size() < in.size());
        REQUIRE(zlibDecompress(packed, unpacked));
        REQUIRE(unpacked == in);
        REQUIRE_FALSE(zlibDecompress({9, 9, 9}, unpacked));
    }
}

TEST_CASE("Config files", "[codec][file]") {
    const std::string path = "codec_test_config.txt";
    PhysicsConfig c = sampleConfig();

    SECTION("Tagged text file") {
        REQUIRE(saveConfigFile(path, c));
        auto loaded = loadConfigFile(path);
        REQUIRE(loaded.has_value());
        requireSameConfig(c, *loaded);
    }

    SECTION("File holding a clipboard string") {
        FILE* f = fopen(path.c_str(), "w");
        REQUIRE(f != nullptr);
        fputs(encodeClipboard(c).c_str(), f);
        fclose(f);
        auto loaded = loadConfigFile(path);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->rule == c.rule);
    }

    SECTION("Missing file") {
        REQUIRE_FALSE(loadConfigFile("does_not_exist/config.txt").has_value());
    }

    std::remove(path.c_str());
}
