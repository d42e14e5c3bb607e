#include "config_codec.h"
#include <zlib.h>
#include <cmath>
#include <cstdio>
#include <cstring>

static const char* const SWEEP_AXIS_KEYS[3] = {"x", "y", "cohort"};
static const SweepAxis SWEEP_AXES[3] = {SweepAxis::X, SweepAxis::Y, SweepAxis::Cohort};

PresetData configToPreset(const PhysicsConfig& c) {
    PresetData d;
    d["version"] = {(float)kConfigVersion};

    for (int i = 0; i < kParamCount; i++) {
        const char* key = paramInfo((ParamId)i).key;
        const PhysicsSetting& s = c.settings[i];
        d[std::string("physics.") + key] = {s.value};
        d[std::string("range.") + key] = {s.min, s.max, c.sliderDefaults[i].min, c.sliderDefaults[i].max};
        for (int a = 0; a < 3; a++)
            d[std::string("sweep.") + SWEEP_AXIS_KEYS[a] + "." + key] = {s.sweep(SWEEP_AXES[a])};
    }
    d["sweeps_enabled"] = {c.sweepsEnabled ? 1.0f : 0.0f};

    d["settings.disable_symmetry"] = {c.disableSymmetry ? 1.0f : 0.0f};
    d["settings.absolute_orientation"] = {(float)c.orientation};
    d["settings.orientation_mix"] = {c.orientationMix};
    d["settings.boundary_conditions"] = {(float)c.boundary};
    d["settings.initial_conditions"] = {(float)c.initial};
    d["settings.num_cohorts"] = {(float)c.cohorts};
    d["settings.rule_seed"] = {c.ruleSeed};

    d["appearance.ink_weight"] = {c.inkWeight};
    d["appearance.hue_sensitivity"] = {c.hueSensitivity};
    d["appearance.color_by_cohort"] = {c.colorByCohort ? 1.0f : 0.0f};
    d["appearance.watercolor_mode"] = {c.watercolor ? 1.0f : 0.0f};
    d["appearance.emboss_mode"] = {(float)c.emboss};
    d["appearance.emboss_intensity"] = {c.embossIntensity};
    d["appearance.emboss_smoothness"] = {c.embossSmoothness};

    d["rule"] = std::vector<float>(c.rule.values.begin(), c.rule.values.end());
    return d;
}

std::optional<PhysicsConfig> configFromPreset(const PresetData& d) {
    auto ver = d.find("version");
    if (ver == d.end() || ver->second.empty()) {
        fprintf(stderr, "Config has no version field\n");
        return std::nullopt;
    }
    if ((int)ver->second[0] != kConfigVersion) {
        fprintf(stderr, "Unsupported config version: %d\n", (int)ver->second[0]);
        return std::nullopt;
    }

    PhysicsConfig c;
    for (int i = 0; i < kParamCount; i++) {
        const std::string key = paramInfo((ParamId)i).key;
        PhysicsSetting& s = c.settings[i];
        s.value = presetFloat(d, "physics." + key, s.value);

        auto range = d.find("range." + key);
        if (range != d.end()) {
            const auto& r = range->second;
            if (r.size() >= 2) { s.min = r[0]; s.max = r[1]; }
            if (r.size() >= 4) { c.sliderDefaults[i].min = r[2]; c.sliderDefaults[i].max = r[3]; }
        }
        for (int a = 0; a < 3; a++) {
            float mode = presetFloat(d, std::string("sweep.") + SWEEP_AXIS_KEYS[a] + "." + key, 0.0f);
            s.setSweep(SWEEP_AXES[a], mode);
        }
    }
    c.sweepsEnabled = presetBool(d, "sweeps_enabled", c.sweepsEnabled);

    c.disableSymmetry = presetBool(d, "settings.disable_symmetry", c.disableSymmetry);
    c.orientation = (OrientationMode)presetInt(d, "settings.absolute_orientation", (int)c.orientation);
    c.orientationMix = presetFloat(d, "settings.orientation_mix", c.orientationMix);
    c.boundary = (BoundaryMode)presetInt(d, "settings.boundary_conditions", (int)c.boundary);
    c.initial = (InitialCondition)presetInt(d, "settings.initial_conditions", (int)c.initial);
    c.cohorts = presetInt(d, "settings.num_cohorts", c.cohorts);
    c.ruleSeed = presetFloat(d, "settings.rule_seed", c.ruleSeed);

    c.inkWeight = presetFloat(d, "appearance.ink_weight", c.inkWeight);
    c.hueSensitivity = presetFloat(d, "appearance.hue_sensitivity", c.hueSensitivity);
    c.colorByCohort = presetBool(d, "appearance.color_by_cohort", c.colorByCohort);
    c.watercolor = presetBool(d, "appearance.watercolor_mode", c.watercolor);
    c.emboss = (EmbossMode)presetInt(d, "appearance.emboss_mode", (int)c.emboss);
    c.embossIntensity = presetFloat(d, "appearance.emboss_intensity", c.embossIntensity);
    c.embossSmoothness = presetFloat(d, "appearance.emboss_smoothness", c.embossSmoothness);

    auto rule = d.find("rule");
    if (rule != d.end()) {
        if (rule->second.size() != (size_t)kRuleFloats) {
            fprintf(stderr, "Config rule has %zu values, expected %d\n", rule->second.size(), kRuleFloats);
            return std::nullopt;
        }
        std::copy(rule->second.begin(), rule->second.end(), c.rule.values.begin());
    }

    c.clampCategoricals();
    return c;
}

std::string encodeConfig(const PhysicsConfig& config) {
    return formatPreset(configToPreset(config));
}

std::optional<PhysicsConfig> decodeConfig(const std::string& text) {
    return configFromPreset(parsePreset(text));
}

// --- Legacy binary payloads ---

namespace {

struct ByteReader {
    const std::vector<uint8_t>& bytes;
    size_t offset;

    bool has(size_t n) const { return offset + n <= bytes.size(); }

    float f32() {
        uint32_t u = (uint32_t)bytes[offset] | ((uint32_t)bytes[offset + 1] << 8) |
                     ((uint32_t)bytes[offset + 2] << 16) | ((uint32_t)bytes[offset + 3] << 24);
        offset += 4;
        float f;
        memcpy(&f, &u, sizeof(f));
        return f;
    }
    int32_t i32() {
        float f = f32();
        int32_t i;
        memcpy(&i, &f, sizeof(i));
        return i;
    }
    bool flag() { return bytes[offset++] != 0; }
};

// u8 name length (0 = none), name bytes, then direction, min, max
bool readLegacySweep(ByteReader& r, PhysicsConfig& c, SweepAxis axis) {
    if (!r.has(1)) return false;
    uint8_t nameLen = r.bytes[r.offset++];
    if (nameLen == 0) return true;
    if (!r.has((size_t)nameLen + 12)) return false;
    std::string name((const char*)&r.bytes[r.offset], nameLen);
    r.offset += nameLen;
    float direction = r.f32();
    r.f32(); // legacy min, superseded by slider defaults
    r.f32(); // legacy max
    if (auto id = paramFromKey(name)) c.setSweep(axis, *id, direction);
    else fprintf(stderr, "Ignoring legacy sweep on unknown parameter '%s'\n", name.c_str());
    return true;
}

} // namespace

std::optional<PhysicsConfig> decodeLegacyPayload(const std::vector<uint8_t>& bytes, int version) {
    if (version < 1 || version > 6) {
        fprintf(stderr, "Unsupported legacy config version: %d\n", version);
        return std::nullopt;
    }
    if (bytes.size() < 360) {
        fprintf(stderr, "Legacy config too short: %zu bytes\n", bytes.size());
        return std::nullopt;
    }

    PhysicsConfig c;
    ByteReader r{bytes, 0};
    for (int i = 0; i < 10; i++) c.settings[i].value = r.f32();
    for (int i = 0; i < kRuleFloats; i++) c.rule.values[i] = r.f32();
    c.setting(ParamId::TrailDiffusion).value = 1.0f;
    c.setting(ParamId::HazardRate).value = 0.0f;

    if (bytes.size() >= 362) {
        c.disableSymmetry = r.flag();
        c.orientation = r.flag() ? OrientationMode::YAxis : OrientationMode::Off;
    }
    if (bytes.size() >= 374) {
        c.boundary = (BoundaryMode)r.i32();
        c.initial = (InitialCondition)r.i32();
        c.cohorts = r.i32();
    }
    if (bytes.size() >= 378) c.ruleSeed = r.f32();

    bool hasAppearance = false;
    if (version >= 6 && bytes.size() >= 405) {
        r.offset = 378;
        r.f32(); // unused
        c.inkWeight = r.f32();
        c.hueSensitivity = r.f32();
        c.colorByCohort = r.flag();
        c.watercolor = r.flag();
        c.embossIntensity = r.f32();
        c.embossSmoothness = r.f32();
        c.emboss = (EmbossMode)r.i32();
        c.sweepsEnabled = r.flag();
        hasAppearance = true;
    } else if (bytes.size() >= 401) {
        r.offset = 378;
        r.f32();
        c.inkWeight = r.f32();
        c.hueSensitivity = r.f32();
        c.colorByCohort = r.flag();
        c.watercolor = r.flag();
        c.embossIntensity = r.f32();
        c.embossSmoothness = r.f32();
        c.sweepsEnabled = r.flag();
        hasAppearance = true;
    }

    if (hasAppearance) {
        if (!readLegacySweep(r, c, SweepAxis::X) ||
            !readLegacySweep(r, c, SweepAxis::Y) ||
            !readLegacySweep(r, c, SweepAxis::Cohort)) {
            fprintf(stderr, "Legacy config sweep section is truncated\n");
            return std::nullopt;
        }
    }

    c.clampCategoricals();
    return c;
}

// --- Base64 / zlib ---

static const char B64[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

std::string base64UrlEncode(const std::vector<uint8_t>& bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out += B64[(n >> 18) & 63];
        out += B64[(n >> 12) & 63];
        out += B64[(n >> 6) & 63];
        out += B64[n & 63];
    }
    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t n = bytes[i] << 16;
        out += B64[(n >> 18) & 63];
        out += B64[(n >> 12) & 63];
        out += "==";
    } else if (rest == 2) {
        uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out += B64[(n >> 18) & 63];
        out += B64[(n >> 12) & 63];
        out += B64[(n >> 6) & 63];
        out += '=';
    }
    return out;
}

static int b64Value(char ch) {
    if (ch >= 'A' && ch <= 'Z') return ch - 'A';
    if (ch >= 'a' && ch <= 'z') return ch - 'a' + 26;
    if (ch >= '0' && ch <= '9') return ch - '0' + 52;
    if (ch == '-' || ch == '+') return 62;
    if (ch == '_' || ch == '/') return 63;
    return -1;
}

bool base64UrlDecode(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();
    uint32_t acc = 0;
    int bits = 0;
    size_t i = 0;
    for (; i < text.size() && text[i] != '='; i++) {
        int v = b64Value(text[i]);
        if (v < 0) return false;
        acc = (acc << 6) | (uint32_t)v;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back((uint8_t)((acc >> bits) & 0xFF));
        }
    }
    for (; i < text.size(); i++)
        if (text[i] != '=') return false;
    // A single dangling sextet can't encode a byte
    return bits < 6;
}

bool zlibCompress(const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
    uLongf size = compressBound((uLong)in.size());
    out.resize(size);
    int rc = compress2(out.data(), &size, in.data(), (uLong)in.size(), 9);
    if (rc != Z_OK) {
        fprintf(stderr, "zlib compress failed: %d\n", rc);
        return false;
    }
    out.resize(size);
    return true;
}

bool zlibDecompress(const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
    out.clear();
    z_stream zs = {};
    if (inflateInit(&zs) != Z_OK) return false;
    zs.next_in = const_cast<Bytef*>(in.data());
    zs.avail_in = (uInt)in.size();

    uint8_t chunk[16384];
    int rc = Z_OK;
    while (rc == Z_OK) {
        zs.next_out = chunk;
        zs.avail_out = sizeof(chunk);
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) break;
        out.insert(out.end(), chunk, chunk + (sizeof(chunk) - zs.avail_out));
    }
    inflateEnd(&zs);
    if (rc != Z_STREAM_END) {
        fprintf(stderr, "zlib decompress failed: %d\n", rc);
        return false;
    }
    return true;
}

// --- Clipboard ---

std::string encodeClipboard(const PhysicsConfig& config) {
    std::string payload = encodeConfig(config);
    std::vector<uint8_t> compressed;
    if (!zlibCompress(std::vector<uint8_t>(payload.begin(), payload.end()), compressed)) return "";
    return "SIM" + std::to_string(kConfigVersion) + ":" + base64UrlEncode(compressed);
}

std::optional<PhysicsConfig> decodeClipboard(const std::string& raw) {
    size_t first = raw.find_first_not_of(" \t\r\n");
    size_t last = raw.find_last_not_of(" \t\r\n");
    if (first == std::string::npos) {
        fprintf(stderr, "Invalid config string: empty\n");
        return std::nullopt;
    }
    std::string text = raw.substr(first, last - first + 1);

    if (text.compare(0, 3, "SIM") != 0) {
        fprintf(stderr, "Invalid config string: missing SIM prefix\n");
        return std::nullopt;
    }
    size_t colon = text.find(':');
    if (colon == std::string::npos || colon == 3) {
        fprintf(stderr, "Invalid config string: missing version\n");
        return std::nullopt;
    }
    int version = 0;
    for (size_t i = 3; i < colon; i++) {
        if (text[i] < '0' || text[i] > '9' || version > 1000) {
            fprintf(stderr, "Invalid config string: bad version\n");
            return std::nullopt;
        }
        version = version * 10 + (text[i] - '0');
    }

    std::vector<uint8_t> compressed, payload;
    if (!base64UrlDecode(text.substr(colon + 1), compressed)) {
        fprintf(stderr, "Failed to decode clipboard: invalid base64\n");
        return std::nullopt;
    }
    if (!zlibDecompress(compressed, payload)) {
        fprintf(stderr, "Failed to decode clipboard: invalid zlib stream\n");
        return std::nullopt;
    }

    if (version == kConfigVersion)
        return decodeConfig(std::string(payload.begin(), payload.end()));
    if (version >= 1 && version <= 6)
        return decodeLegacyPayload(payload, version);

    fprintf(stderr, "Unsupported config version: %d\n", version);
    return std::nullopt;
}

bool saveConfigFile(const std::string& path, const PhysicsConfig& config) {
    return savePresetFile(path, configToPreset(config));
}

std::optional<PhysicsConfig> loadConfigFile(const std::string& path) {
    std::string text;
    if (!readTextFile(path, text)) {
        fprintf(stderr, "Failed to open config: %s\n", path.c_str());
        return std::nullopt;
    }
    if (text.compare(0, 3, "SIM") == 0) return decodeClipboard(text);
    return decodeConfig(text);
}
