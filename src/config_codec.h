#pragma once
#include "physics_config.h"
#include "preset.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

constexpr int kConfigVersion = 7;

// Version 7 tagged-text payload
PresetData configToPreset(const PhysicsConfig& config);
std::optional<PhysicsConfig> configFromPreset(const PresetData& data);

std::string encodeConfig(const PhysicsConfig& config);
std::optional<PhysicsConfig> decodeConfig(const std::string& text);

// Packed little-endian layout used by versions 1-6. Decode only.
std::optional<PhysicsConfig> decodeLegacyPayload(const std::vector<uint8_t>& bytes, int version);

// "SIM<version>:<urlsafe-base64(zlib(payload))>"
std::string encodeClipboard(const PhysicsConfig& config);
std::optional<PhysicsConfig> decodeClipboard(const std::string& text);

// A file holds either a v7 payload or a legacy clipboard string.
bool saveConfigFile(const std::string& path, const PhysicsConfig& config);
std::optional<PhysicsConfig> loadConfigFile(const std::string& path);

std::string base64UrlEncode(const std::vector<uint8_t>& bytes);
bool base64UrlDecode(const std::string& text, std::vector<uint8_t>& out);
bool zlibCompress(const std::vector<uint8_t>& in, std::vector<uint8_t>& out);
bool zlibDecompress(const std::vector<uint8_t>& in, std::vector<uint8_t>& out);
