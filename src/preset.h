#pragma once
#include <map>
#include <string>
#include <vector>

// Tagged text format: one "key v1 v2 ..." line per entry.
using PresetData = std::map<std::string, std::vector<float>>;

std::string formatPreset(const PresetData& data);
PresetData parsePreset(const std::string& text);

// presets/<name>.txt
std::string presetPath(const std::string& name);

bool savePresetFile(const std::string& path, const PresetData& data);
// Empty result when the file is missing or unreadable.
PresetData loadPresetFile(const std::string& path);

// Names (without extension) of the .txt files in dir, sorted.
std::vector<std::string> listPresets(const std::string& dir = "presets");

bool readTextFile(const std::string& path, std::string& out);
bool ensureDirectory(const std::string& dir);

// Lookup helpers with fallbacks for missing or short entries
float presetFloat(const PresetData& data, const std::string& key, float fallback);
int presetInt(const PresetData& data, const std::string& key, int fallback);
bool presetBool(const PresetData& data, const std::string& key, bool fallback);
