#include "preset.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <dirent.h>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <sys/stat.h>

std::string formatPreset(const PresetData& data) {
    std::ostringstream out;
    out << std::setprecision(9);
    for (auto& [key, vals] : data) {
        out << key;
        for (float v : vals) out << " " << v;
        out << "\n";
    }
    return out.str();
}

PresetData parsePreset(const std::string& text) {
    PresetData data;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream ss(line);
        std::string key;
        ss >> key;
        if (key.empty() || key[0] == '#') continue;
        std::vector<float> vals;
        float v;
        while (ss >> v) vals.push_back(v);
        data[key] = vals;
    }
    return data;
}

std::string presetPath(const std::string& name) {
    return "presets/" + name + ".txt";
}

bool ensureDirectory(const std::string& dir) {
    struct stat st;
    if (stat(dir.c_str(), &st) == 0) return S_ISDIR(st.st_mode);
    return mkdir(dir.c_str(), 0755) == 0;
}

bool savePresetFile(const std::string& path, const PresetData& data) {
    size_t slash = path.find_last_of('/');
    if (slash != std::string::npos && !ensureDirectory(path.substr(0, slash))) {
        fprintf(stderr, "Failed to create directory for %s\n", path.c_str());
        return false;
    }
    std::ofstream f(path);
    if (!f.is_open()) {
        fprintf(stderr, "Failed to write preset: %s\n", path.c_str());
        return false;
    }
    f << formatPreset(data);
    return f.good();
}

bool readTextFile(const std::string& path, std::string& out) {
    std::ifstream f(path);
    if (!f.is_open()) return false;
    std::stringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

PresetData loadPresetFile(const std::string& path) {
    std::string text;
    if (!readTextFile(path, text)) return {};
    return parsePreset(text);
}

std::vector<std::string> listPresets(const std::string& dir) {
    std::vector<std::string> names;
    DIR* d = opendir(dir.c_str());
    if (!d) return names;
    while (dirent* e = readdir(d)) {
        std::string name = e->d_name;
        if (name.size() > 4 && name.compare(name.size() - 4, 4, ".txt") == 0)
            names.push_back(name.substr(0, name.size() - 4));
    }
    closedir(d);
    std::sort(names.begin(), names.end());
    return names;
}

float presetFloat(const PresetData& data, const std::string& key, float fallback) {
    auto it = data.find(key);
    if (it == data.end() || it->second.empty()) return fallback;
    return it->second[0];
}

int presetInt(const PresetData& data, const std::string& key, int fallback) {
    auto it = data.find(key);
    if (it == data.end() || it->second.empty()) return fallback;
    return (int)std::lround(it->second[0]);
}

bool presetBool(const PresetData& data, const std::string& key, bool fallback) {
    auto it = data.find(key);
    if (it == data.end() || it->second.empty()) return fallback;
    return it->second[0] > 0.5f;
}
