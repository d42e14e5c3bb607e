#pragma once
#include "preset.h"
#include <string>

enum class MouseMode : int { SelectEntity = 0, DrawTrail = 1 };

// User preferences that persist between sessions (preferences.txt).
struct Preferences {
    int speedmult = 1;          // physics steps per displayed frame
    bool motionBlur = true;
    int blurQuality = 1;        // sample every n-th step
    float worldSize = 1.0f;     // scales entity count and canvas size
    float brightness = 1.0f;
    float exposure = 0.0f;      // blend with the previous finished frame

    MouseMode mouseMode = MouseMode::SelectEntity;
    float drawSize = 0.1f;
    float drawPower = 1.0f;

    int recordInterval = 1;
    int maxFrames = 1800;
    bool recordingMotionBlur = true;
    int recordingBlurQuality = 1;

    void clamp();
};

constexpr float kMinWorldSize = 0.01f;
// 4x keeps the entity buffer under the default 128 MiB storage binding limit
constexpr float kMaxWorldSize = 4.0f;

PresetData preferencesToPreset(const Preferences& prefs);
Preferences preferencesFromPreset(const PresetData& data);

bool savePreferences(const Preferences& prefs, const std::string& path = "preferences.txt");
// Defaults when the file is missing
Preferences loadPreferences(const std::string& path = "preferences.txt");
