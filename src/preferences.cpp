#include "preferences.h"
#include <algorithm>

void Preferences::clamp() {
    speedmult = std::clamp(speedmult, 1, 64);
    blurQuality = std::clamp(blurQuality, 1, 64);
    worldSize = std::clamp(worldSize, kMinWorldSize, kMaxWorldSize);
    brightness = std::max(0.0f, brightness);
    exposure = std::clamp(exposure, 0.0f, 1.0f);
    mouseMode = mouseMode == MouseMode::DrawTrail ? MouseMode::DrawTrail : MouseMode::SelectEntity;
    drawSize = std::max(0.0f, drawSize);
    recordInterval = std::max(1, recordInterval);
    maxFrames = std::max(1, maxFrames);
    recordingBlurQuality = std::clamp(recordingBlurQuality, 1, 64);
}

PresetData preferencesToPreset(const Preferences& p) {
    PresetData d;
    d["speedmult"] = {(float)p.speedmult};
    d["motion_blur"] = {p.motionBlur ? 1.0f : 0.0f};
    d["blur_quality"] = {(float)p.blurQuality};
    d["world_size"] = {p.worldSize};
    d["brightness"] = {p.brightness};
    d["exposure"] = {p.exposure};
    d["mouse_mode"] = {(float)p.mouseMode};
    d["draw_size"] = {p.drawSize};
    d["draw_power"] = {p.drawPower};
    d["record_interval"] = {(float)p.recordInterval};
    d["max_frames"] = {(float)p.maxFrames};
    d["recording_motion_blur"] = {p.recordingMotionBlur ? 1.0f : 0.0f};
    d["recording_blur_quality"] = {(float)p.recordingBlurQuality};
    return d;
}

Preferences preferencesFromPreset(const PresetData& d) {
    Preferences p;
    p.speedmult = presetInt(d, "speedmult", p.speedmult);
    p.motionBlur = presetBool(d, "motion_blur", p.motionBlur);
    p.blurQuality = presetInt(d, "blur_quality", p.blurQuality);
    p.worldSize = presetFloat(d, "world_size", p.worldSize);
    p.brightness = presetFloat(d, "brightness", p.brightness);
    p.exposure = presetFloat(d, "exposure", p.exposure);
    p.mouseMode = (MouseMode)presetInt(d, "mouse_mode", (int)p.mouseMode);
    p.drawSize = presetFloat(d, "draw_size", p.drawSize);
    p.drawPower = presetFloat(d, "draw_power", p.drawPower);
    p.recordInterval = presetInt(d, "record_interval", p.recordInterval);
    p.maxFrames = presetInt(d, "max_frames", p.maxFrames);
    p.recordingMotionBlur = presetBool(d, "recording_motion_blur", p.recordingMotionBlur);
    p.recordingBlurQuality = presetInt(d, "recording_blur_quality", p.recordingBlurQuality);
    p.clamp();
    return p;
}

bool savePreferences(const Preferences& prefs, const std::string& path) {
    return savePresetFile(path, preferencesToPreset(prefs));
}

Preferences loadPreferences(const std::string& path) {
    return preferencesFromPreset(loadPresetFile(path));
}
