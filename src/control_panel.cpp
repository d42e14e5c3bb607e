#include "control_panel.h"
#include <imgui.h>
#include <algorithm>
#include <cstdio>
#include <random>

static const char* kSweepLabels[] = {"-", "0", "+"};

// Three-state toggle: -1 inverse, 0 off, 1 normal
static bool sweepToggle(const char* id, float& mode) {
    int state = (int)mode + 1;
    ImGui::PushID(id);
    bool changed = false;
    if (ImGui::Button(kSweepLabels[state], ImVec2(24.0f, 0.0f))) {
        state = (state + 1) % 3;
        mode = (float)(state - 1);
        changed = true;
    }
    ImGui::PopID();
    return changed;
}

PanelActions ControlPanel::draw(Session& session, const PanelStatus& status) {
    PanelActions actions;
    m_hoveredThisFrame = false;

    simulationWindow(session, status, actions);
    physicsWindow(session);
    presetsWindow(session);
    multiLoadWindow(session);
    historyWindow(session);

    if (!m_hoveredThisFrame && session.preview().active()) {
        session.endPreview();
        m_previewKey.clear();
    }
    return actions;
}

void ControlPanel::simulationWindow(Session& session, const PanelStatus& status, PanelActions& actions) {
    Preferences& p = session.prefs;
    SimState& s = session.state;

    ImGui::SetNextWindowPos(ImVec2(10, 10), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(300, 0), ImGuiCond_FirstUseEver);
    ImGui::Begin("Simulation");

    if (ImGui::Button(session.paused ? "Play" : "Pause")) session.paused = !session.paused;
    ImGui::SameLine();
    if (ImGui::Button("Step")) {
        session.paused = true;
        actions.stepOnce = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("Reset")) session.reset();
    ImGui::SameLine();
    if (ImGui::Button("Full Reset")) session.fullReset();

    if (ImGui::Button("Randomize Rule")) {
        static std::mt19937 rng(std::random_device{}());
        session.randomizeRule(std::uniform_real_distribution<float>(0.0f, 1000.0f)(rng));
    }
    ImGui::SameLine();
    if (ImGui::Button("Reload Shaders")) actions.reloadShaders = true;

    ImGui::Text("%u entities, %ux%u canvas, tick %u", status.entityCount, status.canvasDim,
                status.canvasDim, status.tick);

    ImGui::Separator();
    ImGui::SliderInt("Speed", &p.speedmult, 1, 64);
    ImGui::Checkbox("Motion Blur", &p.motionBlur);
    ImGui::SliderInt("Blur Quality", &p.blurQuality, 1, 16);
    ImGui::SliderFloat("Brightness", &p.brightness, 0.0f, 4.0f);
    ImGui::SliderFloat("Exposure", &p.exposure, 0.0f, 0.99f);

    ImGui::SliderFloat("World Size", &m_pendingWorldSize, kMinWorldSize, kMaxWorldSize, "%.2f",
                       ImGuiSliderFlags_Logarithmic);
    if (m_pendingWorldSize != p.worldSize) {
        ImGui::SameLine();
        if (ImGui::Button("Apply")) session.setWorldSize(m_pendingWorldSize);
    } else {
        m_pendingWorldSize = p.worldSize;
    }

    int view = (int)s.view;
    ImGui::RadioButton("Canvas", &view, (int)ViewOption::Canvas);
    ImGui::SameLine();
    ImGui::RadioButton("Brush", &view, (int)ViewOption::Brush);
    ImGui::SameLine();
    ImGui::RadioButton("Dots", &view, (int)ViewOption::Particles);
    ImGui::SameLine();
    ImGui::RadioButton("Tiled Dots", &view, (int)ViewOption::TiledParticles);
    s.view = (ViewOption)view;

    ImGui::Separator();
    int mode = (int)p.mouseMode;
    ImGui::RadioButton("Select", &mode, (int)MouseMode::SelectEntity);
    ImGui::SameLine();
    ImGui::RadioButton("Draw", &mode, (int)MouseMode::DrawTrail);
    p.mouseMode = (MouseMode)mode;
    if (p.mouseMode == MouseMode::DrawTrail) {
        ImGui::SliderFloat("Draw Size", &p.drawSize, 0.005f, 0.5f);
        ImGui::SliderFloat("Draw Power", &p.drawPower, 0.0f, 10.0f);
        if (s.config.sweepsEnabled || s.multiLoadEnabled)
            ImGui::TextDisabled("Drawing is off while sweeps or multi-load run");
    }

    ImGui::Separator();
    if (ImGui::Button("Export PNG")) actions.exportFrame = true;
    ImGui::SameLine();
    if (status.recording) {
        ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0.8f, 0.1f, 0.1f, 1.0f));
        if (ImGui::Button("Stop Recording")) actions.toggleRecording = true;
        ImGui::PopStyleColor();
        ImGui::Text("Frame %d", status.recordedFrames);
        if (status.pendingWrites > 0) {
            ImGui::SameLine();
            ImGui::Text("(%d queued)", status.pendingWrites);
        }
        ImGui::TextDisabled("%s", status.recordDir.c_str());
    } else {
        if (ImGui::Button("Record Sequence")) actions.toggleRecording = true;
    }
    if (status.failedWrites > 0)
        ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.3f, 1.0f), "%d frame writes failed", status.failedWrites);
    ImGui::DragInt("Interval", &p.recordInterval, 0.1f, 1, 60);
    ImGui::DragInt("Max Frames", &p.maxFrames, 1.0f, 1, 100000);
    ImGui::Checkbox("Recording Motion Blur", &p.recordingMotionBlur);
    ImGui::SliderInt("Recording Blur Quality", &p.recordingBlurQuality, 1, 16);

    ImGui::Text("FPS: %.0f", status.fps);
    ImGui::End();
    p.clamp();
}

void ControlPanel::physicsWindow(Session& session) {
    PhysicsConfig& c = session.state.config;

    ImGui::SetNextWindowPos(ImVec2(320, 10), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(420, 0), ImGuiCond_FirstUseEver);
    ImGui::Begin("Physics");

    ImGui::Checkbox("Sweeps Enabled", &c.sweepsEnabled);
    ImGui::SameLine();
    if (ImGui::Button("Clear Sweeps")) c.clearSweeps();
    ImGui::TextDisabled("Sweep buttons: X  Y  Cohort");

    for (int i = 0; i < kParamCount; i++) {
        ParamId id = (ParamId)i;
        PhysicsSetting& s = c.setting(id);
        const ParamInfo& info = paramInfo(id);
        ImGui::PushID(i);

        float x = s.xSweep, y = s.ySweep, k = s.cohortSweep;
        if (sweepToggle("x", x)) c.setSweep(SweepAxis::X, id, x);
        ImGui::SameLine();
        if (sweepToggle("y", y)) c.setSweep(SweepAxis::Y, id, y);
        ImGui::SameLine();
        if (sweepToggle("c", k)) c.setSweep(SweepAxis::Cohort, id, k);
        ImGui::SameLine();

        // Slider bounds may be inverted, so sort them for the widget
        float lo = std::min(s.min, s.max), hi = std::max(s.min, s.max);
        if (lo == hi) hi = lo + 1e-6f;
        ImGui::SetNextItemWidth(160.0f);
        ImGui::SliderFloat(info.label, &s.value, lo, hi, "%.4f");

        if (ImGui::TreeNode("range", "range")) {
            ImGui::DragFloat("Min", &s.min, 0.001f);
            ImGui::DragFloat("Max", &s.max, 0.001f);
            if (ImGui::Button("Reset Range")) c.resetSliderRange(id);
            ImGui::TreePop();
        }
        ImGui::PopID();
    }

    ImGui::Separator();
    ImGui::Checkbox("Disable Symmetry", &c.disableSymmetry);

    int orientation = (int)c.orientation;
    const char* orientations[] = {"Off", "Y-Axis", "Radial"};
    if (ImGui::Combo("Orientation", &orientation, orientations, 3)) c.orientation = (OrientationMode)orientation;
    if (c.orientation != OrientationMode::Off) ImGui::SliderFloat("Orientation Mix", &c.orientationMix, 0.0f, 1.0f);

    int boundary = (int)c.boundary;
    const char* boundaries[] = {"Bounce", "Reset", "Wrap"};
    if (ImGui::Combo("Boundary", &boundary, boundaries, 3)) c.boundary = (BoundaryMode)boundary;

    int initial = (int)c.initial;
    const char* initials[] = {"Grid", "Random", "Ring"};
    if (ImGui::Combo("Initial Conditions", &initial, initials, 3)) c.initial = (InitialCondition)initial;

    ImGui::SliderInt("Cohorts", &c.cohorts, kMinCohorts, kMaxCohorts);
    ImGui::DragFloat("Rule Seed", &c.ruleSeed, 0.001f);

    appearanceSection(c);
    c.clampCategoricals();
    ImGui::End();
}

void ControlPanel::appearanceSection(PhysicsConfig& c) {
    if (!ImGui::CollapsingHeader("Appearance", ImGuiTreeNodeFlags_DefaultOpen)) return;

    ImGui::SliderFloat("Ink Weight", &c.inkWeight, 0.0f, 8.0f);
    ImGui::Checkbox("Color by Cohort", &c.colorByCohort);
    ImGui::SliderFloat("Hue Sensitivity", &c.hueSensitivity, 0.0f, 1.0f);
    ImGui::Checkbox("Watercolor", &c.watercolor);

    int emboss = (int)c.emboss;
    const char* embossModes[] = {"Off", "Canvas", "Brush"};
    if (ImGui::Combo("Emboss", &emboss, embossModes, 3)) c.emboss = (EmbossMode)emboss;
    if (c.emboss != EmbossMode::Off) {
        ImGui::SliderFloat("Emboss Intensity", &c.embossIntensity, 0.0f, 2.0f);
        ImGui::SliderFloat("Emboss Smoothness", &c.embossSmoothness, 0.0f, 1.0f);
    }
}

void ControlPanel::presetsWindow(Session& session) {
    ImGui::SetNextWindowPos(ImVec2(10, 520), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(300, 300), ImGuiCond_FirstUseEver);
    ImGui::Begin("Presets");

    ImGui::InputText("Name", m_presetName, sizeof(m_presetName));
    if (ImGui::Button("Save Preset")) {
        if (session.savePreset(m_presetName)) m_presetsStale = true;
    }
    ImGui::SameLine();
    if (ImGui::Button("Refresh")) m_presetsStale = true;

    if (ImGui::Button("Copy Config")) ImGui::SetClipboardText(session.copyConfig().c_str());
    ImGui::SameLine();
    if (ImGui::Button("Paste Config")) {
        const char* text = ImGui::GetClipboardText();
        if (text) session.pasteConfig(text);
    }
    ImGui::Checkbox("Keep Watercolor on Load", &session.keepWatercolorOnLoad);

    if (m_presetsStale) {
        m_presets = listPresets();
        m_presetsStale = false;
    }

    ImGui::Separator();
    for (size_t i = 0; i < m_presets.size(); i++) {
        const std::string& name = m_presets[i];
        ImGui::PushID((int)i);
        if (ImGui::SmallButton("+")) session.addPresetToMultiLoad(name);
        if (ImGui::IsItemHovered()) ImGui::SetTooltip("Add to multi-load");
        ImGui::SameLine();
        if (ImGui::Selectable(name.c_str())) {
            session.loadPreset(name);
            m_previewKey.clear();
        } else if (ImGui::IsItemHovered()) {
            hoverPreset(session, name);
        }
        ImGui::PopID();
    }
    ImGui::End();
}

void ControlPanel::multiLoadWindow(Session& session) {
    MultiLoadRegistry& ml = session.multiLoad;

    ImGui::SetNextWindowPos(ImVec2(320, 520), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(300, 0), ImGuiCond_FirstUseEver);
    ImGui::Begin("Multi-Load");

    ImGui::Checkbox("Enabled", &session.state.multiLoadEnabled);
    if (session.state.multiLoadEnabled && session.preview().active())
        ImGui::TextDisabled("Paused while previewing a rule");

    int removeIndex = -1;
    for (int i = 0; i < ml.count(); i++) {
        ImGui::PushID(i);
        if (ImGui::SmallButton("x")) removeIndex = i;
        ImGui::SameLine();
        ImGui::Text("%d: %s", i, ml.name(i).c_str());
        ImGui::PopID();
    }
    if (removeIndex >= 0) ml.removeConfig(removeIndex);
    if (ml.count() == 0) ImGui::TextDisabled("Add presets with + in the Presets window");
    else if (ImGui::Button("Clear")) ml.clear();

    float simultaneous = ml.simultaneous();
    if (ImGui::SliderFloat("Simultaneous", &simultaneous, 0.0f, (float)std::max(1, ml.count())))
        ml.setSimultaneous(simultaneous);
    float progress = ml.progress();
    if (ImGui::SliderFloat("Progress", &progress, 0.0f, 1.0f)) ml.setProgress(progress);
    ImGui::SliderFloat("Pace", &ml.pace, 0.0f, 10.0f);

    int assignment = (int)ml.assignment;
    ImGui::RadioButton("By Cohort", &assignment, (int)AssignmentMode::Cohorts);
    ImGui::SameLine();
    ImGui::RadioButton("Random", &assignment, (int)AssignmentMode::Random);
    ml.assignment = (AssignmentMode)assignment;

    ImGui::Checkbox("Per-Config Initial Conditions", &ml.perConfigInitialConditions);
    ImGui::Checkbox("Per-Config Cohorts", &ml.perConfigCohorts);
    ImGui::Checkbox("Per-Config Hazard Rate", &ml.perConfigHazardRate);
    ImGui::End();
}

void ControlPanel::historyWindow(Session& session) {
    RuleHistory& history = session.history;

    ImGui::SetNextWindowPos(ImVec2(630, 520), ImGuiCond_FirstUseEver);
    ImGui::SetNextWindowSize(ImVec2(260, 300), ImGuiCond_FirstUseEver);
    ImGui::Begin("Rule History");

    if (ImGui::Button("Undo")) session.undoRule();

    // The entry an active history preview pushed is not listed
    size_t count = history.size();
    if (session.preview().active() && count > 0) count--;

    int deleteIndex = -1;
    for (size_t n = 0; n < count; n++) {
        size_t i = count - 1 - n;  // newest first
        const Rule& r = history.at(i);
        char label[64];
        snprintf(label, sizeof(label), "#%zu  %+.2f %+.2f %+.2f", i, r.frequency(0)[0], r.frequency(0)[1],
                 r.amplitude(0)[0]);
        ImGui::PushID((int)i);
        if (ImGui::SmallButton("x")) deleteIndex = (int)i;
        ImGui::SameLine();
        if (ImGui::Selectable(label, i + 1 == count)) {
            session.loadHistoryEntry(i);
            m_previewKey.clear();
            ImGui::PopID();
            break;
        } else if (ImGui::IsItemHovered()) {
            hoverHistory(session, i);
        }
        ImGui::PopID();
    }
    if (deleteIndex >= 0) {
        session.deleteHistoryEntry((size_t)deleteIndex);
        m_previewKey.clear();
    }
    ImGui::End();
}

void ControlPanel::hoverPreset(Session& session, const std::string& name) {
    m_hoveredThisFrame = true;
    std::string key = "preset:" + name;
    if (key == m_previewKey && session.preview().active()) return;
    session.previewPreset(name);
    m_previewKey = key;
}

void ControlPanel::hoverHistory(Session& session, size_t index) {
    m_hoveredThisFrame = true;
    std::string key = "history:" + std::to_string(index);
    if (key == m_previewKey && session.preview().active()) return;
    session.previewHistoryEntry(index);
    m_previewKey = key;
}
