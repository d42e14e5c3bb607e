#pragma once
#include "diagnostics.h"
#include "multi_load.h"
#include "physics_config.h"
#include "preferences.h"
#include "rule_history.h"
#include "rule_preview.h"
#include "sim_state.h"
#include "simulation.h"
#include <string>

// Application state and the user actions that change it. The control panel and the
// input handlers call into this; the main loop snapshots `state` once per tick.
class Session {
public:
    Session(Simulation& sim, Diagnostics& diag) : m_sim(sim), m_diag(diag), m_preview(history) {}

    SimState state;
    Preferences prefs;
    MultiLoadRegistry multiLoad;
    RuleHistory history;

    bool paused = false;
    bool keepWatercolorOnLoad = false;

    RulePreview& preview() { return m_preview; }

    // R: clear the field, keep the rule. Z: also push the zero rule (undoable).
    void reset();
    void fullReset();

    void pushRule(const Rule& rule);
    // Back to the previous rule; the zero rule once history runs out
    void undoRule();
    void randomizeRule(float seed);

    // Left click at canvas UV. With spatial sweeps active this bakes the swept values at the
    // click into the sliders; otherwise (select mode) it adopts the nearest entity's rule.
    void onLeftClick(float u, float v);
    // Right click: temporarily disables sweeps (preview) or undoes the last rule.
    void onRightClick();
    // Any click while a sweep preview is pending turns sweeps back on and is consumed.
    bool consumeSweepPreviewRestore();
    bool sweepPreviewPending() const { return m_sweepPreviewPending; }

    // Config snapshot including the active rule
    PhysicsConfig currentConfig() const;
    void applyConfig(const PhysicsConfig& config);

    bool savePreset(const std::string& name);
    bool loadPreset(const std::string& name);
    bool addPresetToMultiLoad(const std::string& name);

    void previewPreset(const std::string& name);
    void previewHistoryEntry(size_t index);
    void endPreview();
    // Moves an entry to the top of the history and activates it
    void loadHistoryEntry(size_t index);
    void deleteHistoryEntry(size_t index);

    std::string copyConfig() const;
    bool pasteConfig(const std::string& text);

    void setWorldSize(float worldSize);

private:
    void applyConfigState(const PhysicsConfig& config);
    void applyRule(const Rule& rule) { m_sim.applyRule(rule); }
    void syncPreviewFlag() { state.previewActive = m_preview.active(); }

    Simulation& m_sim;
    Diagnostics& m_diag;
    RulePreview m_preview;
    bool m_sweepPreviewPending = false;
};
