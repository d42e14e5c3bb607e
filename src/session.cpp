#include "session.h"
#include "config_codec.h"
#include <algorithm>

void Session::reset() {
    m_sim.reset();
}

void Session::fullReset() {
    endPreview();
    m_sim.reset();
    history.pushZeroRule();
    applyRule(Rule{});
}

void Session::pushRule(const Rule& rule) {
    endPreview();
    history.push(rule);
    applyRule(rule);
}

void Session::undoRule() {
    endPreview();
    applyRule(history.pop().value_or(Rule{}));
}

void Session::randomizeRule(float seed) {
    pushRule(generateRandomCenters(seed));
}

void Session::onLeftClick(float u, float v) {
    PhysicsConfig& c = state.config;
    float worldX = u * 2.0f - 1.0f;
    float worldY = v * 2.0f - 1.0f;

    if (c.sweepsEnabled) {
        if (!c.hasActiveXYSweep()) return;
        float cohort = 0.0f;
        if (c.hasActiveCohortSweep()) {
            auto hit = m_sim.pickNearest(u, v);
            if (hit) cohort = hit->cohort;
        }
        c.applyEffectiveValues(worldX, worldY, cohort);
        return;
    }

    if (prefs.mouseMode != MouseMode::SelectEntity) return;

    auto hit = m_sim.pickNearest(u, v);
    if (!hit) {
        m_diag.info("pick: no entity near (%.3f, %.3f)", u, v);
        return;
    }
    auto rule = m_sim.readbackRule(hit->index);
    if (!rule) return;

    m_diag.info("Entity %u at (%.3f, %.3f), cohort %.3f", hit->index, hit->worldX, hit->worldY, hit->cohort);
    pushRule(*rule);
    // The rule was evolved under these swept values, so keep them with it
    c.applyEffectiveValues(hit->worldX, hit->worldY, hit->cohort);
}

void Session::onRightClick() {
    PhysicsConfig& c = state.config;
    if (c.sweepsEnabled) {
        if (c.hasActiveXYSweep()) {
            c.sweepsEnabled = false;
            m_sweepPreviewPending = true;
        }
        return;
    }
    if (prefs.mouseMode == MouseMode::SelectEntity) undoRule();
}

bool Session::consumeSweepPreviewRestore() {
    if (!m_sweepPreviewPending) return false;
    state.config.sweepsEnabled = true;
    m_sweepPreviewPending = false;
    return true;
}

PhysicsConfig Session::currentConfig() const {
    PhysicsConfig c = state.config;
    c.rule = history.currentOrZero();
    return c;
}

void Session::applyConfigState(const PhysicsConfig& config) {
    bool watercolor = state.config.watercolor;
    state.config = config;
    if (keepWatercolorOnLoad) state.config.watercolor = watercolor;
    m_sweepPreviewPending = false;
}

void Session::applyConfig(const PhysicsConfig& config) {
    applyConfigState(config);
    pushRule(config.rule);
}

bool Session::savePreset(const std::string& name) {
    if (name.empty()) return false;
    bool ok = saveConfigFile(presetPath(name), currentConfig());
    if (ok) m_diag.info("Saved preset %s", name.c_str());
    else m_diag.error("Could not save preset %s", name.c_str());
    return ok;
}

bool Session::loadPreset(const std::string& name) {
    auto config = loadConfigFile(presetPath(name));
    if (!config) {
        m_diag.error("Could not load preset %s", name.c_str());
        return false;
    }
    if (m_preview.active() && m_preview.source() == PreviewSource::ConfigFile &&
        m_preview.previewedRule() == config->rule) {
        // The hovered preview already pushed this rule
        m_preview.commit();
        syncPreviewFlag();
        applyConfigState(*config);
        applyRule(config->rule);
    } else {
        endPreview();
        applyConfig(*config);
    }
    m_diag.info("Loaded preset %s", name.c_str());
    return true;
}

bool Session::addPresetToMultiLoad(const std::string& name) {
    auto config = loadConfigFile(presetPath(name));
    if (!config) {
        m_diag.error("Could not load preset %s", name.c_str());
        return false;
    }
    return multiLoad.addConfig(*config, name);
}

void Session::previewPreset(const std::string& name) {
    auto config = loadConfigFile(presetPath(name));
    if (!config) return;
    applyRule(m_preview.begin(PreviewSource::ConfigFile, config->rule));
    syncPreviewFlag();
}

void Session::previewHistoryEntry(size_t index) {
    if (index >= history.size()) return;
    Rule rule = history.at(index);
    applyRule(m_preview.begin(PreviewSource::History, rule));
    syncPreviewFlag();
}

void Session::endPreview() {
    if (auto rule = m_preview.end()) applyRule(*rule);
    syncPreviewFlag();
}

void Session::loadHistoryEntry(size_t index) {
    endPreview();
    auto rule = history.take(index);
    if (rule) pushRule(*rule);
}

void Session::deleteHistoryEntry(size_t index) {
    endPreview();
    if (history.take(index)) applyRule(history.currentOrZero());
}

std::string Session::copyConfig() const {
    std::string text = encodeClipboard(currentConfig());
    m_diag.info("Config copied to clipboard (%zu chars)", text.size());
    return text;
}

bool Session::pasteConfig(const std::string& text) {
    auto config = decodeClipboard(text);
    if (!config) {
        m_diag.error("Clipboard does not hold a config");
        return false;
    }
    endPreview();
    applyConfig(*config);
    m_diag.info("Config loaded from clipboard");
    return true;
}

void Session::setWorldSize(float worldSize) {
    prefs.worldSize = std::clamp(worldSize, kMinWorldSize, kMaxWorldSize);
    if (prefs.worldSize == m_sim.worldSize()) return;
    m_sim.resize(prefs.worldSize);
    // Resize recreates the multi-load buffers empty
    multiLoad.markDirty();
}
