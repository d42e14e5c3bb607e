#pragma once
#include "session.h"
#include <string>
#include <vector>

// Requests the panel can't carry out itself; main handles them after the UI pass.
struct PanelActions {
    bool exportFrame = false;
    bool toggleRecording = false;
    bool reloadShaders = false;
    bool stepOnce = false;
};

// Status the panel shows but doesn't own
struct PanelStatus {
    float fps = 0.0f;
    uint32_t entityCount = 0;
    uint32_t canvasDim = 0;
    uint32_t tick = 0;
    bool recording = false;
    int recordedFrames = 0;
    int pendingWrites = 0;
    int failedWrites = 0;
    std::string recordDir;
};

class ControlPanel {
public:
    PanelActions draw(Session& session, const PanelStatus& status);

private:
    void simulationWindow(Session& session, const PanelStatus& status, PanelActions& actions);
    void physicsWindow(Session& session);
    void appearanceSection(PhysicsConfig& c);
    void presetsWindow(Session& session);
    void multiLoadWindow(Session& session);
    void historyWindow(Session& session);

    // Hovered preview bookkeeping: a preview ends on the first frame nothing is hovered
    void hoverPreset(Session& session, const std::string& name);
    void hoverHistory(Session& session, size_t index);

    std::string m_previewKey;
    bool m_hoveredThisFrame = false;
    std::vector<std::string> m_presets;
    bool m_presetsStale = true;
    char m_presetName[64] = "untitled";
    float m_pendingWorldSize = 1.0f;
};
