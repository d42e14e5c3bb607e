#pragma once
#include "rule_history.h"

enum class PreviewSource { None, ConfigFile, History };

// Temporary rule shown while the user hovers a preset or a history entry.
// Owns the push/pop pairing on the history so a preview can never be left on the stack.
class RulePreview {
public:
    explicit RulePreview(RuleHistory& history) : m_history(history) {}

    // Ends any active preview, then pushes `rule`. Returns the rule to apply.
    Rule begin(PreviewSource source, const Rule& rule);

    // Pops the preview if one is active. Returns the rule to apply afterwards,
    // or nullopt when nothing changed.
    std::optional<Rule> end();

    // Keeps the previewed rule as a real history entry.
    void commit();

    bool active() const { return m_source != PreviewSource::None; }
    PreviewSource source() const { return m_source; }
    const Rule& previewedRule() const { return m_rule; }

private:
    RuleHistory& m_history;
    PreviewSource m_source = PreviewSource::None;
    Rule m_rule;
    // Entry the preview push evicted from a full history
    std::optional<Rule> m_dropped;
};
