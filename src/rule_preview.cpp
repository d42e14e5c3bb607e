#include "rule_preview.h"

Rule RulePreview::begin(PreviewSource source, const Rule& rule) {
    end();
    m_dropped = m_history.push(rule);
    m_source = source;
    m_rule = rule;
    return rule;
}

std::optional<Rule> RulePreview::end() {
    if (!active()) return std::nullopt;
    m_source = PreviewSource::None;
    Rule restored = m_history.pop().value_or(Rule{});
    if (m_dropped) {
        m_history.pushFront(*m_dropped);
        m_dropped.reset();
    }
    return restored;
}

void RulePreview::commit() {
    m_source = PreviewSource::None;
    m_dropped.reset();
}
