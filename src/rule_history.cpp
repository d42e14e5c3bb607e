#include "rule_history.h"

std::optional<Rule> RuleHistory::push(const Rule& rule) {
    m_rules.push_back(rule);
    if (m_rules.size() <= kMaxRuleHistory) return std::nullopt;
    Rule dropped = m_rules.front();
    m_rules.pop_front();
    return dropped;
}

void RuleHistory::pushFront(const Rule& rule) {
    m_rules.push_front(rule);
}

std::optional<Rule> RuleHistory::pop() {
    if (m_rules.size() > 1) {
        m_rules.pop_back();
        return m_rules.back();
    }
    m_rules.clear();
    return std::nullopt;
}

std::optional<Rule> RuleHistory::current() const {
    if (m_rules.empty()) return std::nullopt;
    return m_rules.back();
}

Rule RuleHistory::currentOrZero() const {
    return m_rules.empty() ? Rule{} : m_rules.back();
}

std::optional<Rule> RuleHistory::take(size_t i) {
    if (i >= m_rules.size()) return std::nullopt;
    Rule r = m_rules[i];
    m_rules.erase(m_rules.begin() + (long)i);
    return r;
}
