#pragma once
#include "rule.h"
#include <deque>
#include <optional>

constexpr size_t kMaxRuleHistory = 200;

// Undo stack of rules. The tail is the active rule; an empty history means the zero rule.
class RuleHistory {
public:
    // Appends `rule`. Returns the oldest entry when the cap forced it out.
    std::optional<Rule> push(const Rule& rule);
    void pushZeroRule() { push(Rule{}); }
    // Restores an entry at the oldest end, used to undo a capped push
    void pushFront(const Rule& rule);

    // Drops the tail and returns the new one. Returns nullopt ("use the zero rule")
    // when the last entry was just removed or the history was already empty.
    std::optional<Rule> pop();

    std::optional<Rule> current() const;
    // Active rule, zero when empty
    Rule currentOrZero() const;

    // Removes entry i and returns it
    std::optional<Rule> take(size_t i);
    const Rule& at(size_t i) const { return m_rules[i]; }

    size_t size() const { return m_rules.size(); }
    bool empty() const { return m_rules.empty(); }
    void clear() { m_rules.clear(); }

private:
    std::deque<Rule> m_rules;
};
