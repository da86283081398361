#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include "facet/style/atomic_class.hpp"
#include "facet/style/structural.hpp"
#include "facet/style/vars.hpp"
#include <map>

namespace facet::style {

// ============================================================================
// Manifest - every compiled artifact of a build
// ============================================================================

/**
 * Compiled artifacts keyed by dotted name:
 *
 *   vars, consts      "<module>.<namespace>.<name>"
 *   classes           "<module>.<rule>"
 *   themes, keyframes, position_try, view_transitions
 *                     "<module>.<name>"
 *
 * Each category is an ordered map, so iteration (and therefore the emitted
 * stylesheet) never depends on registration order.
 */
class Manifest {
public:
    Manifest() = default;

    // Registration; an existing key is replaced
    void put_var(String key, VarEntry entry) { m_vars[std::move(key)] = std::move(entry); }
    void put_const(String key, ConstEntry entry) { m_consts[std::move(key)] = std::move(entry); }
    void put_class(String key, ClassRule rule) { m_classes[std::move(key)] = std::move(rule); }
    void put_theme(String key, ThemeEntry entry) { m_themes[std::move(key)] = std::move(entry); }
    void put_keyframes(String key, KeyframesEntry entry) { m_keyframes[std::move(key)] = std::move(entry); }
    void put_position_try(String key, PositionTryEntry entry) {
        m_position_try[std::move(key)] = std::move(entry);
    }
    void put_view_transition(String key, ViewTransitionEntry entry) {
        m_view_transitions[std::move(key)] = std::move(entry);
    }

    // Lookup; nullptr when absent
    [[nodiscard]] const VarEntry* find_var(const String& key) const { return find_in(m_vars, key); }
    [[nodiscard]] const ConstEntry* find_const(const String& key) const { return find_in(m_consts, key); }
    [[nodiscard]] const ClassRule* find_class(const String& key) const { return find_in(m_classes, key); }
    [[nodiscard]] const ThemeEntry* find_theme(const String& key) const { return find_in(m_themes, key); }
    [[nodiscard]] const KeyframesEntry* find_keyframes(const String& key) const {
        return find_in(m_keyframes, key);
    }
    [[nodiscard]] const PositionTryEntry* find_position_try(const String& key) const {
        return find_in(m_position_try, key);
    }
    [[nodiscard]] const ViewTransitionEntry* find_view_transition(const String& key) const {
        return find_in(m_view_transitions, key);
    }

    [[nodiscard]] const std::map<String, VarEntry>& vars() const { return m_vars; }
    [[nodiscard]] const std::map<String, ConstEntry>& consts() const { return m_consts; }
    [[nodiscard]] const std::map<String, ClassRule>& classes() const { return m_classes; }
    [[nodiscard]] const std::map<String, ThemeEntry>& themes() const { return m_themes; }
    [[nodiscard]] const std::map<String, KeyframesEntry>& keyframes() const { return m_keyframes; }
    [[nodiscard]] const std::map<String, PositionTryEntry>& position_try() const { return m_position_try; }
    [[nodiscard]] const std::map<String, ViewTransitionEntry>& view_transitions() const {
        return m_view_transitions;
    }

    // Union of both manifests; entries of `other` win on equal keys
    void merge(const Manifest& other);

    void clear();
    [[nodiscard]] bool empty() const;

    [[nodiscard]] bool operator==(const Manifest& other) const = default;

private:
    template<typename Entry>
    static const Entry* find_in(const std::map<String, Entry>& map, const String& key) {
        auto it = map.find(key);
        return it == map.end() ? nullptr : &it->second;
    }

    std::map<String, VarEntry> m_vars;
    std::map<String, ConstEntry> m_consts;
    std::map<String, ClassRule> m_classes;
    std::map<String, ThemeEntry> m_themes;
    std::map<String, KeyframesEntry> m_keyframes;
    std::map<String, PositionTryEntry> m_position_try;
    std::map<String, ViewTransitionEntry> m_view_transitions;
};

} // namespace facet::style
