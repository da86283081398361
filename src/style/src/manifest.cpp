/**
 * Manifest merging
 */

#include "facet/style/manifest.hpp"

namespace facet::style {

namespace {

template<typename Entry>
void merge_into(std::map<String, Entry>& target, const std::map<String, Entry>& source) {
    for (const auto& [key, entry] : source) {
        target[key] = entry;
    }
}

} // anonymous namespace

void Manifest::merge(const Manifest& other) {
    merge_into(m_vars, other.m_vars);
    merge_into(m_consts, other.m_consts);
    merge_into(m_classes, other.m_classes);
    merge_into(m_themes, other.m_themes);
    merge_into(m_keyframes, other.m_keyframes);
    merge_into(m_position_try, other.m_position_try);
    merge_into(m_view_transitions, other.m_view_transitions);
}

void Manifest::clear() {
    m_vars.clear();
    m_consts.clear();
    m_classes.clear();
    m_themes.clear();
    m_keyframes.clear();
    m_position_try.clear();
    m_view_transitions.clear();
}

bool Manifest::empty() const {
    return m_vars.empty() && m_consts.empty() && m_classes.empty() && m_themes.empty() &&
           m_keyframes.empty() && m_position_try.empty() && m_view_transitions.empty();
}

} // namespace facet::style
