/**
 * Declared value tree
 */

#include "facet/style/style_value.hpp"

namespace facet::style {

bool StyleValue::is_condition_map() const {
    if (m_kind != ValueKind::Conditional || m_keys.empty()) {
        return false;
    }
    for (const auto& key : m_keys) {
        if (key != "default"_s && !key.starts_with(":"_s) && !key.starts_with("@"_s)) {
            return false;
        }
    }
    return true;
}

const StyleValue* StyleValue::find(const String& key) const {
    if (m_kind != ValueKind::Conditional) {
        return nullptr;
    }
    for (usize i = 0; i < m_keys.size(); ++i) {
        if (m_keys[i] == key) {
            return &m_items[i];
        }
    }
    return nullptr;
}

} // namespace facet::style
