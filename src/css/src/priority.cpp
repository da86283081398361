/**
 * Cascade priority calculation
 */

#include "facet/css/priority.hpp"
#include "facet/css/property.hpp"
#include "facet/css/pseudo.hpp"

namespace facet::css {

i32 property_priority(const String& property) {
    switch (property_category(property)) {
        case PropertyCategory::CustomProperty:        return 1;
        case PropertyCategory::ShorthandOfShorthands: return 1000;
        case PropertyCategory::ShorthandOfLonghands:  return 2000;
        case PropertyCategory::Longhand:              return 3000;
    }
    return 3000;
}

i32 at_rule_priority(const String& at_rule) {
    if (at_rule.starts_with("@supports"_s)) return 30;
    if (at_rule.starts_with("@media"_s)) return 200;
    if (at_rule.starts_with("@container"_s)) return 300;
    return 0;
}

i32 calculate_priority(const String& property,
                       const std::vector<String>& pseudos,
                       const std::vector<String>& at_rules) {
    i32 priority = property_priority(property);

    for (const auto& pseudo : pseudos) {
        priority += pseudo_priority(pseudo);
    }

    for (const auto& at_rule : at_rules) {
        priority += at_rule_priority(at_rule);
    }
    return priority;
}

} // namespace facet::css
