#pragma once

#include "facet/core/types.hpp"
#include "facet/core/string.hpp"
#include <optional>

namespace facet::css {

// ============================================================================
// Direction-aware declarations
// ============================================================================
//
// Legacy logical names (margin-start, padding-end, border-top-start-radius,
// start/end insets) and the logical values of float, clear and
// background-position have no native CSS meaning. They are emitted as their
// left-to-right physical form, plus an override for html[dir="rtl"].

struct Declaration {
    String property;
    String value;

    [[nodiscard]] bool operator==(const Declaration& other) const = default;
};

// The declaration as written for left-to-right documents
[[nodiscard]] Declaration to_ltr(const String& property, const String& value);

// The right-to-left override, if the declaration depends on direction
[[nodiscard]] std::optional<Declaration> to_rtl(const String& property, const String& value);

} // namespace facet::css
