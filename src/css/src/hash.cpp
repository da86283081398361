/**
 * Content hashing and identifier generation
 */

#include "facet/css/hash.hpp"
#include "facet/css/pseudo.hpp"
#include <algorithm>

namespace facet::css {

namespace {

constexpr u32 MURMUR_M = 0x5bd1e995;

String sorted_at_rules(std::vector<String> at_rules) {
    std::sort(at_rules.begin(), at_rules.end());
    return join(at_rules, "");
}

} // anonymous namespace

// ============================================================================
// MurmurHash2
// ============================================================================

u32 murmurhash2_32(std::string_view data, u32 seed) {
    auto length = static_cast<u32>(data.size());
    u32 h = seed ^ length;
    usize i = 0;

    while (length >= 4) {
        u32 k = static_cast<u32>(static_cast<u8>(data[i])) |
                (static_cast<u32>(static_cast<u8>(data[i + 1])) << 8) |
                (static_cast<u32>(static_cast<u8>(data[i + 2])) << 16) |
                (static_cast<u32>(static_cast<u8>(data[i + 3])) << 24);

        k *= MURMUR_M;
        k ^= k >> 24;
        k *= MURMUR_M;

        h = (h * MURMUR_M) ^ k;

        length -= 4;
        i += 4;
    }

    switch (length) {
        case 3:
            h ^= static_cast<u32>(static_cast<u8>(data[i + 2])) << 16;
            [[fallthrough]];
        case 2:
            h ^= static_cast<u32>(static_cast<u8>(data[i + 1])) << 8;
            [[fallthrough]];
        case 1:
            h ^= static_cast<u32>(static_cast<u8>(data[i]));
            h *= MURMUR_M;
            break;
        default:
            break;
    }

    h ^= h >> 13;
    h *= MURMUR_M;
    h ^= h >> 15;

    return h;
}

String to_base36(u32 value) {
    static constexpr const char* DIGITS = "0123456789abcdefghijklmnopqrstuvwxyz";

    if (value == 0) {
        return "0"_s;
    }

    char buffer[8];
    usize pos = sizeof(buffer);
    while (value > 0) {
        buffer[--pos] = DIGITS[value % 36];
        value /= 36;
    }
    return String(buffer + pos, sizeof(buffer) - pos);
}

String create_hash(std::string_view input) {
    return to_base36(murmurhash2_32(input, 1));
}

// ============================================================================
// Identifier builders
// ============================================================================

String atomic_class_name(const CompilerConfig& config,
                         const String& property,
                         const String& value,
                         const std::vector<String>& pseudos,
                         const std::vector<String>& at_rules) {
    String modifier = join(sort_pseudos(pseudos), "") + sorted_at_rules(at_rules);
    if (modifier.empty()) {
        modifier = "null"_s;
    }

    StringBuilder input;
    input.append("<>").append(property).append(value).append(modifier);
    String hash = create_hash(input.view());

    if (config.debug_class_names) {
        return property + "-"_s + config.class_name_prefix + hash;
    }
    return config.class_name_prefix + hash;
}

String var_name(const String& group, const String& name) {
    StringBuilder input;
    input.append("var:").append(group).append('.').append(name);
    return "--v"_s + create_hash(input.view());
}

String theme_class_name(const String& group, const String& theme) {
    StringBuilder input;
    input.append("theme:").append(group).append('.').append(theme);
    return "t"_s + create_hash(input.view());
}

String keyframes_name(const CompilerConfig& config, const String& frames) {
    return config.class_name_prefix + create_hash(("<>"_s + frames).view()) + "-B"_s;
}

String marker_class_name(const CompilerConfig& config, const String& name) {
    return config.class_name_prefix + create_hash(("marker:"_s + name).view());
}

String position_try_name(const CompilerConfig& config, const String& declarations) {
    return "--"_s + config.class_name_prefix + create_hash(declarations.view());
}

String view_transition_class_name(const CompilerConfig& config, const String& css) {
    return config.class_name_prefix + create_hash(css.view());
}

String dynamic_var_name(const CompilerConfig& config, const String& property) {
    return "--"_s + config.class_name_prefix + "-"_s + property;
}

} // namespace facet::css
