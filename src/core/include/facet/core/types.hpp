#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace facet {

// ============================================================================
// Basic type aliases
// ============================================================================

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using f32 = float;
using f64 = double;

using usize = std::size_t;
using isize = std::ptrdiff_t;

// ============================================================================
// Result
// ============================================================================

// Wraps an error so that Result<T, E> can tell it from a value
template<typename E>
struct Error {
    E value;

    explicit Error(E e) : value(std::move(e)) {}
};

template<typename E>
[[nodiscard]] Error<std::decay_t<E>> make_error(E&& e) {
    return Error<std::decay_t<E>>(std::forward<E>(e));
}

/**
 * Value or error. Compilation failures travel as values:
 *
 *   CompileResult<String> compile(...) {
 *       if (bad) return make_error(CompileError(ErrorKind::InvalidValue, "..."));
 *       return css;
 *   }
 *
 * T and E may be the same type; make_error decides which side is set.
 */
template<typename T, typename E>
class Result {
public:
    using ValueType = T;
    using ErrorType = E;

    template<typename U = T,
             typename = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Result> &&
                                         !std::is_same_v<std::decay_t<U>, Error<E>>>>
    Result(U&& value) : m_state(std::in_place_index<0>, std::forward<U>(value)) {}

    Result(Error<E> error) : m_state(std::in_place_index<1>, std::move(error.value)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_state.index() == 1; }
    [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] T& value() & { return std::get<0>(m_state); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_state); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_state)); }

    [[nodiscard]] E& error() & { return std::get<1>(m_state); }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_state); }
    [[nodiscard]] E&& error() && { return std::get<1>(std::move(m_state)); }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(m_state) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(m_state)) : std::move(fallback);
    }

    // Transforms the value, passing an error through unchanged
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        if (is_err()) {
            return make_error(error());
        }
        return std::invoke(std::forward<F>(f), value());
    }

    // Chains a step that can fail itself
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        if (is_err()) {
            return make_error(error());
        }
        return std::invoke(std::forward<F>(f), value());
    }

    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        if (is_ok()) {
            return value();
        }
        return make_error(std::invoke(std::forward<F>(f), error()));
    }

private:
    std::variant<T, E> m_state;
};

// Success carries nothing; a default constructed Result<void, E> is ok
template<typename E>
class Result<void, E> {
public:
    using ValueType = void;
    using ErrorType = E;

    Result() = default;
    Result(Error<E> error) : m_error(std::move(error.value)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error; }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }
    [[nodiscard]] E&& error() && { return std::move(*m_error); }

private:
    std::optional<E> m_error;
};

} // namespace facet
