#pragma once

/// @file include/vdc/validate.hpp
/// @brief Argument validation helpers that throw formatted exceptions.
///
/// # Module: Validate
///
/// ## Responsibility
/// Check a caller-supplied precondition and, when it does not hold, throw
/// `vdc::InvalidArgument` whose message is a printf-style template with the
/// arguments substituted positionally:
/// ```
/// validate::is_true(i > 0, "The value must be greater than zero: %d", i);
/// validate::is_true(lo <= hi, "The range %d..%d is empty", lo, hi);
/// ```
///
/// ## Guarantees
/// - The message is formatted only on failure
/// - No effect at all when the condition holds
/// - Thread-safe: no state

#include "vdc/errors.hpp"

#include <fmt/printf.h>

#include <string_view>

namespace vdc::validate {

/// True if `text` is empty or consists only of whitespace.
[[nodiscard]] bool is_blank(std::string_view text) noexcept;

/// Throw `InvalidArgument` with `message` formatted against `values` unless
/// `expression` is true.
///
/// `message` follows sprintf conversion rules (`%d`, `%s`, `%.2f`, `%%`).
/// A single scalar and a full argument list share this one form.
template <typename... Args>
void is_true(bool expression, std::string_view message, const Args&... values) {
    if (!expression) {
        throw InvalidArgument(fmt::sprintf(message, values...));
    }
}

/// Throw `InvalidArgument` unless `pointer` is non-null; returns `pointer`.
template <typename T, typename... Args>
T* not_null(T* pointer, std::string_view message, const Args&... values) {
    is_true(pointer != nullptr, message, values...);
    return pointer;
}

/// Throw `InvalidArgument` if `text` is blank; returns `text`.
template <typename... Args>
std::string_view not_blank(std::string_view text,
                           std::string_view message,
                           const Args&... values) {
    is_true(!is_blank(text), message, values...);
    return text;
}

} // namespace vdc::validate
