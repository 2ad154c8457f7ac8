#pragma once

/// @file include/vdc/errors.hpp
/// @brief Exception types thrown by the vdc-common utilities.
///
/// A "not found" field lookup is not an error and has no exception type here;
/// it is reported as an empty result.

#include <fmt/core.h>

#include <stdexcept>
#include <string>

namespace vdc {

/// Text does not match a fixed date/date-time pattern, or a value cannot be
/// represented by one.
class FormatError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// Construct with the offending text and the pattern it was checked
    /// against.  The message reads `Text '<text>' could not be parsed as
    /// <pattern>: <reason>`.
    FormatError(const std::string& text,
                const std::string& pattern,
                const std::string& reason)
        : std::runtime_error(fmt::format("Text '{}' could not be parsed as {}: {}",
                                         text, pattern, reason)) {}
};

/// A precondition on an argument was violated.
class InvalidArgument : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// A member name matched on two or more unrelated interfaces.
class AmbiguousMember : public InvalidArgument {
public:
    using InvalidArgument::InvalidArgument;
};

} // namespace vdc
