/// @file src/validate/validate.cpp
/// @brief Non-template parts of the validation helpers.

#include "vdc/validate.hpp"

namespace vdc::validate {

bool is_blank(std::string_view text) noexcept {
    return text.find_first_not_of(" \t\r\n\f\v") == std::string_view::npos;
}

} // namespace vdc::validate
