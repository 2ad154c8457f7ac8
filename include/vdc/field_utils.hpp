#pragma once

/// @file include/vdc/field_utils.hpp
/// @brief FieldUtils: field lookup by name across a type hierarchy.
///
/// # Module: FieldUtils
///
/// ## Lookup Order
///   1. The type itself, then each superclass, most-derived first.  At each
///      level only fields declared on exactly that type are considered.
///      A public match wins at once.  A non-public match wins only when
///      access is forced; otherwise that level is skipped and the walk goes
///      on, so a private field never hides a public one further up.
///   2. Failing that, every interface from `ClassUtils::all_interfaces` is
///      checked for a public field declared on it.  One match wins; two or
///      more are ambiguous, since no priority exists between unrelated
///      interfaces.
///
/// Classes are searched at every visibility, interfaces only at public.
/// That asymmetry mirrors the host object model's member resolution.
///
/// ## Outcomes
/// `resolve_field` returns a tagged `FieldLookup`.  `get_field` collapses it
/// to `std::optional`, throwing `AmbiguousMember` for the ambiguous case.
/// "Not found" is never an error.

#include "vdc/reflect.hpp"

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace vdc::reflect {

// ─── FieldLookup ──────────────────────────────────────────────────────────────

/// The field was found.  `field.accessible` is set when access was forced on
/// a non-public field.
struct FieldFound {
    FieldDescriptor field;
};

/// No declared or interface field has the requested name.
struct FieldNotFound {};

/// Two or more interfaces declare a public field with the requested name.
struct FieldAmbiguous {
    std::vector<FieldDescriptor> candidates;  ///< In interface discovery order
};

using FieldLookup = std::variant<FieldFound, FieldNotFound, FieldAmbiguous>;

// ─── FieldUtils ───────────────────────────────────────────────────────────────

class FieldUtils {
public:
    FieldUtils() = delete;

    /// Look up `field_name` on `type`, its superclasses and its interfaces.
    ///
    /// # Arguments
    /// * `type`         — type to search, must not be null
    /// * `field_name`   — field to find, must not be blank
    /// * `force_access` — also match non-public superclass-chain fields
    ///
    /// # Throws
    /// `InvalidArgument` if `type` is null or `field_name` is blank.
    [[nodiscard]] static FieldLookup
    resolve_field(const TypeDescriptor* type,
                  std::string_view      field_name,
                  bool                  force_access);

    /// `resolve_field`, unwrapped.
    ///
    /// # Returns
    /// The field, or `nullopt` when nothing matches.
    ///
    /// # Throws
    /// `InvalidArgument` on a bad argument; `AmbiguousMember` when the name
    /// matches on two or more implemented interfaces.
    [[nodiscard]] static std::optional<FieldDescriptor>
    get_field(const TypeDescriptor* type,
              std::string_view      field_name,
              bool                  force_access);

    /// Field declared on exactly `type`, ignoring superclasses and interfaces.
    /// A non-public field is only returned when `force_access` is true.
    ///
    /// # Throws
    /// `InvalidArgument` if `type` is null or `field_name` is blank.
    [[nodiscard]] static std::optional<FieldDescriptor>
    get_declared_field(const TypeDescriptor* type,
                       std::string_view      field_name,
                       bool                  force_access);
};

} // namespace vdc::reflect
