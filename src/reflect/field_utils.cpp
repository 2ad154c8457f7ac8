/// @file src/reflect/field_utils.cpp
/// @brief FieldUtils: superclass-then-interface field resolution.

#include "vdc/field_utils.hpp"
#include "vdc/class_utils.hpp"
#include "vdc/errors.hpp"
#include "vdc/validate.hpp"

#include <fmt/printf.h>

#include <string>

namespace vdc::reflect {

namespace {

void check_arguments(const TypeDescriptor* type, std::string_view field_name) {
    validate::is_true(type != nullptr, "The class must not be null");
    validate::not_blank(field_name, "The field name must not be blank/empty");
}

/// Declared field on `type` if it is usable under `force_access`, as the
/// copy handed back to the caller.
std::optional<FieldDescriptor>
usable_declared_field(const TypeDescriptor& type,
                      std::string_view      field_name,
                      bool                  force_access) {
    const FieldDescriptor* field = type.find_declared_field(field_name);
    if (field == nullptr) {
        return std::nullopt;
    }
    FieldDescriptor copy = *field;
    if (!copy.is_public()) {
        if (!force_access) {
            return std::nullopt;
        }
        copy.accessible = true;
    }
    return copy;
}

} // anonymous namespace

// ─── FieldUtils::resolve_field ────────────────────────────────────────────────

FieldLookup FieldUtils::resolve_field(const TypeDescriptor* type,
                                      std::string_view      field_name,
                                      bool                  force_access) {
    check_arguments(type, field_name);

    // Superclass chain: declared fields at any visibility.
    for (const TypeDescriptor* level = type; level != nullptr;
         level = level->superclass()) {
        if (auto field = usable_declared_field(*level, field_name, force_access)) {
            return FieldFound{std::move(*field)};
        }
    }

    // Interfaces of the whole hierarchy: public fields only.
    const auto interfaces = ClassUtils::all_interfaces(type);
    std::vector<FieldDescriptor> matches;
    for (const TypeDescriptor* iface : interfaces.value()) {
        const FieldDescriptor* field = iface->find_declared_field(field_name);
        if (field != nullptr && field->is_public()) {
            matches.push_back(*field);
        }
    }

    if (matches.empty()) {
        return FieldNotFound{};
    }
    if (matches.size() == 1) {
        return FieldFound{std::move(matches.front())};
    }
    return FieldAmbiguous{std::move(matches)};
}

// ─── FieldUtils::get_field ────────────────────────────────────────────────────

std::optional<FieldDescriptor>
FieldUtils::get_field(const TypeDescriptor* type,
                      std::string_view      field_name,
                      bool                  force_access) {
    FieldLookup lookup = resolve_field(type, field_name, force_access);

    if (auto* found = std::get_if<FieldFound>(&lookup)) {
        return std::move(found->field);
    }
    if (std::holds_alternative<FieldAmbiguous>(lookup)) {
        throw AmbiguousMember(fmt::sprintf(
            "Reference to field %s is ambiguous relative to %s"
            "; a matching field exists on two or more implemented interfaces.",
            field_name, type->name()));
    }
    return std::nullopt;
}

// ─── FieldUtils::get_declared_field ───────────────────────────────────────────

std::optional<FieldDescriptor>
FieldUtils::get_declared_field(const TypeDescriptor* type,
                               std::string_view      field_name,
                               bool                  force_access) {
    check_arguments(type, field_name);
    return usable_declared_field(*type, field_name, force_access);
}

} // namespace vdc::reflect
