/// @file src/reflect/type_registry.cpp
/// @brief TypeRegistry: registration rules for the runtime type model.

#include "vdc/reflect.hpp"
#include "vdc/validate.hpp"

#include <algorithm>

namespace vdc::reflect {

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(Visibility v) noexcept {
    switch (v) {
        case Visibility::Public:    return "public";
        case Visibility::Protected: return "protected";
        case Visibility::Package:   return "package";
        case Visibility::Private:   return "private";
    }
    return "unknown";
}

const char* to_string(TypeKind k) noexcept {
    switch (k) {
        case TypeKind::Class:     return "class";
        case TypeKind::Interface: return "interface";
    }
    return "unknown";
}

// ─── TypeDescriptor ───────────────────────────────────────────────────────────

const FieldDescriptor*
TypeDescriptor::find_declared_field(std::string_view field_name) const noexcept {
    for (const auto& field : fields_) {
        if (field.name == field_name) {
            return &field;
        }
    }
    return nullptr;
}

// ─── TypeRegistry: definitions ────────────────────────────────────────────────

const TypeDescriptor&
TypeRegistry::define_interface(const std::string&              name,
                               const std::vector<std::string>& super_interfaces,
                               const std::vector<FieldSpec>&   fields) {
    auto type = create(name, TypeKind::Interface);
    add_interfaces(*type, super_interfaces);
    for (const auto& field : fields) {
        append_field(*type, field);
    }
    return commit(std::move(type));
}

const TypeDescriptor&
TypeRegistry::define_class(const std::string&              name,
                           const std::string&              superclass,
                           const std::vector<std::string>& interfaces,
                           const std::vector<FieldSpec>&   fields) {
    auto type = create(name, TypeKind::Class);

    if (!superclass.empty()) {
        const TypeDescriptor* parent = find(superclass);
        validate::is_true(parent != nullptr,
                          "Superclass %s of %s is not registered", superclass, name);
        validate::is_true(!parent->is_interface(),
                          "%s cannot extend interface %s", name, superclass);
        type->superclass_ = parent;
    }

    add_interfaces(*type, interfaces);
    for (const auto& field : fields) {
        append_field(*type, field);
    }
    return commit(std::move(type));
}

void TypeRegistry::add_field(const std::string& type_name, const FieldSpec& field) {
    auto it = std::find_if(types_.begin(), types_.end(),
                           [&](const auto& t) { return t->name() == type_name; });
    validate::is_true(it != types_.end(), "Type %s is not registered", type_name);
    append_field(**it, field);
}

// ─── TypeRegistry: lookup ─────────────────────────────────────────────────────

const TypeDescriptor* TypeRegistry::find(std::string_view name) const noexcept {
    for (const auto& type : types_) {
        if (type->name() == name) {
            return type.get();
        }
    }
    return nullptr;
}

const TypeDescriptor& TypeRegistry::get(std::string_view name) const {
    const TypeDescriptor* type = find(name);
    validate::is_true(type != nullptr, "Type %s is not registered", name);
    return *type;
}

std::vector<std::string> TypeRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(types_.size());
    for (const auto& type : types_) {
        out.push_back(type->name());
    }
    return out;
}

// ─── TypeRegistry: helpers ────────────────────────────────────────────────────

std::unique_ptr<TypeDescriptor>
TypeRegistry::create(const std::string& name, TypeKind kind) const {
    validate::not_blank(name, "The type name must not be blank/empty");
    validate::is_true(find(name) == nullptr, "Type %s is already registered", name);
    return std::make_unique<TypeDescriptor>(TypeDescriptor::Key{}, name, kind);
}

void TypeRegistry::add_interfaces(TypeDescriptor&                 type,
                                  const std::vector<std::string>& interface_names) const {
    for (const auto& iface_name : interface_names) {
        const TypeDescriptor* iface = find(iface_name);
        validate::is_true(iface != nullptr,
                          "Interface %s of %s is not registered", iface_name, type.name());
        validate::is_true(iface->is_interface(),
                          "%s cannot implement class %s", type.name(), iface_name);

        const bool duplicate = std::find(type.interfaces_.begin(),
                                         type.interfaces_.end(),
                                         iface) != type.interfaces_.end();
        validate::is_true(!duplicate,
                          "Interface %s is listed twice on %s", iface_name, type.name());
        type.interfaces_.push_back(iface);
    }
}

void TypeRegistry::append_field(TypeDescriptor& type, const FieldSpec& field) {
    validate::not_blank(field.name, "The field name on %s must not be blank/empty",
                        type.name());
    validate::is_true(type.find_declared_field(field.name) == nullptr,
                      "Field %s is declared twice on %s", field.name, type.name());
    // Interface fields are implicitly public constants.
    validate::is_true(!type.is_interface() || field.visibility == Visibility::Public,
                      "Interface field %s.%s must be public, not %s",
                      type.name(), field.name, to_string(field.visibility));

    type.fields_.push_back(FieldDescriptor{
        .name           = field.name,
        .visibility     = field.visibility,
        .declaring_type = type.name(),
        .accessible     = false,
    });
}

const TypeDescriptor& TypeRegistry::commit(std::unique_ptr<TypeDescriptor> type) {
    types_.push_back(std::move(type));
    return *types_.back();
}

} // namespace vdc::reflect
