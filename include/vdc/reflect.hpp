#pragma once

/// @file include/vdc/reflect.hpp
/// @brief Runtime type model: type descriptors, field descriptors, registry.
///
/// # Module: Type Model
///
/// ## Responsibility
/// C++ has no runtime reflection, so the hierarchy that ClassUtils and
/// FieldUtils walk is described explicitly.  A `TypeRegistry` owns every
/// `TypeDescriptor`; descriptors refer to each other through non-owning
/// pointers that stay valid for the registry's lifetime (moves included).
///
/// ## Structural Rules
/// Enforced at registration, violations throw `vdc::InvalidArgument`:
///   - type names are non-blank and unique
///   - a superclass must be a registered class; interfaces have no superclass
///   - every listed interface must be a registered interface, listed once
///   - interfaces declare only public fields
///   - field names are non-blank and unique within their declaring type
///
/// Referenced types must already be registered, so hierarchies are acyclic.
///
/// ## Thread Safety
/// Lookups never modify the registry; concurrent reads of a fully built
/// registry are safe.  Registration is not synchronised.

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vdc::reflect {

// ─── Visibility ───────────────────────────────────────────────────────────────

/// Access restriction on a field.
enum class Visibility {
    Public,
    Protected,
    Package,   ///< Default (no modifier) access
    Private,
};

/// Lower-case keyword for a visibility, e.g. `"private"`.
[[nodiscard]] const char* to_string(Visibility v) noexcept;

// ─── TypeKind ─────────────────────────────────────────────────────────────────

enum class TypeKind {
    Class,
    Interface,
};

[[nodiscard]] const char* to_string(TypeKind k) noexcept;

// ─── FieldDescriptor ──────────────────────────────────────────────────────────

/// A field declared on one type.
///
/// Lookups hand out copies.  A copy returned by a forced lookup has
/// `accessible` set; the registry's own copy is never changed.
struct FieldDescriptor {
    std::string name;
    Visibility  visibility = Visibility::Private;
    std::string declaring_type;       ///< Name of the declaring type
    bool        accessible = false;   ///< Access check suppressed for this copy

    [[nodiscard]] bool is_public() const noexcept {
        return visibility == Visibility::Public;
    }

    /// Equality on identity (declaring type and name) and visibility.
    /// `accessible` is a property of the copy and does not take part.
    [[nodiscard]] bool operator==(const FieldDescriptor& other) const noexcept {
        return name == other.name && visibility == other.visibility &&
               declaring_type == other.declaring_type;
    }
};

/// A field as supplied at registration time, before a declaring type exists.
struct FieldSpec {
    std::string name;
    Visibility  visibility = Visibility::Private;
};

// ─── TypeDescriptor ───────────────────────────────────────────────────────────

/// Metadata for one class or interface.  Only `TypeRegistry` creates these.
class TypeDescriptor {
public:
    /// Construction token; only `TypeRegistry` can make one.
    class Key {
        friend class TypeRegistry;
        Key() = default;
    };

    TypeDescriptor(Key, std::string name, TypeKind kind)
        : name_(std::move(name)), kind_(kind) {}

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] TypeKind kind() const noexcept { return kind_; }
    [[nodiscard]] bool is_interface() const noexcept {
        return kind_ == TypeKind::Interface;
    }

    /// Direct superclass, or nullptr for a root class or any interface.
    [[nodiscard]] const TypeDescriptor* superclass() const noexcept {
        return superclass_;
    }

    /// Directly declared interfaces, in declaration order.  For an interface
    /// these are its direct super-interfaces.
    [[nodiscard]] const std::vector<const TypeDescriptor*>&
    interfaces() const noexcept { return interfaces_; }

    /// Fields declared on exactly this type, in declaration order.
    [[nodiscard]] const std::vector<FieldDescriptor>&
    declared_fields() const noexcept { return fields_; }

    /// Field declared on exactly this type (any visibility), or nullptr.
    /// Inherited fields are never returned.
    [[nodiscard]] const FieldDescriptor*
    find_declared_field(std::string_view field_name) const noexcept;

private:
    friend class TypeRegistry;

    std::string                        name_;
    TypeKind                           kind_;
    const TypeDescriptor*              superclass_ = nullptr;
    std::vector<const TypeDescriptor*> interfaces_;
    std::vector<FieldDescriptor>       fields_;
};

// ─── TypeRegistry ─────────────────────────────────────────────────────────────

/// Owns a closed set of type descriptors.
class TypeRegistry {
public:
    TypeRegistry() = default;
    TypeRegistry(TypeRegistry&&) noexcept = default;
    TypeRegistry& operator=(TypeRegistry&&) noexcept = default;
    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /// Register an interface.
    ///
    /// # Arguments
    /// * `name`             — unique, non-blank type name
    /// * `super_interfaces` — names of registered interfaces it extends
    /// * `fields`           — declared fields; all must be public
    const TypeDescriptor&
    define_interface(const std::string&              name,
                     const std::vector<std::string>& super_interfaces = {},
                     const std::vector<FieldSpec>&   fields = {});

    /// Register a class.
    ///
    /// # Arguments
    /// * `name`       — unique, non-blank type name
    /// * `superclass` — name of a registered class, or empty for a root class
    /// * `interfaces` — names of registered interfaces, in declaration order
    /// * `fields`     — declared fields, any visibility
    const TypeDescriptor&
    define_class(const std::string&              name,
                 const std::string&              superclass = {},
                 const std::vector<std::string>& interfaces = {},
                 const std::vector<FieldSpec>&   fields = {});

    /// Append a field to an already registered type.  The same rules apply
    /// as for fields passed to `define_interface` / `define_class`.
    void add_field(const std::string& type_name, const FieldSpec& field);

    /// Registered type by name, or nullptr.
    [[nodiscard]] const TypeDescriptor* find(std::string_view name) const noexcept;

    /// Registered type by name; throws `InvalidArgument` if unknown.
    [[nodiscard]] const TypeDescriptor& get(std::string_view name) const;

    [[nodiscard]] std::size_t size() const noexcept { return types_.size(); }

    /// All type names in registration order.
    [[nodiscard]] std::vector<std::string> names() const;

private:
    /// New, unregistered descriptor.  Nothing is registered until every check
    /// for the type has passed.
    std::unique_ptr<TypeDescriptor> create(const std::string& name,
                                           TypeKind           kind) const;

    void add_interfaces(TypeDescriptor&                 type,
                        const std::vector<std::string>& interface_names) const;

    static void append_field(TypeDescriptor& type, const FieldSpec& field);

    const TypeDescriptor& commit(std::unique_ptr<TypeDescriptor> type);

    std::vector<std::unique_ptr<TypeDescriptor>> types_;
};

} // namespace vdc::reflect
