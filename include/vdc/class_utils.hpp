#pragma once

/// @file include/vdc/class_utils.hpp
/// @brief ClassUtils: hierarchy enumeration over the runtime type model.
///
/// # Module: ClassUtils
///
/// ## Responsibility
/// Walk the superclass and interface links of a `TypeDescriptor` without
/// touching fields.  A null type is tolerated and yields `nullopt`.
///
/// ## Interface Order
/// For the type and then each superclass (most-derived first), its directly
/// declared interfaces are visited in declaration order.  Every interface not
/// seen before is recorded and its own super-interfaces are visited at once,
/// before the next sibling.  Later duplicates are ignored, so an interface
/// appears exactly once, at its first discovery:
/// ```
/// interface IB;  interface ID extends IB;
/// class Base implements IB;  class Derived extends Base implements ID;
///
/// all_interfaces(Derived) == [ID, IB]
/// ```
/// FieldUtils depends on this order when it reports ambiguous fields.

#include "vdc/reflect.hpp"

#include <optional>
#include <vector>

namespace vdc::reflect {

class ClassUtils {
public:
    ClassUtils() = delete;

    /// Every interface implemented by `type` and its superclasses, in
    /// discovery order, without duplicates.
    ///
    /// # Returns
    /// `nullopt` if `type` is null; an empty list if nothing is implemented.
    [[nodiscard]] static std::optional<std::vector<const TypeDescriptor*>>
    all_interfaces(const TypeDescriptor* type);

    /// Superclass chain of `type`, nearest first, excluding `type` itself.
    /// Always empty for an interface.
    ///
    /// # Returns
    /// `nullopt` if `type` is null.
    [[nodiscard]] static std::optional<std::vector<const TypeDescriptor*>>
    all_superclasses(const TypeDescriptor* type);
};

} // namespace vdc::reflect
