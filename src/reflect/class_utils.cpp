/// @file src/reflect/class_utils.cpp
/// @brief ClassUtils: depth-first interface discovery.

#include "vdc/class_utils.hpp"

#include <unordered_set>

namespace vdc::reflect {

namespace {

/// Append every interface reachable from `type` that is not yet in `seen`.
void collect_interfaces(const TypeDescriptor*                  type,
                        std::vector<const TypeDescriptor*>&    found,
                        std::unordered_set<const TypeDescriptor*>& seen) {
    for (; type != nullptr; type = type->superclass()) {
        for (const TypeDescriptor* iface : type->interfaces()) {
            if (seen.insert(iface).second) {
                found.push_back(iface);
                collect_interfaces(iface, found, seen);
            }
        }
    }
}

} // anonymous namespace

std::optional<std::vector<const TypeDescriptor*>>
ClassUtils::all_interfaces(const TypeDescriptor* type) {
    if (type == nullptr) {
        return std::nullopt;
    }

    std::vector<const TypeDescriptor*> found;
    std::unordered_set<const TypeDescriptor*> seen;
    collect_interfaces(type, found, seen);
    return found;
}

std::optional<std::vector<const TypeDescriptor*>>
ClassUtils::all_superclasses(const TypeDescriptor* type) {
    if (type == nullptr) {
        return std::nullopt;
    }

    std::vector<const TypeDescriptor*> chain;
    for (const TypeDescriptor* s = type->superclass(); s != nullptr; s = s->superclass()) {
        chain.push_back(s);
    }
    return chain;
}

} // namespace vdc::reflect
