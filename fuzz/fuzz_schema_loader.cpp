/**
 * @file  fuzz_schema_loader.cpp
 * @brief libFuzzer target for SchemaLoader::parse_schema_string
 *
 * Build:
 *   cmake -DVDC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_schema_loader
 *
 * Run for 60 seconds:
 *   ./fuzz_schema_loader -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. The loader never throws or crashes on arbitrary bytes.
 *   2. Every registered type satisfies the registry's structural rules:
 *      interfaces have no superclass and only public fields, superclasses
 *      are classes, listed interfaces are interfaces.
 *   3. all_interfaces terminates and is duplicate-free for every type.
 *   4. Field resolution on every declared field name never throws anything
 *      but AmbiguousMember.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <set>
#include <string>

#include "vdc/class_utils.hpp"
#include "vdc/errors.hpp"
#include "vdc/field_utils.hpp"
#include "vdc/schema_loader.hpp"

using namespace vdc::core;
using namespace vdc::reflect;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string csv(reinterpret_cast<const char*>(data), size);
    const SchemaLoadResult loaded = SchemaLoader::parse_schema_string(csv);
    const TypeRegistry& reg = loaded.registry;

    for (const auto& name : reg.names()) {
        const TypeDescriptor& type = reg.get(name);

        if (type.is_interface()) {
            assert(type.superclass() == nullptr);
            for (const auto& f : type.declared_fields()) {
                assert(f.is_public());
            }
        } else if (type.superclass() != nullptr) {
            assert(!type.superclass()->is_interface());
        }
        for (const auto* iface : type.interfaces()) {
            assert(iface->is_interface());
        }

        const auto interfaces = ClassUtils::all_interfaces(&type);
        assert(interfaces.has_value());
        const std::set<const TypeDescriptor*> unique(interfaces->begin(),
                                                     interfaces->end());
        assert(unique.size() == interfaces->size());

        for (const auto& f : type.declared_fields()) {
            try {
                const auto found = FieldUtils::get_field(&type, f.name, true);
                // Forced lookup always reaches the type's own declaration.
                assert(found.has_value() && found->declaring_type == name);
            } catch (const vdc::AmbiguousMember&) {
                assert(false && "a declared field cannot be ambiguous");
            }
        }
    }

    return 0;
}
