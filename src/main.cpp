/// @file src/main.cpp
/// @brief vdc CLI entry point.
///
/// Usage:
///   vdc date <text>                              Normalise a yyyy-MM-dd date
///   vdc datetime <text>                          Normalise a yyyy-MM-ddTHH:mm:ss value
///   vdc interfaces <schema.csv> <type>           List all interfaces, in order
///   vdc field <schema.csv> <type> <name> [--force]
///   vdc --help                                   Print usage
///
/// Exit codes: 0 success, 1 error, 2 field not found.

#include "vdc/class_utils.hpp"
#include "vdc/date_time.hpp"
#include "vdc/errors.hpp"
#include "vdc/field_utils.hpp"
#include "vdc/schema_loader.hpp"

#include <fmt/core.h>

#include <optional>
#include <string>
#include <variant>

namespace {

using vdc::binding::DateTimeBinder;
using vdc::core::SchemaLoader;
using vdc::core::SchemaLoadResult;
using namespace vdc::reflect;

constexpr int EXIT_NOT_FOUND = 2;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  vdc date <text>                           Normalise a yyyy-MM-dd date\n"
        "  vdc datetime <text>                       Normalise a yyyy-MM-ddTHH:mm:ss value\n"
        "  vdc interfaces <schema.csv> <type>        List all interfaces, in order\n"
        "  vdc field <schema.csv> <type> <name> [--force]\n"
        "                                            Resolve a field by name\n"
        "  vdc --help                                Show this help\n"
        "\n"
        "Schema format (header required):\n"
        "  record,kind,name,parent,list\n"
    );
}

/// Load a schema, warning about skipped rows.  Returns nullopt (after
/// printing an error) if the file cannot be read.
std::optional<SchemaLoadResult> load(const std::string& filepath) {
    auto schema = SchemaLoader::load_schema(filepath);
    if (!schema) {
        fmt::print(stderr, "Error: cannot open schema '{}'\n", filepath);
        return std::nullopt;
    }
    if (schema->skipped_rows > 0) {
        fmt::print(stderr, "Warning: skipped {} malformed row(s) in '{}'\n",
                   schema->skipped_rows, filepath);
    }
    return schema;
}

/// Echo a date in canonical form.
int run_date(const std::string& text) {
    const auto date = DateTimeBinder::parse_date(text);
    fmt::print("{}\n", *DateTimeBinder::format_date(date));
    return 0;
}

int run_date_time(const std::string& text) {
    const auto date_time = DateTimeBinder::parse_date_time(text);
    fmt::print("{}\n", *DateTimeBinder::format_date_time(date_time));
    return 0;
}

/// Print every interface of `type_name`, one per line, in discovery order.
int run_interfaces(const std::string& filepath, const std::string& type_name) {
    auto schema = load(filepath);
    if (!schema) {
        return 1;
    }

    const TypeDescriptor& type = schema->registry.get(type_name);
    const auto interfaces = ClassUtils::all_interfaces(&type);
    for (const TypeDescriptor* iface : interfaces.value()) {
        fmt::print("{}\n", iface->name());
    }
    return 0;
}

/// Resolve one field and print `<declaring type>.<name> <visibility>`.
int run_field(const std::string& filepath,
              const std::string& type_name,
              const std::string& field_name,
              bool               force_access) {
    auto schema = load(filepath);
    if (!schema) {
        return 1;
    }

    const TypeDescriptor& type = schema->registry.get(type_name);
    const FieldLookup lookup = FieldUtils::resolve_field(&type, field_name, force_access);

    if (const auto* found = std::get_if<FieldFound>(&lookup)) {
        fmt::print("{}.{} {}{}\n",
                   found->field.declaring_type,
                   found->field.name,
                   to_string(found->field.visibility),
                   found->field.accessible ? " (access forced)" : "");
        return 0;
    }
    if (const auto* ambiguous = std::get_if<FieldAmbiguous>(&lookup)) {
        fmt::print(stderr, "Error: field '{}' is ambiguous on {}; declared by:\n",
                   field_name, type_name);
        for (const auto& candidate : ambiguous->candidates) {
            fmt::print(stderr, "  {}.{}\n", candidate.declaring_type, candidate.name);
        }
        return 1;
    }

    fmt::print(stderr, "No field '{}' on {}\n", field_name, type_name);
    return EXIT_NOT_FOUND;
}

int dispatch(int argc, char* argv[]) {
    const std::string mode(argv[1]);

    if (mode == "date" && argc == 3) {
        return run_date(argv[2]);
    }
    if (mode == "datetime" && argc == 3) {
        return run_date_time(argv[2]);
    }
    if (mode == "interfaces" && argc == 4) {
        return run_interfaces(argv[2], argv[3]);
    }
    if (mode == "field" && (argc == 5 || argc == 6)) {
        bool force = false;
        if (argc == 6) {
            if (std::string(argv[5]) != "--force") {
                fmt::print(stderr, "Unknown option: {}\n", argv[5]);
                print_usage();
                return 1;
            }
            force = true;
        }
        return run_field(argv[2], argv[3], argv[4], force);
    }

    fmt::print(stderr, "Unknown or incomplete command: {}\n", mode);
    print_usage();
    return 1;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string mode(argv[1]);
    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    try {
        return dispatch(argc, argv);
    } catch (const vdc::FormatError& ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
    } catch (const vdc::InvalidArgument& ex) {
        fmt::print(stderr, "Error: {}\n", ex.what());
    }
    return 1;
}
