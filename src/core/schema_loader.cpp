/// @file src/core/schema_loader.cpp
/// @brief SchemaLoader: CSV type schema to TypeRegistry.

#include "vdc/schema_loader.hpp"
#include "vdc/constants.hpp"

#include <fstream>
#include <sstream>
#include <vector>

namespace vdc::core {

namespace {

/// Trim leading/trailing whitespace.
std::string trim(const std::string& token) {
    const auto first = token.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = token.find_last_not_of(" \t\r\n");
    return token.substr(first, last - first + 1);
}

/// Split on `sep`, trimming every piece.  A trailing separator yields a
/// trailing empty piece, so `a,b,` has three columns.
std::vector<std::string> split(const std::string& line, char sep) {
    std::vector<std::string> pieces;
    std::string::size_type start = 0;
    while (true) {
        const auto pos = line.find(sep, start);
        if (pos == std::string::npos) {
            pieces.push_back(trim(line.substr(start)));
            break;
        }
        pieces.push_back(trim(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return pieces;
}

/// Non-empty entries of a `;`-separated list column.
std::vector<std::string> split_list(const std::string& column) {
    std::vector<std::string> names;
    if (column.empty()) {
        return names;
    }
    for (auto& name : split(column, constants::SCHEMA_LIST_SEPARATOR)) {
        if (name.empty()) {
            return {};  // "A;;B" is malformed; caller sees an empty list
        }
        names.push_back(std::move(name));
    }
    return names;
}

bool is_comment_or_blank(const std::string& line) {
    const auto first = line.find_first_not_of(" \t");
    return first == std::string::npos || line[first] == '#';
}

} // anonymous namespace

// ─── SchemaLoader::parse_visibility ───────────────────────────────────────────

std::optional<reflect::Visibility>
SchemaLoader::parse_visibility(std::string_view keyword) noexcept {
    using reflect::Visibility;
    if (keyword == "public")    return Visibility::Public;
    if (keyword == "protected") return Visibility::Protected;
    if (keyword == "package")   return Visibility::Package;
    if (keyword == "private")   return Visibility::Private;
    return std::nullopt;
}

// ─── SchemaLoader::apply_row ──────────────────────────────────────────────────

bool SchemaLoader::apply_row(reflect::TypeRegistry& registry,
                             const std::string&     line) noexcept {
    try {
        const auto cols = split(line, ',');
        if (cols.size() != constants::SCHEMA_COLUMNS) {
            return false;
        }
        const std::string& record = cols[0];

        if (record == "type") {
            const auto interfaces = split_list(cols[4]);
            if (!cols[4].empty() && interfaces.empty()) {
                return false;
            }
            if (cols[1] == "interface") {
                if (!cols[3].empty()) {
                    return false;  // interfaces have no superclass
                }
                registry.define_interface(cols[2], interfaces);
                return true;
            }
            if (cols[1] == "class") {
                registry.define_class(cols[2], cols[3], interfaces);
                return true;
            }
            return false;
        }

        if (record == "field") {
            const auto visibility = parse_visibility(cols[3]);
            if (!visibility || !cols[4].empty()) {
                return false;
            }
            registry.add_field(cols[1], reflect::FieldSpec{
                .name       = cols[2],
                .visibility = *visibility,
            });
            return true;
        }

        return false;
    } catch (const std::exception&) {
        // Registry rule violated (unknown parent, duplicate name, ...).
        return false;
    }
}

// ─── SchemaLoader::parse_schema_string ────────────────────────────────────────

SchemaLoadResult
SchemaLoader::parse_schema_string(const std::string& csv_content) noexcept {
    SchemaLoadResult result;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_comment_or_blank(line)) {
            continue;
        }
        if (!header_skipped) {
            header_skipped = true;
            continue;
        }
        if (!apply_row(result.registry, line)) {
            ++result.skipped_rows;
        }
    }

    return result;
}

// ─── SchemaLoader::load_schema ────────────────────────────────────────────────

std::optional<SchemaLoadResult>
SchemaLoader::load_schema(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_schema_string(contents.str());
}

}  // namespace vdc::core
