#pragma once

/// @file include/vdc/schema_loader.hpp
/// @brief CSV type-schema loader that builds a TypeRegistry.
///
/// # Module: SchemaLoader
///
/// ## Responsibility
/// Parse a CSV description of classes, interfaces and their fields into a
/// `reflect::TypeRegistry`.  Malformed rows, and rows the registry rejects,
/// are skipped and counted; the loader never throws on bad input.
///
/// ## Expected CSV Format
/// ```
/// record,kind,name,parent,list
/// type,interface,Named,,
/// type,interface,Keyed,,Named
/// field,Keyed,KEY,public,
/// type,class,Base,,Named
/// field,Base,id,private,
/// type,class,Derived,Base,Keyed;Named
/// ```
/// The first non-comment line is the header and is skipped.  `#` lines and
/// blank lines are ignored.
///
/// `type` rows: `kind` is `class` or `interface`; `parent` is the superclass
/// (classes only, may be empty); `list` holds `;`-separated interface names
/// (super-interfaces for an interface).  Referenced types must appear
/// earlier in the file.
///
/// `field` rows: the second column names the owner type, then the field
/// name, then its visibility (`public`, `protected`, `package`, `private`).
/// The last column must be empty.
///
/// ## Guarantees
/// - Never throws on malformed content
/// - A rejected `type` row leaves no partial type behind
/// - Does not modify any file or external state

#include "vdc/reflect.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace vdc::core {

/// Registry built from a schema plus the number of rows that were dropped.
struct SchemaLoadResult {
    reflect::TypeRegistry registry;
    std::size_t           skipped_rows = 0;
};

/// Loads type schemas from CSV files and strings.
class SchemaLoader {
public:
    SchemaLoader() = delete;

    /// Load a schema from a CSV file on disk.
    ///
    /// # Returns
    /// - `nullopt` if the file cannot be opened
    /// - Otherwise the registry, skipping malformed rows
    [[nodiscard]] static std::optional<SchemaLoadResult>
    load_schema(const std::string& filepath) noexcept;

    /// Parse a schema from a CSV-formatted string (useful for testing).
    /// Same format as `load_schema`.
    [[nodiscard]] static SchemaLoadResult
    parse_schema_string(const std::string& csv_content) noexcept;

    /// Parse a visibility keyword; `nullopt` for anything else.
    [[nodiscard]] static std::optional<reflect::Visibility>
    parse_visibility(std::string_view keyword) noexcept;

private:
    /// Apply one data row to `registry`.  Returns false if the row was
    /// malformed or rejected.
    [[nodiscard]] static bool
    apply_row(reflect::TypeRegistry& registry, const std::string& line) noexcept;
};

}  // namespace vdc::core
