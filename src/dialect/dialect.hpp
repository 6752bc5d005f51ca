#pragma once

#include "config/database_config.hpp"
#include "core/value.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlbridge::dialect {

// Escape character used in every LIKE pattern built here
constexpr char LIKE_ESCAPE = '!';

// SQL text with its positional '?' parameters
struct BoundQuery {
    std::string sql;
    std::vector<core::Value> params;
};

// How the engine tokenizes quoted text; the default is plain ANSI SQL
struct LexicalRules {
    bool bracket_identifiers = false;   // [name] is a quoted identifier, not an array bracket
    bool backslash_escapes = false;     // \' inside a literal does not close it
};

// Catalog query listing one table's columns, and where to read them in each row
struct SchemaQuery {
    BoundQuery query;
    std::string name_column;
    std::string type_column;
};

/**
 * @brief Everything that differs between the supported engines
 *
 * All engines are reached through ODBC, so execution is shared; a Dialect
 * supplies the connection string, identifier quoting and case rules, catalog
 * queries, the text-type table and the row-limited search statement shape.
 */
class Dialect {
public:
    virtual ~Dialect() = default;

    virtual config::Driver driver() const = 0;
    virtual const char* display_name() const = 0;
    virtual const char* default_odbc_driver() const = 0;

    virtual std::string connection_string(const config::DatabaseConfig& config) const = 0;

    virtual LexicalRules lexical_rules() const { return {}; }

    // Wraps the name in the engine's identifier quotes, doubling embedded closing quotes
    virtual std::string quote_identifier(std::string_view name) const = 0;

    // Name as stored in the catalog, for quoting or binding against catalog views
    virtual std::string catalog_name(std::string_view identifier) const;

    // Result column label as exposed in normalized rows
    virtual std::string fold_column_label(std::string_view label) const;

    virtual std::string list_tables_query() const = 0;

    // Column of list_tables_query() holding the name; empty means the first column
    virtual std::string table_name_column() const = 0;

    virtual std::string normalize_table_name(std::string_view name) const;

    // std::nullopt when the name cannot be used safely
    virtual std::optional<SchemaQuery> table_schema_query(const std::string& physical_table) const = 0;

    virtual const std::set<std::string>& text_like_types() const = 0;

    // Lower-cases the declared type and drops any "(n)" modifier before lookup
    bool is_text_like(std::string_view declared_type) const;

    // Escapes LIKE wildcards in a literal needle with LIKE_ESCAPE
    virtual std::string escape_like(std::string_view needle) const;

    // Case-insensitive LIKE on one column, limited to at most `limit` rows
    virtual BoundQuery text_search_query(const std::string& physical_table,
                                         const std::string& column,
                                         const std::string& pattern,
                                         int limit) const = 0;

    // Comma-separated aggregation of `expression` (used for Drupal roles)
    virtual std::string string_aggregate(std::string_view expression) const = 0;

protected:
    // Driver={...};key=value;... with values brace-quoted where ODBC requires it
    std::string build_connection_string(
        const config::DatabaseConfig& config,
        const std::vector<std::pair<std::string, std::string>>& attributes) const;
};

std::unique_ptr<Dialect> make_dialect(config::Driver driver);

const std::set<std::string>& text_like_types(config::Driver driver);

// Letters, digits and underscore only, non-empty
bool is_safe_identifier(std::string_view name);

// Brace-quotes a connection-string value when it contains ';', '{', '}' or
// edge whitespace, or when forced; '}' is doubled inside braces
std::string odbc_attribute_value(std::string_view value, bool force_braces = false);

} // namespace sqlbridge::dialect
