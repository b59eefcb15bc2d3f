#pragma once

/**
 * @file Identifier.hpp
 * @brief Parsing and quoting of schema, table and column names.
 *
 * escapeIdentifier() is applied to every identifier placed into generated
 * SQL text. Cell values never go through it; they are always bound as
 * parameters.
 */

#include <string>

namespace pgframe {

struct QualifiedName {
    std::string schema;
    std::string table;

    /// Both parts escaped and joined with '.', ready for SQL text.
    std::string escaped() const;

    /// Unescaped "schema.table" for messages and logs.
    std::string str() const;

    bool operator==(const QualifiedName& other) const {
        return schema == other.schema && table == other.table;
    }
};

class Identifier {
public:
    static constexpr const char* DEFAULT_SCHEMA = "public";

    /**
     * @brief Split "schema.table" or "table" into its parts.
     * @param raw Name as supplied by the caller; surrounding double quotes
     *            on either part are stripped.
     * @param defaultSchema Schema used when raw has no dot.
     * @throws InvalidIdentifier when raw has more than one dot or a part is empty.
     */
    static QualifiedName parseQualifiedName(const std::string& raw,
                                            const std::string& defaultSchema = DEFAULT_SCHEMA);

    /**
     * @brief Quote an identifier when it needs it.
     *
     * Names matching [A-Za-z_][A-Za-z0-9_]* that are not reserved are
     * returned unchanged. Anything else is wrapped in double quotes with
     * embedded double quotes doubled.
     */
    static std::string escapeIdentifier(const std::string& name);

    /**
     * @brief Name as stored in the system catalogs.
     *
     * Unquoted identifiers are folded to lower case by the server, so a name
     * escapeIdentifier() leaves bare is returned lower-cased; a name it
     * quotes is returned unchanged. Catalog lookups bind this value.
     */
    static std::string catalogName(const std::string& name);

    /// Case-insensitive membership in the reserved keyword list.
    static bool isReservedKeyword(const std::string& name);

    /// Extend the reserved keyword list for the rest of the process.
    static void addReservedKeyword(const std::string& keyword);

    static bool isSimpleIdentifier(const std::string& name);

private:
    static std::string stripQuotes(const std::string& part);
};

}  // namespace pgframe
