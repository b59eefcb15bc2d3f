#pragma once

/**
 * @file TypeInference.hpp
 * @brief Column type declarations derived from a Table's runtime value types.
 */

#include "Table.hpp"
#include <string>
#include <vector>
#include <utility>

namespace pgframe {

/// Column name -> PostgreSQL type keyword, in table column order.
using ColumnTypes = std::vector<std::pair<std::string, std::string>>;

class TypeInference {
public:
    static constexpr const char* INTEGER = "INTEGER";
    static constexpr const char* BIGINT = "BIGINT";
    static constexpr const char* DOUBLE_PRECISION = "DOUBLE PRECISION";
    static constexpr const char* BOOLEAN = "BOOLEAN";
    static constexpr const char* TIMESTAMP = "TIMESTAMP";
    static constexpr const char* TIMESTAMPTZ = "TIMESTAMP WITH TIME ZONE";
    static constexpr const char* TEXT = "TEXT";
    static constexpr const char* VARCHAR_255 = "VARCHAR(255)";

    static constexpr size_t VARCHAR_LIMIT = 255;

    /**
     * @brief Declaration for every column of the table.
     *
     * Integer columns become INTEGER when every value fits in 32 bits and
     * BIGINT otherwise. Text columns become VARCHAR(255) when no value is
     * longer than 255 characters and TEXT otherwise. All-NULL columns become
     * VARCHAR(255) whatever their kind.
     */
    static ColumnTypes inferTypes(const Table& table);

    static std::string inferColumnType(const Column& column);

    /// Longest non-NULL string value in characters (UTF-8 code points).
    static size_t maxTextLength(const Column& column);

    static bool fitsInInt32(const Column& column);

    static size_t utf8Length(const std::string& str);
};

}  // namespace pgframe
