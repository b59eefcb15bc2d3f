#pragma once

/**
 * @file PostgreSQLResultSet.hpp
 * @brief RAII wrapper for PostgreSQL query results.
 *
 * This file provides the ResultSet implementation for libpq, handling
 * automatic cleanup of PGresult* handles and materializing returned rows
 * into a Table.
 */

#include "Connection.hpp"
#include <libpq-fe.h>
#include <string>
#include <vector>
#include <cstdint>

namespace pgframe {

/**
 * @class PostgreSQLResultSet
 * @brief ResultSet over a PGresult* handle.
 *
 * The result is cleared (PQclear) when the wrapper is destroyed.
 *
 * Result Status:
 * - PGRES_TUPLES_OK: statement returned a row description (possibly 0 rows)
 * - PGRES_COMMAND_OK: DML/DDL completed successfully
 * - PGRES_EMPTY_QUERY: nothing but whitespace or comments; ok, no rows
 * - PGRES_FATAL_ERROR: Error occurred
 *
 * Type Mapping (toTable):
 * - bool -> Boolean
 * - int2, int4, int8, oid -> Integer
 * - float4, float8 -> Float
 * - timestamp -> Timestamp, timestamptz -> TimestampTz
 * - text, varchar, bpchar, name -> Text
 * - everything else (numeric, date, json, ...) -> Other, kept as text
 *
 * Usage:
 * @code
 *   auto result = conn.execute("SELECT id, name FROM employees");
 *   if (result->hasRows()) {
 *       Table table = result->toTable();
 *   }
 * @endcode
 */
class PostgreSQLResultSet : public ResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param res PGresult handle to manage (takes ownership), or nullptr.
     * @param fallbackError Message reported when res is nullptr (usually
     *        the connection's PQerrorMessage at the time of the call).
     */
    explicit PostgreSQLResultSet(PGresult* res = nullptr, std::string fallbackError = "");

    /**
     * @brief Destructor - clears the result if still owned.
     */
    ~PostgreSQLResultSet() override;

    /**
     * @brief Get the underlying PGresult handle.
     * @return Raw PGresult* pointer (still owned by this object).
     */
    PGresult* get() const { return m_res; }

    // ----- ResultSet interface -----

    /**
     * @brief Check if the result status indicates success.
     * @return true if status is PGRES_TUPLES_OK, PGRES_COMMAND_OK or
     *         PGRES_EMPTY_QUERY (a statement that was only a comment).
     */
    bool isOk() const override;

    /**
     * @brief Check if the statement described rows.
     * @return true if status is PGRES_TUPLES_OK.
     *
     * Note: A SELECT with no matching rows still returns TUPLES_OK
     * but with numRows() == 0.
     */
    bool hasRows() const override;

    std::string errorMessage() const override;
    std::string sqlState() const override;

    /**
     * @brief Copy every row into a Table.
     *
     * Column kinds follow the type mapping above; SQL NULL becomes an empty
     * cell. Duplicate column names (e.g. "SELECT 1, 1") are suffixed with
     * "_1", "_2", ... so the Table stays addressable by name.
     */
    Table toTable() const override;

    // ----- Row and column access -----

    int numFields() const;
    int numRows() const;

    /**
     * @brief Get a value at a specific row and column.
     * @return Value as C string, or nullptr if NULL or out of range.
     */
    const char* getValue(int row, int col) const;

    bool isNull(int row, int col) const;
    const char* fieldName(int col) const;

    /**
     * @brief Get a column's type Oid.
     *
     * Common Oids: 16=bool, 23=int4, 25=text, 1043=varchar
     */
    Oid fieldType(int col) const;

    static ColumnKind kindForType(Oid type);

    /**
     * @brief Convert one text-format value to a Cell of the given kind.
     * @throws std::invalid_argument when the text does not parse.
     */
    static Cell parseValue(const char* text, ColumnKind kind);

private:
    PGresult* m_res;              ///< PostgreSQL result handle (owned)
    std::string m_fallbackError;  ///< Message when no result was produced
};

}  // namespace pgframe
