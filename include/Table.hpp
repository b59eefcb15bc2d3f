#pragma once

/**
 * @file Table.hpp
 * @brief In-memory tabular value exchanged with the database.
 *
 * A Table is an ordered list of named columns of equal length. It is what
 * query() returns and what insertTable() consumes.
 */

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>

namespace pgframe {

/// One scalar value; std::monostate is SQL NULL.
using Cell = std::variant<std::monostate, int64_t, double, bool, std::string>;

/// A libpq text-format parameter; std::nullopt binds SQL NULL.
using SqlParam = std::optional<std::string>;

/**
 * @brief Runtime value type of a column.
 *
 * Timestamp and TimestampTz columns carry ISO-8601 text cells
 * ("2023-01-15 00:00:00", "2023-01-15 00:00:00+00").
 */
enum class ColumnKind {
    Integer,
    Float,
    Boolean,
    Timestamp,
    TimestampTz,
    Categorical,
    Text,
    Other
};

std::string columnKindToString(ColumnKind kind);

bool isNull(const Cell& cell);

/**
 * @brief Render a cell as a text parameter.
 *
 * Doubles use the shortest representation that parses back to the same
 * value, booleans become "true"/"false" and NULL becomes std::nullopt.
 */
SqlParam cellToParam(const Cell& cell);

/// Human-readable rendering used by CSV output and logs; NULL is empty.
std::string cellToString(const Cell& cell);

struct Column {
    std::string name;
    ColumnKind kind = ColumnKind::Text;
    std::vector<Cell> cells;

    Column() = default;
    Column(std::string name, ColumnKind kind, std::vector<Cell> cells = {});

    size_t size() const { return cells.size(); }
    bool allNull() const;

    bool operator==(const Column& other) const;
    bool operator!=(const Column& other) const { return !(*this == other); }
};

/**
 * @class Table
 * @brief Ordered named columns with a uniform row count.
 *
 * Tables produced by the executor are owned by the caller and are not
 * modified by the library afterwards.
 */
class Table {
public:
    Table() = default;
    explicit Table(std::vector<Column> columns);

    /**
     * @brief Append a column.
     * @throws std::invalid_argument on a duplicate name or a length that
     *         differs from the current row count.
     */
    void addColumn(Column column);

    /**
     * @brief Append one row; must have one cell per column.
     * @throws std::invalid_argument on a width mismatch.
     */
    void addRow(std::vector<Cell> row);

    size_t numRows() const;
    size_t numColumns() const { return m_columns.size(); }
    bool empty() const { return numRows() == 0; }

    std::vector<std::string> columnNames() const;
    const std::vector<Column>& columns() const { return m_columns; }

    const Column& column(size_t index) const;
    const Column& column(const std::string& name) const;
    bool hasColumn(const std::string& name) const;

    const Cell& at(size_t row, size_t col) const;
    std::vector<Cell> row(size_t index) const;

    bool operator==(const Table& other) const;
    bool operator!=(const Table& other) const { return !(*this == other); }

private:
    std::vector<Column> m_columns;
};

}  // namespace pgframe
