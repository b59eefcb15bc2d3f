#include "Table.hpp"
#include <fmt/format.h>
#include <stdexcept>
#include <algorithm>

namespace pgframe {

std::string columnKindToString(ColumnKind kind) {
    switch (kind) {
        case ColumnKind::Integer: return "integer";
        case ColumnKind::Float: return "float";
        case ColumnKind::Boolean: return "boolean";
        case ColumnKind::Timestamp: return "timestamp";
        case ColumnKind::TimestampTz: return "timestamptz";
        case ColumnKind::Categorical: return "categorical";
        case ColumnKind::Text: return "text";
        case ColumnKind::Other: return "other";
    }
    return "other";
}

bool isNull(const Cell& cell) {
    return std::holds_alternative<std::monostate>(cell);
}

SqlParam cellToParam(const Cell& cell) {
    if (auto v = std::get_if<int64_t>(&cell)) {
        return std::to_string(*v);
    }
    if (auto v = std::get_if<double>(&cell)) {
        return fmt::format("{}", *v);
    }
    if (auto v = std::get_if<bool>(&cell)) {
        return std::string(*v ? "true" : "false");
    }
    if (auto v = std::get_if<std::string>(&cell)) {
        return *v;
    }
    return std::nullopt;
}

std::string cellToString(const Cell& cell) {
    return cellToParam(cell).value_or("");
}

Column::Column(std::string name, ColumnKind kind, std::vector<Cell> cells)
    : name(std::move(name)), kind(kind), cells(std::move(cells)) {
}

bool Column::allNull() const {
    return std::all_of(cells.begin(), cells.end(), [](const Cell& c) { return isNull(c); });
}

bool Column::operator==(const Column& other) const {
    return name == other.name && cells == other.cells;
}

Table::Table(std::vector<Column> columns) {
    for (auto& column : columns) {
        addColumn(std::move(column));
    }
}

void Table::addColumn(Column column) {
    if (hasColumn(column.name)) {
        throw std::invalid_argument("Duplicate column name: " + column.name);
    }
    if (!m_columns.empty() && column.size() != numRows()) {
        throw std::invalid_argument(fmt::format(
            "Column '{}' has {} rows, table has {}", column.name, column.size(), numRows()));
    }
    m_columns.push_back(std::move(column));
}

void Table::addRow(std::vector<Cell> row) {
    if (row.size() != m_columns.size()) {
        throw std::invalid_argument(fmt::format(
            "Row has {} cells, table has {} columns", row.size(), m_columns.size()));
    }
    for (size_t i = 0; i < row.size(); ++i) {
        m_columns[i].cells.push_back(std::move(row[i]));
    }
}

size_t Table::numRows() const {
    return m_columns.empty() ? 0 : m_columns.front().size();
}

std::vector<std::string> Table::columnNames() const {
    std::vector<std::string> names;
    names.reserve(m_columns.size());
    for (const auto& column : m_columns) {
        names.push_back(column.name);
    }
    return names;
}

const Column& Table::column(size_t index) const {
    if (index >= m_columns.size()) {
        throw std::out_of_range(fmt::format("Column index {} out of range", index));
    }
    return m_columns[index];
}

const Column& Table::column(const std::string& name) const {
    for (const auto& column : m_columns) {
        if (column.name == name) return column;
    }
    throw std::out_of_range("No such column: " + name);
}

bool Table::hasColumn(const std::string& name) const {
    return std::any_of(m_columns.begin(), m_columns.end(),
                       [&name](const Column& c) { return c.name == name; });
}

const Cell& Table::at(size_t row, size_t col) const {
    const Column& c = column(col);
    if (row >= c.size()) {
        throw std::out_of_range(fmt::format("Row index {} out of range", row));
    }
    return c.cells[row];
}

std::vector<Cell> Table::row(size_t index) const {
    std::vector<Cell> cells;
    cells.reserve(m_columns.size());
    for (size_t col = 0; col < m_columns.size(); ++col) {
        cells.push_back(at(index, col));
    }
    return cells;
}

bool Table::operator==(const Table& other) const {
    return m_columns == other.m_columns;
}

}  // namespace pgframe
