#include "PostgreSQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include <cerrno>
#include <cstdlib>
#include <set>
#include <stdexcept>

namespace pgframe {

namespace {

// PostgreSQL OID constants for common types
constexpr Oid BOOLOID = 16;
constexpr Oid NAMEOID = 19;
constexpr Oid INT8OID = 20;
constexpr Oid INT2OID = 21;
constexpr Oid INT4OID = 23;
constexpr Oid TEXTOID = 25;
constexpr Oid OIDOID = 26;
constexpr Oid FLOAT4OID = 700;
constexpr Oid FLOAT8OID = 701;
constexpr Oid BPCHAROID = 1042;
constexpr Oid VARCHAROID = 1043;
constexpr Oid TIMESTAMPOID = 1114;
constexpr Oid TIMESTAMPTZOID = 1184;

}  // namespace

PostgreSQLResultSet::PostgreSQLResultSet(PGresult* res, std::string fallbackError)
    : m_res(res), m_fallbackError(std::move(fallbackError)) {}

PostgreSQLResultSet::~PostgreSQLResultSet() {
    if (m_res) {
        PQclear(m_res);
    }
}

bool PostgreSQLResultSet::isOk() const {
    if (!m_res) return false;
    ExecStatusType status = PQresultStatus(m_res);
    // A piece holding only a comment ("SELECT 1; -- done") comes back empty
    return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK ||
           status == PGRES_EMPTY_QUERY;
}

bool PostgreSQLResultSet::hasRows() const {
    return m_res && PQresultStatus(m_res) == PGRES_TUPLES_OK;
}

std::string PostgreSQLResultSet::errorMessage() const {
    if (!m_res) {
        return m_fallbackError.empty() ? "No result" : ErrorHandler::trimMessage(m_fallbackError);
    }
    return ErrorHandler::getErrorMessage(m_res);
}

std::string PostgreSQLResultSet::sqlState() const {
    if (!m_res) {
        return ErrorHandler::SQLSTATE_CONNECTION_FAILURE;
    }
    return ErrorHandler::getSqlState(m_res);
}

int PostgreSQLResultSet::numFields() const {
    return m_res ? PQnfields(m_res) : 0;
}

int PostgreSQLResultSet::numRows() const {
    return m_res ? PQntuples(m_res) : 0;
}

const char* PostgreSQLResultSet::getValue(int row, int col) const {
    if (!m_res) return nullptr;
    if (row < 0 || row >= numRows()) return nullptr;
    if (col < 0 || col >= numFields()) return nullptr;
    if (PQgetisnull(m_res, row, col)) return nullptr;
    return PQgetvalue(m_res, row, col);
}

bool PostgreSQLResultSet::isNull(int row, int col) const {
    if (!m_res) return true;
    if (row < 0 || row >= numRows()) return true;
    if (col < 0 || col >= numFields()) return true;
    return PQgetisnull(m_res, row, col) != 0;
}

const char* PostgreSQLResultSet::fieldName(int col) const {
    if (!m_res || col < 0 || col >= numFields()) return nullptr;
    return PQfname(m_res, col);
}

Oid PostgreSQLResultSet::fieldType(int col) const {
    if (!m_res || col < 0 || col >= numFields()) return InvalidOid;
    return PQftype(m_res, col);
}

ColumnKind PostgreSQLResultSet::kindForType(Oid type) {
    switch (type) {
        case BOOLOID:
            return ColumnKind::Boolean;
        case INT2OID:
        case INT4OID:
        case INT8OID:
        case OIDOID:
            return ColumnKind::Integer;
        case FLOAT4OID:
        case FLOAT8OID:
            return ColumnKind::Float;
        case TIMESTAMPOID:
            return ColumnKind::Timestamp;
        case TIMESTAMPTZOID:
            return ColumnKind::TimestampTz;
        case TEXTOID:
        case VARCHAROID:
        case BPCHAROID:
        case NAMEOID:
            return ColumnKind::Text;
        default:
            return ColumnKind::Other;
    }
}

Cell PostgreSQLResultSet::parseValue(const char* text, ColumnKind kind) {
    if (!text) return std::monostate{};

    switch (kind) {
        case ColumnKind::Boolean:
            return text[0] == 't';
        case ColumnKind::Integer: {
            errno = 0;
            char* end = nullptr;
            long long value = std::strtoll(text, &end, 10);
            if (errno != 0 || end == text || *end != '\0') {
                throw std::invalid_argument(std::string("Invalid integer value: ") + text);
            }
            return static_cast<int64_t>(value);
        }
        case ColumnKind::Float: {
            char* end = nullptr;
            double value = std::strtod(text, &end);
            if (end == text || *end != '\0') {
                throw std::invalid_argument(std::string("Invalid floating point value: ") + text);
            }
            return value;
        }
        default:
            return std::string(text);
    }
}

Table PostgreSQLResultSet::toTable() const {
    Table table;
    if (!hasRows()) return table;

    int nFields = numFields();
    int nRows = numRows();
    std::set<std::string> used;

    for (int col = 0; col < nFields; ++col) {
        std::string name = fieldName(col) ? fieldName(col) : "";
        std::string unique = name;
        for (int n = 1; used.count(unique); ++n) {
            unique = name + "_" + std::to_string(n);
        }
        used.insert(unique);

        Column column(unique, kindForType(fieldType(col)));
        column.cells.reserve(static_cast<size_t>(nRows));
        for (int row = 0; row < nRows; ++row) {
            column.cells.push_back(parseValue(getValue(row, col), column.kind));
        }
        table.addColumn(std::move(column));
    }

    return table;
}

}  // namespace pgframe
