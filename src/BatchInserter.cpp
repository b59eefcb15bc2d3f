#include "BatchInserter.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace pgframe {

BatchInserter::BatchInserter(QueryExecutor& executor)
    : m_executor(executor) {
}

std::string BatchInserter::insertSql(const QualifiedName& name,
                                     const std::vector<std::string>& columns) {
    std::ostringstream sql;
    sql << "INSERT INTO " << name.escaped() << " (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << Identifier::escapeIdentifier(columns[i]);
    }
    sql << ") VALUES (";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << "$" << (i + 1);
    }
    sql << ")";
    return sql.str();
}

std::vector<std::vector<SqlParam>> BatchInserter::rowParams(const Table& table, size_t begin,
                                                            size_t end) {
    end = std::min(end, table.numRows());

    std::vector<std::vector<SqlParam>> paramSets;
    paramSets.reserve(end > begin ? end - begin : 0);

    for (size_t row = begin; row < end; ++row) {
        std::vector<SqlParam> params;
        params.reserve(table.numColumns());
        for (size_t col = 0; col < table.numColumns(); ++col) {
            params.push_back(cellToParam(table.at(row, col)));
        }
        paramSets.push_back(std::move(params));
    }

    return paramSets;
}

size_t BatchInserter::insertBatched(const Table& table, const std::string& qualifiedName,
                                    size_t batchSize, const std::string& defaultSchema) {
    return insertBatched(table, Identifier::parseQualifiedName(qualifiedName, defaultSchema),
                         batchSize);
}

size_t BatchInserter::insertBatched(const Table& table, const QualifiedName& name,
                                    size_t batchSize) {
    if (batchSize == 0) {
        throw std::invalid_argument("Batch size must be at least 1");
    }

    ErrorContext ctx("insertBatched " + name.str());

    size_t total = table.numRows();
    if (total == 0 || table.numColumns() == 0) {
        return 0;
    }

    const std::string sql = insertSql(name, table.columnNames());
    size_t batches = (total + batchSize - 1) / batchSize;

    for (size_t batch = 0; batch < batches; ++batch) {
        size_t begin = batch * batchSize;
        size_t end = std::min(begin + batchSize, total);

        try {
            m_executor.executeMany(sql, rowParams(table, begin, end));
        } catch (const QueryError& e) {
            spdlog::error("Insert into {} failed in batch {}/{} (row {}): {}", name.str(),
                          batch + 1, batches, begin + e.statementIndex(), e.driverMessage());
            throw InsertError(batch + 1, e.driverMessage(), e.sqlState());
        }

        spdlog::debug("Inserted batch {}/{} ({} rows) into {}", batch + 1, batches,
                      end - begin, name.str());
    }

    spdlog::info("Inserted {} rows into {} in {} batches", total, name.str(), batches);
    return total;
}

}  // namespace pgframe
