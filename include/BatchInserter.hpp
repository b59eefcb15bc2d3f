#pragma once

/**
 * @file BatchInserter.hpp
 * @brief Chunked, parameterized INSERT of a Table into an existing table.
 */

#include "Identifier.hpp"
#include "QueryExecutor.hpp"
#include "Table.hpp"
#include <string>
#include <vector>

namespace pgframe {

/**
 * @class BatchInserter
 * @brief Inserts rows in chunks, one transaction per chunk.
 *
 * Every row is bound to the same "INSERT INTO ... VALUES ($1, ..., $n)"
 * statement, so cell values never appear in SQL text. NULL cells bind as
 * SQL NULL.
 *
 * Atomicity is per chunk: when chunk k fails it is rolled back and an
 * InsertError(k) is thrown, while chunks 1..k-1 stay committed (with
 * auto-commit on).
 */
class BatchInserter {
public:
    static constexpr size_t DEFAULT_BATCH_SIZE = 1000;

    explicit BatchInserter(QueryExecutor& executor);

    /**
     * @brief Insert every row of table.
     * @param table Rows to insert; columns map to target columns by name.
     * @param qualifiedName "schema.table" or "table".
     * @param batchSize Maximum rows per chunk; must be at least 1.
     * @return Number of rows inserted.
     * @throws InvalidIdentifier, InsertError, std::invalid_argument
     */
    size_t insertBatched(const Table& table, const std::string& qualifiedName,
                         size_t batchSize = DEFAULT_BATCH_SIZE,
                         const std::string& defaultSchema = Identifier::DEFAULT_SCHEMA);

    size_t insertBatched(const Table& table, const QualifiedName& name,
                         size_t batchSize = DEFAULT_BATCH_SIZE);

    /// INSERT statement with one placeholder per column.
    static std::string insertSql(const QualifiedName& name,
                                 const std::vector<std::string>& columns);

    /// Parameter sets for rows [begin, end).
    static std::vector<std::vector<SqlParam>> rowParams(const Table& table, size_t begin,
                                                        size_t end);

private:
    QueryExecutor& m_executor;
};

}  // namespace pgframe
