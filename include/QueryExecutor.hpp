#pragma once

/**
 * @file QueryExecutor.hpp
 * @brief Runs SQL against a Client's connection with single-transaction semantics.
 */

#include "Connection.hpp"
#include "Table.hpp"
#include <optional>
#include <string>
#include <vector>

namespace pgframe {

// Supplies the live connection and the auto-commit setting to the executor
class ConnectionSource {
public:
    virtual ~ConnectionSource() = default;

    // Opens or reopens the connection when needed; may throw ConnectionError
    virtual Connection& connection() = 0;

    virtual bool autoCommit() const = 0;
};

/**
 * @class QueryExecutor
 * @brief Transactional executor for one or more SQL statements.
 *
 * execute() splits its input with StatementSplitter. A single statement runs
 * directly and is committed when auto-commit is on. Several statements run
 * inside one transaction on the same session: either all of them take
 * effect or none does, and only the final statement's rows are returned.
 *
 * With auto-commit off, a transaction is opened when none is active and is
 * left open after success; the caller ends it (Client::commit/rollback).
 * Failures always roll back.
 *
 * Errors are reported as QueryError carrying the 1-based index of the
 * failing statement (or parameter set, for executeMany) and the driver
 * message. Nothing is retried.
 */
class QueryExecutor {
public:
    explicit QueryExecutor(ConnectionSource& source);

    /**
     * @brief Run every statement of sql.
     * @return The last statement's rows, or std::nullopt when it returned no
     *         row description or sql contained no statement.
     * @throws QueryError after rolling back the whole call.
     * @throws ConnectionError if no connection could be established.
     */
    std::optional<Table> execute(const std::string& sql);

    /**
     * @brief Same as execute() for statements that are already separated.
     *
     * Generated SQL uses this so that a ';' inside a quoted identifier is
     * never taken for a separator.
     */
    std::optional<Table> executeStatements(const std::vector<std::string>& statements);

    /**
     * @brief Run one parameterized statement without splitting.
     * @throws QueryError (index 1) on failure.
     */
    std::optional<Table> executeParams(const std::string& sql, const std::vector<SqlParam>& params);

    /**
     * @brief Run one parameterized statement once per parameter set, all in
     *        one transaction.
     * @throws QueryError with the 1-based index of the failing parameter set,
     *         after rolling back every set of this call.
     */
    void executeMany(const std::string& sql, const std::vector<std::vector<SqlParam>>& paramSets);

private:
    [[noreturn]] void fail(size_t index, const ResultSet& result, const std::string& sql) const;

    // Commit a transaction the server opened implicitly (e.g. after "BEGIN")
    void commitIfOpen(Connection& conn, size_t index);

    ConnectionSource& m_source;
};

}  // namespace pgframe
