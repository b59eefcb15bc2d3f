#include "QueryExecutor.hpp"
#include "StatementSplitter.hpp"
#include "Transaction.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace pgframe {

namespace {

Transaction::Mode modeFor(bool autoCommit) {
    return autoCommit ? Transaction::Mode::Commit : Transaction::Mode::Deferred;
}

}  // namespace

QueryExecutor::QueryExecutor(ConnectionSource& source)
    : m_source(source) {
}

void QueryExecutor::fail(size_t index, const ResultSet& result, const std::string& sql) const {
    std::string message = result.errorMessage();
    spdlog::error("[{}] Statement {} failed: {} (SQL: {})", ErrorContext::current(), index,
                  message, sql);
    throw QueryError(index, message, result.sqlState());
}

void QueryExecutor::commitIfOpen(Connection& conn, size_t index) {
    if (conn.transactionStatus() == TransactionStatus::Idle) {
        return;
    }

    auto result = conn.execute("COMMIT");
    if (!result->isOk()) {
        fail(index, *result, "COMMIT");
    }
}

std::optional<Table> QueryExecutor::execute(const std::string& sql) {
    return executeStatements(StatementSplitter::split(sql));
}

std::optional<Table> QueryExecutor::executeStatements(const std::vector<std::string>& statements) {
    if (statements.empty()) {
        spdlog::debug("Query contains no statements, nothing to execute");
        return std::nullopt;
    }

    Connection& conn = m_source.connection();
    bool autoCommit = m_source.autoCommit();

    if (statements.size() == 1 && autoCommit) {
        spdlog::debug("Executing: {}", statements.front());
        auto result = conn.execute(statements.front());
        if (!result->isOk()) {
            fail(1, *result, statements.front());
        }

        std::optional<Table> rows;
        if (result->hasRows()) {
            rows = result->toTable();
        }
        commitIfOpen(conn, 1);
        return rows;
    }

    std::optional<Table> lastRows;
    size_t position = 1;

    try {
        Transaction txn(conn, modeFor(autoCommit));

        for (size_t i = 0; i < statements.size(); ++i) {
            spdlog::debug("Executing statement {}/{}: {}", i + 1, statements.size(), statements[i]);
            auto result = conn.execute(statements[i]);
            if (!result->isOk()) {
                txn.rollback();
                fail(i + 1, *result, statements[i]);
            }

            if (i + 1 == statements.size() && result->hasRows()) {
                lastRows = result->toTable();
            }
        }

        position = statements.size();
        txn.commit();
    } catch (const QueryError&) {
        throw;
    } catch (const DatabaseException& e) {
        // BEGIN or COMMIT failed
        spdlog::error("[{}] Transaction failed: {}", ErrorContext::current(), e.what());
        throw QueryError(position, e.what(), e.sqlState());
    }

    return lastRows;
}

std::optional<Table> QueryExecutor::executeParams(const std::string& sql,
                                                  const std::vector<SqlParam>& params) {
    Connection& conn = m_source.connection();
    bool autoCommit = m_source.autoCommit();

    spdlog::debug("Executing with {} parameters: {}", params.size(), sql);

    if (autoCommit) {
        auto result = conn.executeParams(sql, params);
        if (!result->isOk()) {
            fail(1, *result, sql);
        }

        std::optional<Table> rows;
        if (result->hasRows()) {
            rows = result->toTable();
        }
        commitIfOpen(conn, 1);
        return rows;
    }

    std::optional<Table> rows;
    try {
        Transaction txn(conn, Transaction::Mode::Deferred);
        auto result = conn.executeParams(sql, params);
        if (!result->isOk()) {
            txn.rollback();
            fail(1, *result, sql);
        }
        if (result->hasRows()) {
            rows = result->toTable();
        }
        txn.commit();
    } catch (const QueryError&) {
        throw;
    } catch (const DatabaseException& e) {
        throw QueryError(1, e.what(), e.sqlState());
    }
    return rows;
}

void QueryExecutor::executeMany(const std::string& sql,
                                const std::vector<std::vector<SqlParam>>& paramSets) {
    if (paramSets.empty()) {
        return;
    }

    Connection& conn = m_source.connection();
    size_t position = 1;

    try {
        Transaction txn(conn, modeFor(m_source.autoCommit()));

        for (size_t i = 0; i < paramSets.size(); ++i) {
            auto result = conn.executeParams(sql, paramSets[i]);
            if (!result->isOk()) {
                txn.rollback();
                fail(i + 1, *result, sql);
            }
        }

        position = paramSets.size();
        txn.commit();
    } catch (const QueryError&) {
        throw;
    } catch (const DatabaseException& e) {
        throw QueryError(position, e.what(), e.sqlState());
    }

    spdlog::debug("Executed {} parameter sets: {}", paramSets.size(), sql);
}

}  // namespace pgframe
