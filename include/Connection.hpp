#pragma once

#include "Table.hpp"
#include <memory>
#include <string>
#include <vector>

namespace pgframe {

struct ConnectionConfig;

// Outcome of one executed statement
class ResultSet {
public:
    virtual ~ResultSet() = default;

    // Non-copyable
    ResultSet(const ResultSet&) = delete;
    ResultSet& operator=(const ResultSet&) = delete;

    // Statement succeeded (with or without rows)
    virtual bool isOk() const = 0;

    // Statement produced a row description (SELECT, RETURNING, SHOW ...)
    virtual bool hasRows() const = 0;

    virtual std::string errorMessage() const = 0;
    virtual std::string sqlState() const = 0;

    // Materialize all rows; only valid when hasRows()
    virtual Table toTable() const = 0;

protected:
    ResultSet() = default;
};

// Transaction state reported by the session
enum class TransactionStatus {
    Idle,
    InTransaction,
    Failed,
    Unknown
};

// A single live database session
class Connection {
public:
    virtual ~Connection() = default;

    // Non-copyable, non-movable
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Session is established and usable
    virtual bool isOpen() const = 0;

    virtual TransactionStatus transactionStatus() const = 0;

    // Run one SQL command; never returns nullptr
    virtual std::unique_ptr<ResultSet> execute(const std::string& sql) = 0;

    // Run one parameterized command ($1, $2, ...); never returns nullptr
    virtual std::unique_ptr<ResultSet> executeParams(const std::string& sql,
                                                     const std::vector<SqlParam>& params) = 0;

    // Close the session; idempotent
    virtual void close() = 0;

    virtual std::string errorMessage() const = 0;

protected:
    Connection() = default;
};

// Opens sessions for a Client
class ConnectionFactory {
public:
    virtual ~ConnectionFactory() = default;

    // Throws ConnectionError when the session cannot be established
    virtual std::unique_ptr<Connection> connect(const ConnectionConfig& config) = 0;
};

}  // namespace pgframe
