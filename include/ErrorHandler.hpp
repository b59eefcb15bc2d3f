#pragma once

#include <libpq-fe.h>
#include <string>
#include <stdexcept>
#include <cstddef>

namespace pgframe {

// SQLSTATE classification and message extraction for libpq errors
class ErrorHandler {
public:
    // SQLSTATE class 08 (connection exception) and libpq's own connection failures
    static bool isConnectionError(const std::string& sqlstate);

    // Get human-readable error message
    static std::string getErrorMessage(const PGconn* conn);
    static std::string getErrorMessage(const PGresult* result);

    // SQLSTATE of a failed result, or empty
    static std::string getSqlState(const PGresult* result);

    // Trim the trailing newline libpq appends to its messages
    static std::string trimMessage(const std::string& message);

    static constexpr const char* SQLSTATE_CONNECTION_FAILURE = "08006";
    static constexpr const char* SQLSTATE_DUPLICATE_TABLE = "42P07";
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Base of every error the library raises
class DatabaseException : public std::runtime_error {
public:
    DatabaseException(const std::string& message, const std::string& sqlstate = "");

    const std::string& sqlState() const { return m_sqlstate; }

private:
    std::string m_sqlstate;
};

// Connection establishment failed; never retried
class ConnectionError : public DatabaseException {
public:
    using DatabaseException::DatabaseException;
};

// A qualified name could not be parsed; raised before any SQL is issued
class InvalidIdentifier : public DatabaseException {
public:
    explicit InvalidIdentifier(const std::string& message);
};

// A statement of a query call failed; the whole call was rolled back
class QueryError : public DatabaseException {
public:
    QueryError(size_t statementIndex, const std::string& driverMessage,
               const std::string& sqlstate = "");

    // 1-based index of the failing statement
    size_t statementIndex() const { return m_statementIndex; }
    const std::string& driverMessage() const { return m_driverMessage; }

private:
    size_t m_statementIndex;
    std::string m_driverMessage;
};

// A chunk of insertBatched failed; only that chunk was rolled back
class InsertError : public DatabaseException {
public:
    InsertError(size_t batchIndex, const std::string& driverMessage,
                const std::string& sqlstate = "");

    // 1-based index of the failing batch
    size_t batchIndex() const { return m_batchIndex; }
    const std::string& driverMessage() const { return m_driverMessage; }

private:
    size_t m_batchIndex;
    std::string m_driverMessage;
};

// Target table exists, overwrite was not requested and the policy is Fail
class AlreadyExists : public DatabaseException {
public:
    explicit AlreadyExists(const std::string& qualifiedName);
};

}  // namespace pgframe
