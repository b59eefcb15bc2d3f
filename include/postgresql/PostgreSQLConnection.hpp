#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief RAII owner of a single libpq connection.
 *
 * A PostgreSQLConnection owns its PGconn* handle and calls PQfinish() when
 * closed or destroyed. Clients keep exactly one of these at a time.
 */

#include "Connection.hpp"
#include <libpq-fe.h>
#include <string>
#include <vector>

namespace pgframe {

/**
 * @class PostgreSQLConnection
 * @brief Connection implementation over libpq.
 *
 * PostgreSQL libpq API Usage:
 * - PQexec() for plain statements
 * - PQexecParams() for parameterized statements (values never enter SQL text)
 * - PQstatus() for connection state checking
 * - PQtransactionStatus() for the session's transaction state
 * - PQerrorMessage() for error details
 *
 * Thread Safety:
 * - Not thread-safe; a connection belongs to one Client.
 *
 * @see PostgreSQLConnectionFactory for connection establishment
 */
class PostgreSQLConnection : public Connection {
public:
    /**
     * @brief Take ownership of an established connection.
     * @param conn Raw PGconn* handle; must not be used by the caller afterwards.
     */
    explicit PostgreSQLConnection(PGconn* conn);

    /**
     * @brief Destructor - closes the connection.
     */
    ~PostgreSQLConnection() override;

    /**
     * @brief Get the underlying PGconn handle.
     * @return Raw PGconn* pointer (still owned by this wrapper), or nullptr once closed.
     */
    PGconn* get() const { return m_conn; }

    /**
     * @brief Check if the connection is usable.
     * @return true if not closed and PQstatus() == CONNECTION_OK.
     *
     * A server-side disconnect is only noticed after the next failed call,
     * at which point PQstatus() reports CONNECTION_BAD.
     */
    bool isOpen() const override;

    TransactionStatus transactionStatus() const override;

    /**
     * @brief Execute a SQL statement.
     * @return Result wrapper; check isOk() before use.
     */
    std::unique_ptr<ResultSet> execute(const std::string& sql) override;

    /**
     * @brief Execute a parameterized SQL statement.
     * @param sql Statement with $1, $2, ... placeholders.
     * @param params Text-format values; std::nullopt binds SQL NULL.
     *
     * Parameterized queries keep values out of the SQL text entirely,
     * so no value needs escaping.
     */
    std::unique_ptr<ResultSet> executeParams(const std::string& sql,
                                             const std::vector<SqlParam>& params) override;

    /**
     * @brief Close the connection with PQfinish(); safe to call twice.
     */
    void close() override;

    /**
     * @brief Get the last error message.
     * @return Error message string from PQerrorMessage().
     */
    std::string errorMessage() const override;

private:
    PGconn* m_conn;  ///< PostgreSQL connection handle (owned)
};

}  // namespace pgframe
