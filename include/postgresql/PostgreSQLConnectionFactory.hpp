#pragma once

/**
 * @file PostgreSQLConnectionFactory.hpp
 * @brief Establishes libpq connections from a ConnectionConfig.
 */

#include "Connection.hpp"
#include "Config.hpp"
#include <libpq-fe.h>
#include <memory>
#include <string>

namespace pgframe {

/**
 * @class PostgreSQLConnectionFactory
 * @brief ConnectionFactory that opens PostgreSQLConnection objects.
 *
 * PostgreSQL Connection Management:
 * - Uses libpq's PQconnectdb() for connection establishment
 * - Connection string format: "host='X' port='5432' dbname='Y' user='Z' ..."
 * - Sets the client encoding to UTF-8 on every new connection
 *
 * Connection failures are not retried here; the caller sees a
 * ConnectionError carrying libpq's message.
 */
class PostgreSQLConnectionFactory : public ConnectionFactory {
public:
    /**
     * @brief Open a new connection.
     * @param config Host, port, database, credentials and SSL settings.
     * @return Established connection.
     * @throws ConnectionError if libpq cannot connect.
     */
    std::unique_ptr<Connection> connect(const ConnectionConfig& config) override;

    /**
     * @brief Build the libpq connection string for a configuration.
     *
     * Every value is single-quoted with backslashes and quotes escaped, so
     * passwords containing spaces or quotes are passed through intact.
     */
    static std::string buildConnInfo(const ConnectionConfig& config);

private:
    static std::string quoteConnValue(const std::string& value);
};

}  // namespace pgframe
