/**
 * @file PostgreSQLConnectionFactory.cpp
 * @brief Implementation of libpq connection establishment.
 *
 * Uses libpq connection strings for configuration and supports SSL
 * connections.
 */

#include "PostgreSQLConnectionFactory.hpp"
#include "PostgreSQLConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace pgframe {

std::string PostgreSQLConnectionFactory::quoteConnValue(const std::string& value) {
    std::string result = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') result += '\\';
        result += c;
    }
    result += "'";
    return result;
}

std::string PostgreSQLConnectionFactory::buildConnInfo(const ConnectionConfig& config) {
    std::ostringstream connInfo;

    connInfo << "host=" << quoteConnValue(config.host);
    connInfo << " port=" << config.port;

    if (!config.user.empty()) {
        connInfo << " user=" << quoteConnValue(config.user);
    }

    if (!config.password.empty()) {
        connInfo << " password=" << quoteConnValue(config.password);
    }

    if (!config.database.empty()) {
        connInfo << " dbname=" << quoteConnValue(config.database);
    }

    // Timeout in seconds; libpq treats 0 as "wait forever"
    auto timeoutSeconds = config.connect_timeout.count() / 1000;
    if (timeoutSeconds > 0) {
        connInfo << " connect_timeout=" << timeoutSeconds;
    }

    // SSL options
    if (config.use_ssl) {
        connInfo << " sslmode=require";
        if (!config.ssl_ca.empty()) {
            connInfo << " sslrootcert=" << quoteConnValue(config.ssl_ca);
        }
        if (!config.ssl_cert.empty()) {
            connInfo << " sslcert=" << quoteConnValue(config.ssl_cert);
        }
        if (!config.ssl_key.empty()) {
            connInfo << " sslkey=" << quoteConnValue(config.ssl_key);
        }
    } else {
        connInfo << " sslmode=prefer";
    }

    if (!config.application_name.empty()) {
        connInfo << " application_name=" << quoteConnValue(config.application_name);
    }

    return connInfo.str();
}

std::unique_ptr<Connection> PostgreSQLConnectionFactory::connect(const ConnectionConfig& config) {
    PGconn* conn = PQconnectdb(buildConnInfo(config).c_str());

    if (!conn) {
        throw ConnectionError("Failed to allocate PostgreSQL connection",
                              ErrorHandler::SQLSTATE_CONNECTION_FAILURE);
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        std::string errorMsg = ErrorHandler::getErrorMessage(conn);
        PQfinish(conn);
        throw ConnectionError("Failed to connect to PostgreSQL at " + config.host + ":" +
                                  std::to_string(config.port) + ": " + errorMsg,
                              ErrorHandler::SQLSTATE_CONNECTION_FAILURE);
    }

    if (PQsetClientEncoding(conn, "UTF8") != 0) {
        spdlog::warn("Could not set client encoding to UTF8: {}",
                     ErrorHandler::getErrorMessage(conn));
    }

    spdlog::info("Connected to PostgreSQL {}:{}/{} as {} (server version {})",
                 config.host, config.port, config.database, config.user, PQserverVersion(conn));

    return std::make_unique<PostgreSQLConnection>(conn);
}

}  // namespace pgframe
