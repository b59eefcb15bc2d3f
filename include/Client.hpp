#pragma once

/**
 * @file Client.hpp
 * @brief Public entry point: one PostgreSQL session and the operations on it.
 */

#include "BatchInserter.hpp"
#include "Config.hpp"
#include "Connection.hpp"
#include "QueryExecutor.hpp"
#include "Table.hpp"
#include "TableProvisioner.hpp"
#include "postgresql/PostgreSQLCatalog.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pgframe {

/**
 * @class Client
 * @brief Owns one connection and exposes queries, inserts and catalog calls.
 *
 * The connection is opened on first use and reopened transparently after
 * close(), when the server dropped it, or after a statement failed with a
 * connection-class SQLSTATE. A Client is meant for one thread
 * at a time.
 *
 * Destroying a Client commits any transaction still open when auto-commit
 * is on, then closes the connection. Failures during destruction are logged
 * and swallowed.
 */
class Client : public ConnectionSource {
public:
    explicit Client(ConnectionConfig connection, ClientConfig client = ClientConfig(),
                    std::unique_ptr<ConnectionFactory> factory = nullptr);
    explicit Client(const Config& config, std::unique_ptr<ConnectionFactory> factory = nullptr);
    ~Client() override;

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // ConnectionSource
    Connection& connection() override;
    bool autoCommit() const override { return m_clientConfig.auto_commit; }

    // ----- Queries -----

    /**
     * @brief Run one or more ';'-separated statements as a single unit.
     * @return Rows of the last statement, or std::nullopt when it returned none.
     * @throws QueryError, ConnectionError
     */
    std::optional<Table> query(const std::string& sql);

    /// One statement with $1..$n bound to params.
    std::optional<Table> queryParams(const std::string& sql, const std::vector<SqlParam>& params);

    // ----- Inserts -----

    /**
     * @brief Create or prepare the target table, then insert every row.
     * @param name "schema.table" or "table" (default schema from ClientConfig).
     * @param overwrite Drop and recreate an existing table.
     * @return Number of rows inserted; 0 for an empty table, which touches nothing.
     * @throws InvalidIdentifier, AlreadyExists, QueryError, InsertError
     */
    size_t insertTable(const Table& table, const std::string& name, bool overwrite = false);

    // ----- Catalog -----

    Table listSchemas();
    void createSchema(const std::string& schema);
    void dropSchema(const std::string& schema, bool cascade = false);
    bool schemaExists(const std::string& schema);

    Table listTables(const std::string& schema = Identifier::DEFAULT_SCHEMA);

    Table describeTable(const std::string& name);
    Table describeTable(const std::string& table, const std::string& schema);

    bool tableExists(const std::string& name);
    bool tableExists(const std::string& table, const std::string& schema);

    uint64_t rowCount(const std::string& name);

    // ----- Transactions -----

    /// End the open transaction, if any. Needed only with auto-commit off.
    void commit();
    void rollback();

    void setAutoCommit(bool enabled);

    // ----- Lifecycle -----

    /// Close the connection; idempotent. The next operation reconnects.
    void close();

    bool isConnected() const;

    const ClientConfig& clientConfig() const { return m_clientConfig; }
    const ConnectionConfig& connectionConfig() const { return m_connectionConfig; }

private:
    QualifiedName qualify(const std::string& name) const;

    // Run fn; a failure in SQLSTATE class 08 (or a server shutdown) discards
    // the session so the next call reconnects
    template <typename Fn>
    auto guarded(Fn&& fn) -> decltype(fn());

    void endTransaction(const char* command);

    ConnectionConfig m_connectionConfig;
    ClientConfig m_clientConfig;
    std::unique_ptr<ConnectionFactory> m_factory;
    std::unique_ptr<Connection> m_connection;

    QueryExecutor m_executor;
    PostgreSQLCatalog m_catalog;
    TableProvisioner m_provisioner;
    BatchInserter m_inserter;
};

}  // namespace pgframe
