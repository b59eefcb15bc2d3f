#include "Client.hpp"
#include "ErrorHandler.hpp"
#include "postgresql/PostgreSQLConnectionFactory.hpp"
#include <spdlog/spdlog.h>

namespace pgframe {

Client::Client(ConnectionConfig connection, ClientConfig client,
               std::unique_ptr<ConnectionFactory> factory)
    : m_connectionConfig(std::move(connection)),
      m_clientConfig(std::move(client)),
      m_factory(std::move(factory)),
      m_executor(*this),
      m_catalog(m_executor),
      m_provisioner(m_executor, m_catalog, m_clientConfig.existing_table_policy),
      m_inserter(m_executor) {
    if (!m_factory) {
        m_factory = std::make_unique<PostgreSQLConnectionFactory>();
    }
}

Client::Client(const Config& config, std::unique_ptr<ConnectionFactory> factory)
    : Client(config.connection, config.client, std::move(factory)) {
}

Client::~Client() {
    if (!m_connection) {
        return;
    }

    try {
        if (m_clientConfig.auto_commit && m_connection->isOpen() &&
            m_connection->transactionStatus() != TransactionStatus::Idle) {
            auto result = m_connection->execute("COMMIT");
            if (!result->isOk()) {
                spdlog::warn("Commit on close failed: {}", result->errorMessage());
            }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Commit on close failed: {}", e.what());
    }

    m_connection->close();
}

Connection& Client::connection() {
    if (m_connection && m_connection->isOpen()) {
        return *m_connection;
    }

    if (m_connection) {
        spdlog::warn("Connection to {}:{} lost, reconnecting", m_connectionConfig.host,
                     m_connectionConfig.port);
        m_connection->close();
        m_connection.reset();
    }

    m_connection = m_factory->connect(m_connectionConfig);
    return *m_connection;
}

template <typename Fn>
auto Client::guarded(Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const DatabaseException& e) {
        if (m_connection && ErrorHandler::isConnectionError(e.sqlState())) {
            spdlog::warn("Discarding connection to {}:{} after SQLSTATE {}",
                         m_connectionConfig.host, m_connectionConfig.port, e.sqlState());
            close();
        }
        throw;
    }
}

QualifiedName Client::qualify(const std::string& name) const {
    return Identifier::parseQualifiedName(name, m_clientConfig.default_schema);
}

// ============================================================================
// Queries
// ============================================================================

std::optional<Table> Client::query(const std::string& sql) {
    ErrorContext ctx("query");
    return guarded([&] { return m_executor.execute(sql); });
}

std::optional<Table> Client::queryParams(const std::string& sql,
                                         const std::vector<SqlParam>& params) {
    ErrorContext ctx("queryParams");
    return guarded([&] { return m_executor.executeParams(sql, params); });
}

// ============================================================================
// Inserts
// ============================================================================

size_t Client::insertTable(const Table& table, const std::string& name, bool overwrite) {
    ErrorContext ctx("insertTable");

    QualifiedName target = qualify(name);

    if (table.empty()) {
        spdlog::info("Nothing to insert into {}", target.str());
        return 0;
    }

    return guarded([&] {
        auto action = m_provisioner.ensureTable(table, target, overwrite);
        spdlog::debug("Provisioned {}: {}", target.str(), provisionActionToString(action));

        return m_inserter.insertBatched(table, target, m_clientConfig.batch_size);
    });
}

// ============================================================================
// Catalog
// ============================================================================

Table Client::listSchemas() {
    return guarded([&] { return m_catalog.listSchemas(); });
}

void Client::createSchema(const std::string& schema) {
    guarded([&] { m_catalog.createSchema(schema); });
}

void Client::dropSchema(const std::string& schema, bool cascade) {
    guarded([&] { m_catalog.dropSchema(schema, cascade); });
}

bool Client::schemaExists(const std::string& schema) {
    return guarded([&] { return m_catalog.schemaExists(schema); });
}

Table Client::listTables(const std::string& schema) {
    return guarded([&] { return m_catalog.listTables(schema); });
}

Table Client::describeTable(const std::string& name) {
    QualifiedName target = qualify(name);
    return guarded([&] { return m_catalog.describeTable(target); });
}

Table Client::describeTable(const std::string& table, const std::string& schema) {
    return guarded([&] { return m_catalog.describeTable(QualifiedName{schema, table}); });
}

bool Client::tableExists(const std::string& name) {
    QualifiedName target = qualify(name);
    return guarded([&] { return m_catalog.tableExists(target); });
}

bool Client::tableExists(const std::string& table, const std::string& schema) {
    return guarded([&] { return m_catalog.tableExists(QualifiedName{schema, table}); });
}

uint64_t Client::rowCount(const std::string& name) {
    QualifiedName target = qualify(name);
    return guarded([&] { return m_catalog.rowCount(target); });
}

// ============================================================================
// Transactions
// ============================================================================

void Client::endTransaction(const char* command) {
    if (!m_connection || !m_connection->isOpen()) {
        return;
    }
    if (m_connection->transactionStatus() == TransactionStatus::Idle) {
        return;
    }

    auto result = m_connection->execute(command);
    if (!result->isOk()) {
        throw DatabaseException(std::string(command) + " failed: " + result->errorMessage(),
                                result->sqlState());
    }
    spdlog::debug("{} issued", command);
}

void Client::commit() {
    endTransaction("COMMIT");
}

void Client::rollback() {
    endTransaction("ROLLBACK");
}

void Client::setAutoCommit(bool enabled) {
    if (enabled && !m_clientConfig.auto_commit) {
        // Work left open by deferred mode becomes permanent
        commit();
    }
    m_clientConfig.auto_commit = enabled;
}

// ============================================================================
// Lifecycle
// ============================================================================

void Client::close() {
    if (!m_connection) {
        return;
    }

    m_connection->close();
    m_connection.reset();
    spdlog::debug("Connection to {}:{} closed", m_connectionConfig.host, m_connectionConfig.port);
}

bool Client::isConnected() const {
    return m_connection && m_connection->isOpen();
}

}  // namespace pgframe
