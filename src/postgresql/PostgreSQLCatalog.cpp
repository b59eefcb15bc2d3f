/**
 * @file PostgreSQLCatalog.cpp
 * @brief Implementation of PostgreSQL schema and table introspection.
 *
 * Every name compared against a catalog view is bound as a parameter ($1,
 * $2) in its stored form (Identifier::catalogName); names placed in DDL text
 * are escaped with Identifier::escapeIdentifier.
 */

#include "PostgreSQLCatalog.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace pgframe {

// ============================================================================
// Construction
// ============================================================================

PostgreSQLCatalog::PostgreSQLCatalog(QueryExecutor& executor)
    : m_executor(executor) {
}

// ============================================================================
// Schema Operations
// ============================================================================

Table PostgreSQLCatalog::listSchemas() {
    auto result = m_executor.executeParams(
        "SELECT schema_name FROM information_schema.schemata "
        "WHERE catalog_name = current_database() "
        "AND schema_name NOT IN ('pg_catalog', 'information_schema', 'pg_toast') "
        "AND schema_name NOT LIKE 'pg\\_temp\\_%' "
        "AND schema_name NOT LIKE 'pg\\_toast\\_temp\\_%' "
        "ORDER BY schema_name",
        {});

    return result ? *result : Table();
}

bool PostgreSQLCatalog::schemaExists(const std::string& schema) {
    auto result = m_executor.executeParams(
        "SELECT 1 FROM information_schema.schemata WHERE schema_name = $1",
        {Identifier::catalogName(schema)});

    return result && result->numRows() > 0;
}

void PostgreSQLCatalog::createSchema(const std::string& schema) {
    ErrorContext ctx("createSchema " + schema);

    m_executor.executeStatements(
        {"CREATE SCHEMA IF NOT EXISTS " + Identifier::escapeIdentifier(schema)});
    spdlog::info("Created schema {}", schema);
}

void PostgreSQLCatalog::dropSchema(const std::string& schema, bool cascade) {
    ErrorContext ctx("dropSchema " + schema);

    std::string sql = "DROP SCHEMA IF EXISTS " + Identifier::escapeIdentifier(schema);
    if (cascade) {
        sql += " CASCADE";
    }

    m_executor.executeStatements({sql});
    spdlog::info("Dropped schema {}{}", schema, cascade ? " (cascade)" : "");
}

// ============================================================================
// Table Operations
// ============================================================================

Table PostgreSQLCatalog::listTables(const std::string& schema) {
    auto result = m_executor.executeParams(
        "SELECT table_name FROM information_schema.tables "
        "WHERE table_schema = $1 "
        "AND table_type = 'BASE TABLE' "
        "ORDER BY table_name",
        {Identifier::catalogName(schema)});

    return result ? *result : Table();
}

bool PostgreSQLCatalog::tableExists(const QualifiedName& name) {
    auto result = m_executor.executeParams(
        "SELECT 1 FROM information_schema.tables "
        "WHERE table_schema = $1 AND table_name = $2",
        {Identifier::catalogName(name.schema), Identifier::catalogName(name.table)});

    return result && result->numRows() > 0;
}

Table PostgreSQLCatalog::describeTable(const QualifiedName& name) {
    auto result = m_executor.executeParams(
        "SELECT column_name, data_type, character_maximum_length, is_nullable, column_default "
        "FROM information_schema.columns "
        "WHERE table_schema = $1 AND table_name = $2 "
        "ORDER BY ordinal_position",
        {Identifier::catalogName(name.schema), Identifier::catalogName(name.table)});

    return result ? *result : Table();
}

uint64_t PostgreSQLCatalog::rowCount(const QualifiedName& name) {
    auto result =
        m_executor.executeStatements({"SELECT COUNT(*) AS count FROM " + name.escaped()});

    if (!result || result->empty()) {
        return 0;
    }

    const Cell& cell = result->at(0, 0);
    if (auto count = std::get_if<int64_t>(&cell)) {
        return static_cast<uint64_t>(*count);
    }
    return 0;
}

}  // namespace pgframe
