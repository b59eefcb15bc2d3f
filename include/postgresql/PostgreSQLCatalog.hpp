#pragma once

/**
 * @file PostgreSQLCatalog.hpp
 * @brief Schema and table introspection and schema DDL for PostgreSQL.
 *
 * Lookups go through information_schema with schema and table names bound
 * as parameters; DDL identifiers go through Identifier::escapeIdentifier.
 */

#include "QueryExecutor.hpp"
#include "Identifier.hpp"
#include "Table.hpp"
#include <string>
#include <cstdint>

namespace pgframe {

/**
 * @class PostgreSQLCatalog
 * @brief Catalog queries used by Client and TableProvisioner.
 *
 * System Catalogs Used:
 * - information_schema.schemata: schema list and existence
 * - information_schema.tables: table list and existence
 * - information_schema.columns: column metadata for describeTable()
 *
 * System schemas (pg_catalog, information_schema, pg_toast and pg_temp_*)
 * are left out of listSchemas().
 */
class PostgreSQLCatalog {
public:
    explicit PostgreSQLCatalog(QueryExecutor& executor);

    // ----- Schema operations -----

    /**
     * @brief Get user schemas of the current database.
     * @return Table with one column, schema_name, ordered by name.
     */
    Table listSchemas();

    /**
     * @brief Check if a schema exists.
     */
    bool schemaExists(const std::string& schema);

    /**
     * @brief CREATE SCHEMA IF NOT EXISTS.
     */
    void createSchema(const std::string& schema);

    /**
     * @brief DROP SCHEMA IF EXISTS, optionally with CASCADE.
     */
    void dropSchema(const std::string& schema, bool cascade = false);

    // ----- Table operations -----

    /**
     * @brief Get base tables of a schema.
     * @return Table with one column, table_name, ordered by name.
     */
    Table listTables(const std::string& schema = Identifier::DEFAULT_SCHEMA);

    /**
     * @brief Check if a base table or view exists.
     */
    bool tableExists(const QualifiedName& name);

    /**
     * @brief Get column definitions.
     * @return Table with column_name, data_type, character_maximum_length,
     *         is_nullable and column_default, in ordinal order. Empty when
     *         the table does not exist.
     */
    Table describeTable(const QualifiedName& name);

    /**
     * @brief Exact row count (SELECT COUNT(*)).
     * @throws QueryError if the table does not exist.
     */
    uint64_t rowCount(const QualifiedName& name);

private:
    QueryExecutor& m_executor;
};

}  // namespace pgframe
