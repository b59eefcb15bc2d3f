#pragma once

/**
 * @file TableProvisioner.hpp
 * @brief Makes sure a destination schema and table exist before an insert.
 */

#include "Config.hpp"
#include "Identifier.hpp"
#include "QueryExecutor.hpp"
#include "TypeInference.hpp"
#include "postgresql/PostgreSQLCatalog.hpp"
#include <string>

namespace pgframe {

/**
 * @class TableProvisioner
 * @brief Creates, replaces or empties the target table of an insert.
 *
 * Decision table for ensureTable():
 * - table missing            -> CREATE TABLE with inferred column types
 * - table exists, overwrite  -> DROP TABLE + CREATE TABLE in one transaction
 * - table exists, !overwrite -> TRUNCATE (ExistingTablePolicy::Truncate)
 *                               or AlreadyExists (ExistingTablePolicy::Fail)
 *
 * The schema is created first when missing. A table with no rows
 * provisions nothing.
 */
class TableProvisioner {
public:
    /// What ensureTable() did.
    enum class Action {
        None,
        Created,
        Replaced,
        Truncated
    };

    TableProvisioner(QueryExecutor& executor, PostgreSQLCatalog& catalog,
                     ExistingTablePolicy policy = ExistingTablePolicy::Truncate);

    /**
     * @throws InvalidIdentifier, QueryError, AlreadyExists
     */
    Action ensureTable(const Table& table, const std::string& qualifiedName, bool overwrite,
                       const std::string& defaultSchema = Identifier::DEFAULT_SCHEMA);

    Action ensureTable(const Table& table, const QualifiedName& name, bool overwrite);

    void setPolicy(ExistingTablePolicy policy) { m_policy = policy; }
    ExistingTablePolicy policy() const { return m_policy; }

    /// CREATE TABLE statement for the given declarations.
    static std::string createTableSql(const QualifiedName& name, const ColumnTypes& types);

    static std::string dropTableSql(const QualifiedName& name);
    static std::string truncateTableSql(const QualifiedName& name);

private:
    QueryExecutor& m_executor;
    PostgreSQLCatalog& m_catalog;
    ExistingTablePolicy m_policy;
};

std::string provisionActionToString(TableProvisioner::Action action);

}  // namespace pgframe
