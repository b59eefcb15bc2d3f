#include "TableProvisioner.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace pgframe {

std::string provisionActionToString(TableProvisioner::Action action) {
    switch (action) {
        case TableProvisioner::Action::None: return "none";
        case TableProvisioner::Action::Created: return "created";
        case TableProvisioner::Action::Replaced: return "replaced";
        case TableProvisioner::Action::Truncated: return "truncated";
    }
    return "none";
}

TableProvisioner::TableProvisioner(QueryExecutor& executor, PostgreSQLCatalog& catalog,
                                   ExistingTablePolicy policy)
    : m_executor(executor), m_catalog(catalog), m_policy(policy) {
}

std::string TableProvisioner::createTableSql(const QualifiedName& name, const ColumnTypes& types) {
    std::ostringstream sql;
    sql << "CREATE TABLE " << name.escaped() << " (";
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << Identifier::escapeIdentifier(types[i].first) << " " << types[i].second;
    }
    sql << ")";
    return sql.str();
}

std::string TableProvisioner::dropTableSql(const QualifiedName& name) {
    return "DROP TABLE IF EXISTS " + name.escaped();
}

std::string TableProvisioner::truncateTableSql(const QualifiedName& name) {
    return "TRUNCATE TABLE " + name.escaped();
}

TableProvisioner::Action TableProvisioner::ensureTable(const Table& table,
                                                       const std::string& qualifiedName,
                                                       bool overwrite,
                                                       const std::string& defaultSchema) {
    return ensureTable(table, Identifier::parseQualifiedName(qualifiedName, defaultSchema),
                       overwrite);
}

TableProvisioner::Action TableProvisioner::ensureTable(const Table& table,
                                                       const QualifiedName& name,
                                                       bool overwrite) {
    ErrorContext ctx("ensureTable " + name.str());

    if (table.empty()) {
        spdlog::debug("No rows for {}, nothing to provision", name.str());
        return Action::None;
    }

    if (!m_catalog.schemaExists(name.schema)) {
        m_catalog.createSchema(name.schema);
    }

    bool exists = m_catalog.tableExists(name);

    if (exists && !overwrite) {
        if (m_policy == ExistingTablePolicy::Fail) {
            throw AlreadyExists(name.str());
        }
        m_executor.executeStatements({truncateTableSql(name)});
        spdlog::info("Truncated table {}", name.str());
        return Action::Truncated;
    }

    std::string create = createTableSql(name, TypeInference::inferTypes(table));

    if (exists) {
        // One multi-statement call, so DROP and CREATE commit together
        m_executor.executeStatements({dropTableSql(name), create});
        spdlog::info("Replaced table {}", name.str());
        return Action::Replaced;
    }

    m_executor.executeStatements({create});
    spdlog::info("Created table {}", name.str());
    return Action::Created;
}

}  // namespace pgframe
