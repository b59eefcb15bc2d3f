#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MockConnection.hpp"
#include "TableProvisioner.hpp"
#include "ErrorHandler.hpp"
#include <set>

using namespace pgframe;
using namespace pgframe::test;
using ::testing::_;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::NiceMock;
using ::testing::HasSubstr;
using ::testing::Not;

class TableProvisionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        conn_.simulateSession();
        conn_.rowsFor = [this](const std::string& sql) -> std::optional<Table> {
            if (sql.find("information_schema.schemata") != std::string::npos) {
                return countTable(schemaExists_ ? 1 : 0);
            }
            if (sql.find("information_schema.tables") != std::string::npos) {
                return countTable(tableExists_ ? 1 : 0);
            }
            return std::nullopt;
        };

        table_.addColumn(Column("id", ColumnKind::Integer, {int64_t{1}, int64_t{2}}));
        table_.addColumn(Column("name", ColumnKind::Text, {std::string("a"), std::monostate{}}));
    }

    // Statements other than catalog lookups
    std::vector<std::string> ddl() const {
        std::vector<std::string> out;
        for (const auto& sql : *conn_.log) {
            if (sql.find("information_schema") == std::string::npos) out.push_back(sql);
        }
        return out;
    }

    // Table lookups match only names in the form the server stores them
    void storedTables(std::set<std::string> tables) {
        ON_CALL(conn_, executeParams(HasSubstr("information_schema.tables"), _))
            .WillByDefault([this, tables](const std::string& sql,
                                          const std::vector<SqlParam>& params) {
                conn_.log->push_back(sql);
                bool found = params.size() == 2 && params[0] == SqlParam("public") &&
                             params[1] && tables.count(*params[1]) > 0;
                return FakeResultSet::rows(countTable(found ? 1 : 0));
            });
    }

    NiceMock<MockConnection> conn_;
    TestSource source_{conn_};
    QueryExecutor executor_{source_};
    PostgreSQLCatalog catalog_{executor_};
    TableProvisioner provisioner_{executor_, catalog_};

    bool schemaExists_ = true;
    bool tableExists_ = false;
    Table table_;
};

TEST_F(TableProvisionerTest, CreatesMissingTable) {
    auto action = provisioner_.ensureTable(table_, "people", false);

    EXPECT_EQ(action, TableProvisioner::Action::Created);
    EXPECT_THAT(ddl(), ElementsAre("CREATE TABLE public.people (id INTEGER, name VARCHAR(255))"));
}

TEST_F(TableProvisionerTest, CreatesMissingSchemaFirst) {
    schemaExists_ = false;

    provisioner_.ensureTable(table_, "sales.people", false);

    EXPECT_THAT(ddl(), ElementsAre("CREATE SCHEMA IF NOT EXISTS sales",
                                   "CREATE TABLE sales.people (id INTEGER, name VARCHAR(255))"));
}

TEST_F(TableProvisionerTest, ExistingTableIsTruncatedByDefault) {
    tableExists_ = true;

    auto action = provisioner_.ensureTable(table_, "people", false);

    EXPECT_EQ(action, TableProvisioner::Action::Truncated);
    EXPECT_THAT(ddl(), ElementsAre("TRUNCATE TABLE public.people"));
}

TEST_F(TableProvisionerTest, ExistingTableFailsUnderFailPolicy) {
    tableExists_ = true;
    provisioner_.setPolicy(ExistingTablePolicy::Fail);

    EXPECT_THROW(provisioner_.ensureTable(table_, "people", false), AlreadyExists);
    EXPECT_THAT(ddl(), IsEmpty());
}

TEST_F(TableProvisionerTest, OverwriteDropsAndCreatesAtomically) {
    tableExists_ = true;

    auto action = provisioner_.ensureTable(table_, "people", true);

    EXPECT_EQ(action, TableProvisioner::Action::Replaced);
    EXPECT_THAT(ddl(), ElementsAre("BEGIN", "DROP TABLE IF EXISTS public.people",
                                   "CREATE TABLE public.people (id INTEGER, name VARCHAR(255))",
                                   "COMMIT"));
}

TEST_F(TableProvisionerTest, FailedCreateRollsBackDrop) {
    tableExists_ = true;
    conn_.shouldFail = [](const std::string& sql) { return sql.rfind("CREATE TABLE", 0) == 0; };

    try {
        provisioner_.ensureTable(table_, "people", true);
        FAIL() << "Expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_EQ(e.statementIndex(), 2u);
    }

    EXPECT_EQ(ddl().back(), "ROLLBACK");
    EXPECT_THAT(ddl(), Not(Contains("COMMIT")));
}

TEST_F(TableProvisionerTest, OverwriteOfMissingTableJustCreates) {
    auto action = provisioner_.ensureTable(table_, "people", true);

    EXPECT_EQ(action, TableProvisioner::Action::Created);
    EXPECT_THAT(ddl(), ElementsAre("CREATE TABLE public.people (id INTEGER, name VARCHAR(255))"));
}

TEST_F(TableProvisionerTest, EmptyTableProvisionsNothing) {
    Table empty;
    empty.addColumn(Column("id", ColumnKind::Integer));

    auto action = provisioner_.ensureTable(empty, "people", true);

    EXPECT_EQ(action, TableProvisioner::Action::None);
    EXPECT_THAT(*conn_.log, IsEmpty());
}

TEST_F(TableProvisionerTest, IdentifiersAreEscaped) {
    Table table;
    table.addColumn(Column("select", ColumnKind::Integer, {int64_t{1}}));
    table.addColumn(Column("full name", ColumnKind::Text, {std::string("x")}));

    provisioner_.ensureTable(table, "\"My Schema\".\"alter\"", false);

    EXPECT_THAT(ddl(), Contains("CREATE TABLE \"My Schema\".\"alter\" "
                                "(\"select\" INTEGER, \"full name\" VARCHAR(255))"));
}

TEST_F(TableProvisionerTest, InvalidNameIssuesNoSql) {
    EXPECT_THROW(provisioner_.ensureTable(table_, "a.b.c", false), InvalidIdentifier);
    EXPECT_THAT(*conn_.log, IsEmpty());
}

TEST_F(TableProvisionerTest, CatalogLookupsBindNames) {
    EXPECT_CALL(conn_, executeParams(::testing::HasSubstr("information_schema.schemata"),
                                     ElementsAre(SqlParam("sales"))));
    EXPECT_CALL(conn_, executeParams(::testing::HasSubstr("information_schema.tables"),
                                     ElementsAre(SqlParam("sales"), SqlParam("people"))));

    provisioner_.ensureTable(table_, "sales.people", false);
}

TEST_F(TableProvisionerTest, MixedCaseNameFindsFoldedTable) {
    storedTables({"sales"});

    auto action = provisioner_.ensureTable(table_, "Sales", false);

    EXPECT_EQ(action, TableProvisioner::Action::Truncated);
    EXPECT_THAT(ddl(), ElementsAre("TRUNCATE TABLE public.Sales"));
}

TEST_F(TableProvisionerTest, QuotedMixedCaseNameIsReplaced) {
    storedTables({"sales"});

    auto action = provisioner_.ensureTable(table_, "\"Sales\"", true);

    EXPECT_EQ(action, TableProvisioner::Action::Replaced);
    EXPECT_THAT(ddl(), ElementsAre("BEGIN", "DROP TABLE IF EXISTS public.Sales",
                                   "CREATE TABLE public.Sales (id INTEGER, name VARCHAR(255))",
                                   "COMMIT"));
}

TEST_F(TableProvisionerTest, QuotedNameIsLookedUpVerbatim) {
    storedTables({"Monthly Sales"});

    auto action = provisioner_.ensureTable(table_, "Monthly Sales", false);

    EXPECT_EQ(action, TableProvisioner::Action::Truncated);
    EXPECT_THAT(ddl(), ElementsAre("TRUNCATE TABLE public.\"Monthly Sales\""));
}

TEST_F(TableProvisionerTest, CatalogLookupsBindFoldedNames) {
    EXPECT_CALL(conn_, executeParams(HasSubstr("information_schema.schemata"),
                                     ElementsAre(SqlParam("staging"))));
    EXPECT_CALL(conn_, executeParams(HasSubstr("information_schema.tables"),
                                     ElementsAre(SqlParam("staging"), SqlParam("orders"))));

    provisioner_.ensureTable(table_, "Staging.ORDERS", false);
}

TEST_F(TableProvisionerTest, CreateTableSqlUsesInferredTypes) {
    Table table;
    table.addColumn(Column("big", ColumnKind::Integer, {int64_t{2147483648LL}}));
    table.addColumn(Column("ratio", ColumnKind::Float, {0.5}));
    table.addColumn(Column("ok", ColumnKind::Boolean, {true}));
    table.addColumn(Column("at", ColumnKind::TimestampTz, {std::string("2023-01-15 00:00:00+00")}));
    table.addColumn(Column("blank", ColumnKind::Float, {std::monostate{}}));

    auto sql = TableProvisioner::createTableSql(QualifiedName{"public", "m"},
                                                TypeInference::inferTypes(table));

    EXPECT_EQ(sql, "CREATE TABLE public.m (big BIGINT, ratio DOUBLE PRECISION, ok BOOLEAN, "
                   "at TIMESTAMP WITH TIME ZONE, blank VARCHAR(255))");
}

TEST_F(TableProvisionerTest, ActionNames) {
    EXPECT_EQ(provisionActionToString(TableProvisioner::Action::Created), "created");
    EXPECT_EQ(provisionActionToString(TableProvisioner::Action::Truncated), "truncated");
}
