#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "MockConnection.hpp"
#include "Client.hpp"
#include "ErrorHandler.hpp"
#include <algorithm>

using namespace pgframe;
using namespace pgframe::test;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::IsEmpty;
using ::testing::Not;

class ClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        connConfig_.host = "db.example";
        connConfig_.database = "analytics";
        connConfig_.user = "loader";
    }

    std::unique_ptr<Client> makeClient(ClientConfig clientConfig = ClientConfig()) {
        auto factory = std::make_unique<FakeConnectionFactory>();
        factory_ = factory.get();
        log_ = factory->log;
        return std::make_unique<Client>(connConfig_, std::move(clientConfig), std::move(factory));
    }

    // Catalog lookups report the target schema and table as present or absent
    void catalog(bool schemaPresent, bool tablePresent) {
        factory_->configure = [schemaPresent, tablePresent](MockConnection& conn) {
            conn.rowsFor = [=](const std::string& sql) -> std::optional<Table> {
                if (sql.find("information_schema.schemata") != std::string::npos) {
                    return countTable(schemaPresent ? 1 : 0);
                }
                if (sql.find("information_schema.tables") != std::string::npos) {
                    return countTable(tablePresent ? 1 : 0);
                }
                return std::nullopt;
            };
        };
    }

    size_t count(const std::string& sql) const {
        return static_cast<size_t>(std::count(log_->begin(), log_->end(), sql));
    }

    static Table sample() {
        Table table;
        table.addColumn(Column("id", ColumnKind::Integer, {int64_t{1}, int64_t{2}, int64_t{3}}));
        table.addColumn(Column("city", ColumnKind::Text,
                               {std::string("Oslo"), std::monostate{}, std::string("Lima")}));
        return table;
    }

    ConnectionConfig connConfig_;
    FakeConnectionFactory* factory_ = nullptr;
    std::shared_ptr<std::vector<std::string>> log_;
};

// Connection lifecycle
TEST_F(ClientTest, ConnectsLazily) {
    auto client = makeClient();

    EXPECT_EQ(factory_->connects, 0u);
    EXPECT_FALSE(client->isConnected());

    client->query("SELECT 1");

    EXPECT_EQ(factory_->connects, 1u);
    EXPECT_TRUE(client->isConnected());
    EXPECT_EQ(factory_->lastConfig.host, "db.example");
    EXPECT_EQ(factory_->lastConfig.database, "analytics");
}

TEST_F(ClientTest, ReusesOpenConnection) {
    auto client = makeClient();

    client->query("SELECT 1");
    client->query("SELECT 2");

    EXPECT_EQ(factory_->connects, 1u);
}

TEST_F(ClientTest, ReconnectsAfterClose) {
    auto client = makeClient();

    client->query("SELECT 1");
    client->close();
    EXPECT_FALSE(client->isConnected());

    client->query("SELECT 2");

    EXPECT_EQ(factory_->connects, 2u);
    EXPECT_THAT(*log_, ElementsAre("SELECT 1", "SELECT 2"));
}

TEST_F(ClientTest, ReconnectsWhenSessionDropped) {
    auto client = makeClient();

    client->query("SELECT 1");
    factory_->current->open = false;

    client->query("SELECT 2");

    EXPECT_EQ(factory_->connects, 2u);
    EXPECT_TRUE(client->isConnected());
}

TEST_F(ClientTest, CloseIsIdempotent) {
    auto client = makeClient();

    client->close();
    client->query("SELECT 1");
    client->close();
    client->close();

    EXPECT_FALSE(client->isConnected());
    EXPECT_EQ(factory_->connects, 1u);
}

TEST_F(ClientTest, ConnectionFailurePropagates) {
    auto client = makeClient();
    factory_->failure = "could not connect to server";

    try {
        client->query("SELECT 1");
        FAIL() << "Expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_EQ(e.sqlState(), "08001");
    }

    EXPECT_FALSE(client->isConnected());

    // The next call tries again
    factory_->failure.reset();
    client->query("SELECT 1");
    EXPECT_EQ(factory_->connects, 2u);
}

TEST_F(ClientTest, DestructorCommitsOpenTransaction) {
    auto client = makeClient();
    client->query("SELECT 1");
    factory_->current->status = TransactionStatus::InTransaction;
    auto log = log_;

    client.reset();

    EXPECT_EQ(log->back(), "COMMIT");
}

TEST_F(ClientTest, DestructorLeavesIdleSessionAlone) {
    auto client = makeClient();
    client->query("INSERT INTO t VALUES (1)");
    auto log = log_;

    client.reset();

    EXPECT_THAT(*log, ElementsAre("INSERT INTO t VALUES (1)"));
}

TEST_F(ClientTest, DestructorDoesNotCommitWithoutAutoCommit) {
    ClientConfig config;
    config.auto_commit = false;
    auto client = makeClient(config);
    client->query("INSERT INTO t VALUES (1)");
    auto log = log_;

    client.reset();

    EXPECT_THAT(*log, ElementsAre("BEGIN", "INSERT INTO t VALUES (1)"));
}

TEST_F(ClientTest, DestructorSwallowsCommitFailure) {
    auto client = makeClient();
    factory_->configure = [](MockConnection& conn) {
        conn.shouldFail = [](const std::string& sql) { return sql == "COMMIT"; };
    };
    client->query("SELECT 1");
    factory_->current->status = TransactionStatus::InTransaction;

    EXPECT_NO_THROW(client.reset());
}

TEST_F(ClientTest, DestructorWithoutConnectionIssuesNothing) {
    auto client = makeClient();
    auto log = log_;

    client.reset();

    EXPECT_THAT(*log, IsEmpty());
}

// Queries
TEST_F(ClientTest, QueryReturnsLastStatementRows) {
    auto client = makeClient();
    factory_->configure = [](MockConnection& conn) {
        conn.rowsFor = [](const std::string& sql) -> std::optional<Table> {
            if (sql == "SELECT 42") return countTable(1);
            return std::nullopt;
        };
    };

    auto result = client->query("CREATE TABLE t (x INT); SELECT 42");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->numRows(), 1u);
    EXPECT_THAT(*log_, ElementsAre("BEGIN", "CREATE TABLE t (x INT)", "SELECT 42", "COMMIT"));
}

TEST_F(ClientTest, QueryFailureRollsBack) {
    auto client = makeClient();
    factory_->configure = [](MockConnection& conn) {
        conn.shouldFail = [](const std::string& sql) {
            return sql == "INSERT INTO missing VALUES (1)";
        };
    };

    EXPECT_THROW(client->query("INSERT INTO t VALUES (1); INSERT INTO missing VALUES (1)"),
                 QueryError);

    EXPECT_EQ(log_->back(), "ROLLBACK");
    EXPECT_EQ(factory_->current->committedWrites, 0u);
}

TEST_F(ClientTest, ConnectionClassFailureDiscardsSession) {
    auto client = makeClient();
    factory_->configure = [](MockConnection& conn) {
        ON_CALL(conn, execute("SELECT pg_sleep(60)")).WillByDefault([](const std::string&) {
            return FakeResultSet::error("terminating connection due to administrator command",
                                        "57P01");
        });
    };

    try {
        client->query("SELECT pg_sleep(60)");
        FAIL() << "Expected QueryError";
    } catch (const QueryError& e) {
        EXPECT_EQ(e.sqlState(), "57P01");
    }
    EXPECT_FALSE(client->isConnected());

    client->query("SELECT 1");
    EXPECT_EQ(factory_->connects, 2u);
}

TEST_F(ClientTest, StatementFailureKeepsSession) {
    auto client = makeClient();
    factory_->configure = [](MockConnection& conn) {
        conn.shouldFail = [](const std::string& sql) { return sql == "SELECT * FROM missing"; };
    };

    EXPECT_THROW(client->query("SELECT * FROM missing"), QueryError);

    EXPECT_TRUE(client->isConnected());
    client->query("SELECT 1");
    EXPECT_EQ(factory_->connects, 1u);
}

// Inserts
TEST_F(ClientTest, InsertEmptyTableTouchesNothing) {
    auto client = makeClient();
    Table empty;
    empty.addColumn(Column("id", ColumnKind::Integer));

    EXPECT_EQ(client->insertTable(empty, "people"), 0u);

    EXPECT_EQ(factory_->connects, 0u);
    EXPECT_THAT(*log_, IsEmpty());
}

TEST_F(ClientTest, InsertInvalidNameDoesNotConnect) {
    auto client = makeClient();

    EXPECT_THROW(client->insertTable(sample(), "a.b.c"), InvalidIdentifier);
    EXPECT_EQ(factory_->connects, 0u);
}

TEST_F(ClientTest, InsertCreatesTableThenInserts) {
    auto client = makeClient();
    catalog(true, false);

    auto inserted = client->insertTable(sample(), "people");

    EXPECT_EQ(inserted, 3u);
    EXPECT_THAT(*log_, Contains("CREATE TABLE public.people (id INTEGER, city VARCHAR(255))"));
    EXPECT_EQ(count("INSERT INTO public.people (id, city) VALUES ($1, $2)"), 3u);
    EXPECT_EQ(log_->back(), "COMMIT");

    auto create = std::find(log_->begin(), log_->end(),
                            "CREATE TABLE public.people (id INTEGER, city VARCHAR(255))");
    auto firstInsert = std::find(log_->begin(), log_->end(),
                                 "INSERT INTO public.people (id, city) VALUES ($1, $2)");
    EXPECT_LT(create, firstInsert);
}

TEST_F(ClientTest, InsertTruncatesExistingTable) {
    auto client = makeClient();
    catalog(true, true);

    client->insertTable(sample(), "people");

    EXPECT_THAT(*log_, Contains("TRUNCATE TABLE public.people"));
    EXPECT_THAT(*log_, Not(Contains(::testing::HasSubstr("CREATE TABLE"))));
}

TEST_F(ClientTest, InsertFailsOnExistingTableUnderFailPolicy) {
    ClientConfig config;
    config.existing_table_policy = ExistingTablePolicy::Fail;
    auto client = makeClient(config);
    catalog(true, true);

    EXPECT_THROW(client->insertTable(sample(), "people"), AlreadyExists);
    EXPECT_THAT(*log_, Not(Contains(::testing::HasSubstr("INSERT"))));
}

TEST_F(ClientTest, InsertUsesConfiguredDefaultSchemaAndBatchSize) {
    ClientConfig config;
    config.default_schema = "staging";
    config.batch_size = 2;
    auto client = makeClient(config);
    catalog(true, false);

    client->insertTable(sample(), "people");

    EXPECT_EQ(count("INSERT INTO staging.people (id, city) VALUES ($1, $2)"), 3u);
    EXPECT_EQ(count("BEGIN"), 2u);
}

TEST_F(ClientTest, InsertOverwriteReplacesTable) {
    auto client = makeClient();
    catalog(true, true);

    client->insertTable(sample(), "people", true);

    EXPECT_THAT(*log_, Contains("DROP TABLE IF EXISTS public.people"));
    EXPECT_THAT(*log_, Contains("CREATE TABLE public.people (id INTEGER, city VARCHAR(255))"));
}

// Catalog
TEST_F(ClientTest, CatalogCallsUseDefaultSchema) {
    ClientConfig config;
    config.default_schema = "staging";
    auto client = makeClient(config);
    catalog(true, true);

    EXPECT_TRUE(client->tableExists("people"));
    EXPECT_TRUE(client->schemaExists("staging"));
}

TEST_F(ClientTest, DescribeTableLooksUpStoredName) {
    auto client = makeClient();
    factory_->configure = [](MockConnection& conn) {
        EXPECT_CALL(conn, executeParams(::testing::HasSubstr("information_schema.columns"),
                                        ElementsAre(SqlParam("public"), SqlParam("sales"))));
    };

    client->describeTable("Sales");
}

TEST_F(ClientTest, SchemaDdlIsEscaped) {
    auto client = makeClient();

    client->createSchema("Sales Data");
    client->dropSchema("Sales Data", true);

    EXPECT_THAT(*log_, ElementsAre("CREATE SCHEMA IF NOT EXISTS \"Sales Data\"",
                                   "DROP SCHEMA IF EXISTS \"Sales Data\" CASCADE"));
}

TEST_F(ClientTest, RowCountReadsCount) {
    auto client = makeClient();
    factory_->configure = [](MockConnection& conn) {
        conn.rowsFor = [](const std::string& sql) -> std::optional<Table> {
            if (sql.rfind("SELECT COUNT(*)", 0) == 0) {
                Table table;
                table.addColumn(Column("count", ColumnKind::Integer, {int64_t{17}}));
                return table;
            }
            return std::nullopt;
        };
    };

    EXPECT_EQ(client->rowCount("sales.orders"), 17u);
    EXPECT_THAT(*log_, ElementsAre("SELECT COUNT(*) AS count FROM sales.orders"));
}

// Transactions
TEST_F(ClientTest, ManualCommitWithoutAutoCommit) {
    ClientConfig config;
    config.auto_commit = false;
    auto client = makeClient(config);

    client->query("INSERT INTO t VALUES (1)");
    EXPECT_EQ(factory_->current->committedWrites, 0u);

    client->commit();

    EXPECT_EQ(factory_->current->committedWrites, 1u);
    EXPECT_EQ(factory_->current->status, TransactionStatus::Idle);
}

TEST_F(ClientTest, ManualRollbackWithoutAutoCommit) {
    ClientConfig config;
    config.auto_commit = false;
    auto client = makeClient(config);

    client->query("INSERT INTO t VALUES (1)");
    client->rollback();

    EXPECT_EQ(factory_->current->committedWrites, 0u);
    EXPECT_EQ(log_->back(), "ROLLBACK");
}

TEST_F(ClientTest, CommitWithoutTransactionIsNoOp) {
    auto client = makeClient();

    client->commit();
    client->query("SELECT 1");
    client->commit();

    EXPECT_THAT(*log_, ElementsAre("SELECT 1"));
}

TEST_F(ClientTest, EnablingAutoCommitCommitsPendingWork) {
    ClientConfig config;
    config.auto_commit = false;
    auto client = makeClient(config);

    client->query("INSERT INTO t VALUES (1)");
    client->setAutoCommit(true);

    EXPECT_TRUE(client->autoCommit());
    EXPECT_EQ(factory_->current->committedWrites, 1u);
}

TEST_F(ClientTest, BuildsFromConfig) {
    Config config;
    config.connection.host = "warehouse";
    config.client.batch_size = 10;

    auto factory = std::make_unique<FakeConnectionFactory>();
    auto* raw = factory.get();
    Client client(config, std::move(factory));

    client.query("SELECT 1");

    EXPECT_EQ(raw->lastConfig.host, "warehouse");
    EXPECT_EQ(client.clientConfig().batch_size, 10u);
}
