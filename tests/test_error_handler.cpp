#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"

using namespace pgframe;

class ErrorHandlerTest : public ::testing::Test {
};

// SQLSTATE classification tests
TEST_F(ErrorHandlerTest, ConnectionClassIsConnectionError) {
    EXPECT_TRUE(ErrorHandler::isConnectionError("08000"));
    EXPECT_TRUE(ErrorHandler::isConnectionError("08001"));
    EXPECT_TRUE(ErrorHandler::isConnectionError("08003"));
    EXPECT_TRUE(ErrorHandler::isConnectionError("08006"));
    EXPECT_TRUE(ErrorHandler::isConnectionError("08P01"));
}

TEST_F(ErrorHandlerTest, ShutdownIsConnectionError) {
    EXPECT_TRUE(ErrorHandler::isConnectionError("57P01"));
    EXPECT_TRUE(ErrorHandler::isConnectionError("57P02"));
    EXPECT_TRUE(ErrorHandler::isConnectionError("57P03"));
}

TEST_F(ErrorHandlerTest, IsNotConnectionError) {
    EXPECT_FALSE(ErrorHandler::isConnectionError("42P01"));
    EXPECT_FALSE(ErrorHandler::isConnectionError("42601"));
    EXPECT_FALSE(ErrorHandler::isConnectionError("57014"));
    EXPECT_FALSE(ErrorHandler::isConnectionError("08"));
    EXPECT_FALSE(ErrorHandler::isConnectionError(""));
}

// Error message tests
TEST_F(ErrorHandlerTest, GetErrorMessageNullConnection) {
    EXPECT_EQ(ErrorHandler::getErrorMessage(static_cast<const PGconn*>(nullptr)), "No connection");
}

TEST_F(ErrorHandlerTest, GetErrorMessageNullResult) {
    EXPECT_EQ(ErrorHandler::getErrorMessage(static_cast<const PGresult*>(nullptr)), "No result");
    EXPECT_EQ(ErrorHandler::getSqlState(nullptr), "");
}

TEST_F(ErrorHandlerTest, TrimMessageRemovesTrailingNewline) {
    EXPECT_EQ(ErrorHandler::trimMessage("ERROR:  relation \"x\" does not exist\n"),
              "ERROR:  relation \"x\" does not exist");
    EXPECT_EQ(ErrorHandler::trimMessage("\n"), "");
    EXPECT_EQ(ErrorHandler::trimMessage("plain"), "plain");
}

// ErrorContext tests
class ErrorContextTest : public ::testing::Test {
};

TEST_F(ErrorContextTest, SetAndGetContext) {
    EXPECT_TRUE(ErrorContext::current().empty());

    {
        ErrorContext ctx("insertTable");
        EXPECT_EQ(ErrorContext::current(), "insertTable");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, NestedContext) {
    {
        ErrorContext ctx1("level1");
        EXPECT_EQ(ErrorContext::current(), "level1");

        {
            ErrorContext ctx2("level2");
            EXPECT_EQ(ErrorContext::current(), "level1 > level2");

            {
                ErrorContext ctx3("level3");
                EXPECT_EQ(ErrorContext::current(), "level1 > level2 > level3");
            }

            EXPECT_EQ(ErrorContext::current(), "level1 > level2");
        }

        EXPECT_EQ(ErrorContext::current(), "level1");
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

TEST_F(ErrorContextTest, ContextRestoredOnException) {
    try {
        ErrorContext ctx1("outer");
        {
            ErrorContext ctx2("inner");
            throw std::runtime_error("test");
        }
    } catch (const std::runtime_error&) {
        // Context should be restored even on exception
    }

    EXPECT_TRUE(ErrorContext::current().empty());
}

// Exception hierarchy tests
class DatabaseExceptionTest : public ::testing::Test {
};

TEST_F(DatabaseExceptionTest, QueryErrorCarriesIndexAndMessage) {
    QueryError ex(2, "relation \"nope\" does not exist", "42P01");

    EXPECT_EQ(ex.statementIndex(), 2u);
    EXPECT_EQ(ex.driverMessage(), "relation \"nope\" does not exist");
    EXPECT_EQ(ex.sqlState(), "42P01");
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("Statement 2"));
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("does not exist"));
}

TEST_F(DatabaseExceptionTest, InsertErrorCarriesBatchIndex) {
    InsertError ex(3, "value too long", "22001");

    EXPECT_EQ(ex.batchIndex(), 3u);
    EXPECT_EQ(ex.driverMessage(), "value too long");
    EXPECT_EQ(ex.sqlState(), "22001");
    EXPECT_THAT(ex.what(), ::testing::HasSubstr("Batch 3"));
}

TEST_F(DatabaseExceptionTest, AlreadyExistsNamesTable) {
    AlreadyExists ex("sales.orders");

    EXPECT_THAT(ex.what(), ::testing::HasSubstr("sales.orders"));
    EXPECT_EQ(ex.sqlState(), "42P07");
}

TEST_F(DatabaseExceptionTest, AllErrorsCatchableAsDatabaseException) {
    auto caught = [](auto&& thrower) {
        try {
            thrower();
        } catch (const DatabaseException&) {
            return true;
        }
        return false;
    };

    EXPECT_TRUE(caught([] { throw ConnectionError("refused", "08001"); }));
    EXPECT_TRUE(caught([] { throw InvalidIdentifier("a.b.c"); }));
    EXPECT_TRUE(caught([] { throw QueryError(1, "boom"); }));
    EXPECT_TRUE(caught([] { throw InsertError(1, "boom"); }));
    EXPECT_TRUE(caught([] { throw AlreadyExists("public.t"); }));
}

TEST_F(DatabaseExceptionTest, CanBeCaughtAsRuntimeError) {
    bool caught = false;

    try {
        throw QueryError(1, "test");
    } catch (const std::runtime_error&) {
        caught = true;
    }

    EXPECT_TRUE(caught);
}
