#include "ErrorHandler.hpp"

namespace pgframe {

thread_local std::string ErrorContext::s_currentContext;

bool ErrorHandler::isConnectionError(const std::string& sqlstate) {
    // Class 08: 08000, 08003, 08006, 08001, 08004, 08007, 08P01
    if (sqlstate.size() == 5 && sqlstate.compare(0, 2, "08") == 0) {
        return true;
    }

    // 57P01 admin_shutdown, 57P02 crash_shutdown, 57P03 cannot_connect_now
    return sqlstate == "57P01" || sqlstate == "57P02" || sqlstate == "57P03";
}

std::string ErrorHandler::getErrorMessage(const PGconn* conn) {
    if (!conn) {
        return "No connection";
    }
    const char* err = PQerrorMessage(conn);
    if (err && *err) {
        return trimMessage(err);
    }
    return "Unknown PostgreSQL error";
}

std::string ErrorHandler::getErrorMessage(const PGresult* result) {
    if (!result) {
        return "No result";
    }
    const char* err = PQresultErrorMessage(result);
    if (err && *err) {
        return trimMessage(err);
    }
    return PQresStatus(PQresultStatus(result));
}

std::string ErrorHandler::getSqlState(const PGresult* result) {
    if (!result) {
        return "";
    }
    const char* state = PQresultErrorField(result, PG_DIAG_SQLSTATE);
    return state ? state : "";
}

std::string ErrorHandler::trimMessage(const std::string& message) {
    auto end = message.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) return "";
    return message.substr(0, end + 1);
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

DatabaseException::DatabaseException(const std::string& message, const std::string& sqlstate)
    : std::runtime_error(message)
    , m_sqlstate(sqlstate) {
}

InvalidIdentifier::InvalidIdentifier(const std::string& message)
    : DatabaseException(message) {
}

QueryError::QueryError(size_t statementIndex, const std::string& driverMessage,
                       const std::string& sqlstate)
    : DatabaseException("Statement " + std::to_string(statementIndex) + " failed: " + driverMessage,
                        sqlstate)
    , m_statementIndex(statementIndex)
    , m_driverMessage(driverMessage) {
}

InsertError::InsertError(size_t batchIndex, const std::string& driverMessage,
                         const std::string& sqlstate)
    : DatabaseException("Batch " + std::to_string(batchIndex) + " failed: " + driverMessage,
                        sqlstate)
    , m_batchIndex(batchIndex)
    , m_driverMessage(driverMessage) {
}

AlreadyExists::AlreadyExists(const std::string& qualifiedName)
    : DatabaseException("Table already exists: " + qualifiedName,
                        ErrorHandler::SQLSTATE_DUPLICATE_TABLE) {
}

}  // namespace pgframe
