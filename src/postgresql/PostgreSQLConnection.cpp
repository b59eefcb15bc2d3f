#include "PostgreSQLConnection.hpp"
#include "PostgreSQLResultSet.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace pgframe {

PostgreSQLConnection::PostgreSQLConnection(PGconn* conn)
    : m_conn(conn) {
}

PostgreSQLConnection::~PostgreSQLConnection() {
    close();
}

bool PostgreSQLConnection::isOpen() const {
    return m_conn != nullptr && PQstatus(m_conn) == CONNECTION_OK;
}

TransactionStatus PostgreSQLConnection::transactionStatus() const {
    if (!m_conn) return TransactionStatus::Unknown;

    switch (PQtransactionStatus(m_conn)) {
        case PQTRANS_IDLE:
            return TransactionStatus::Idle;
        case PQTRANS_INTRANS:
        case PQTRANS_ACTIVE:
            return TransactionStatus::InTransaction;
        case PQTRANS_INERROR:
            return TransactionStatus::Failed;
        default:
            return TransactionStatus::Unknown;
    }
}

std::unique_ptr<ResultSet> PostgreSQLConnection::execute(const std::string& sql) {
    if (!m_conn) {
        return std::make_unique<PostgreSQLResultSet>(nullptr, "Connection is closed");
    }

    PGresult* res = PQexec(m_conn, sql.c_str());
    return std::make_unique<PostgreSQLResultSet>(res, res ? "" : errorMessage());
}

std::unique_ptr<ResultSet> PostgreSQLConnection::executeParams(const std::string& sql,
                                                               const std::vector<SqlParam>& params) {
    if (!m_conn) {
        return std::make_unique<PostgreSQLResultSet>(nullptr, "Connection is closed");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& param : params) {
        values.push_back(param ? param->c_str() : nullptr);
    }

    PGresult* res = PQexecParams(m_conn, sql.c_str(), static_cast<int>(values.size()), nullptr,
                                 values.data(), nullptr, nullptr, 0);
    return std::make_unique<PostgreSQLResultSet>(res, res ? "" : errorMessage());
}

void PostgreSQLConnection::close() {
    if (m_conn) {
        PQfinish(m_conn);
        m_conn = nullptr;
        spdlog::debug("Closed PostgreSQL connection");
    }
}

std::string PostgreSQLConnection::errorMessage() const {
    return ErrorHandler::getErrorMessage(m_conn);
}

}  // namespace pgframe
