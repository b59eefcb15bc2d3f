#include "Transaction.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace pgframe {

Transaction::Transaction(Connection& conn, Mode mode)
    : m_conn(conn), m_mode(mode) {
    if (m_conn.transactionStatus() != TransactionStatus::Idle) {
        // Joining a transaction the caller left open
        return;
    }

    auto result = m_conn.execute("BEGIN");
    if (!result->isOk()) {
        throw DatabaseException("BEGIN failed: " + result->errorMessage(), result->sqlState());
    }
    m_began = true;
}

Transaction::~Transaction() {
    if (!m_finished) {
        rollback();
    }
}

void Transaction::commit() {
    if (m_finished) {
        throw std::logic_error("Transaction already finished");
    }
    m_finished = true;

    if (m_mode == Mode::Deferred) {
        return;
    }

    auto result = m_conn.execute("COMMIT");
    if (!result->isOk()) {
        throw DatabaseException("COMMIT failed: " + result->errorMessage(), result->sqlState());
    }
}

void Transaction::rollback() noexcept {
    m_finished = true;

    try {
        if (!m_conn.isOpen() || m_conn.transactionStatus() == TransactionStatus::Idle) {
            return;
        }

        auto result = m_conn.execute("ROLLBACK");
        if (!result->isOk()) {
            spdlog::warn("[{}] ROLLBACK failed: {}", ErrorContext::current(),
                         result->errorMessage());
        }
    } catch (const std::exception& e) {
        spdlog::warn("ROLLBACK failed: {}", e.what());
    }
}

}  // namespace pgframe
