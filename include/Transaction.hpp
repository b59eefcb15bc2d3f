#pragma once

#include "Connection.hpp"

namespace pgframe {

/**
 * @class Transaction
 * @brief Scope guard for one transaction on a Connection.
 *
 * The constructor issues BEGIN unless the session already has a transaction
 * open. Anything not committed when the guard goes out of scope is rolled
 * back; the destructor never throws.
 *
 * In Deferred mode commit() leaves the transaction open for the caller to
 * end later (used when auto-commit is disabled). A failure still rolls the
 * whole transaction back.
 */
class Transaction {
public:
    enum class Mode {
        Commit,
        Deferred
    };

    /**
     * @throws DatabaseException if BEGIN fails.
     */
    Transaction(Connection& conn, Mode mode);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    /**
     * @brief Make the work permanent (Commit mode) or hand it over (Deferred).
     * @throws DatabaseException if COMMIT fails; the transaction is over either way.
     */
    void commit();

    /// Roll back now; later commit() calls are invalid.
    void rollback() noexcept;

    bool finished() const { return m_finished; }

    // BEGIN was issued by this guard
    bool began() const { return m_began; }

private:
    Connection& m_conn;
    Mode m_mode;
    bool m_began = false;
    bool m_finished = false;
};

}  // namespace pgframe
