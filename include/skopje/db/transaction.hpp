#pragma once

#include <libpq-fe.h>

namespace skopje::db {

/**
 * RAII transaction wrapper. Rolls back on exception/early exit.
 *
 * Usage:
 *   {
 *       Transaction tx(conn);
 *       exec(conn, "INSERT ...");
 *       exec(conn, "UPDATE ...");
 *       tx.commit();  // Explicit commit
 *   }  // Rolls back if commit() not called
 *
 * BEGIN and COMMIT failures throw StoreError.
 */
class Transaction {
public:
    explicit Transaction(PGconn* conn);
    ~Transaction();

    void commit();
    void rollback();

    bool active() const { return active_; }

    // Non-copyable, non-movable
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

private:
    PGconn* conn_;
    bool active_;
};

} // namespace skopje::db
