#pragma once

#include <string>
#include <libpq-fe.h>

#include "skopje/db/result.hpp"
#include "skopje/db/types.hpp"

namespace skopje::db {

/**
 * Server-side prepared statement bound to one connection.
 *
 * Each instance gets a unique name so several statements can be prepared on a
 * pooled connection without colliding. The statement is deallocated when the
 * object is destroyed.
 */
class PreparedStatement {
public:
    // Prepare sql on conn. Throws StoreError when the server rejects it.
    PreparedStatement(PGconn* conn, const std::string& sql);
    ~PreparedStatement();

    PreparedStatement(PreparedStatement&& other) noexcept;
    PreparedStatement& operator=(PreparedStatement&&) = delete;
    PreparedStatement(const PreparedStatement&) = delete;
    PreparedStatement& operator=(const PreparedStatement&) = delete;

    // Number of $n placeholders the server found in the statement.
    int param_count() const { return param_count_; }

    const std::string& sql() const { return sql_; }
    const std::string& name() const { return name_; }

    /**
     * Execute with params bound to $1..$n.
     * Throws SchemaMismatchError before sending anything when params.size()
     * differs from param_count(); StoreError when execution fails.
     */
    Result execute(const Row& params) const;

private:
    PGconn* conn_;
    std::string sql_;
    std::string name_;
    int param_count_;
};

} // namespace skopje::db
