#pragma once
#include "docsearch_core/db/database_manager.hpp"
#include "docsearch_core/errors.hpp"
#include <sqlite_modern_cpp.h>
#include <memory>

namespace docsearch_core {
class PooledConnection {
public:
    // Constructor gets a connection from the manager's pool
    explicit PooledConnection(DatabaseManager& manager)
    : manager_(manager), conn_(manager.get_connection()) {
    if (!conn_) {
        throw DatabaseError("Failed to acquire database connection: system is shutting down.");
    }
}
    // Destructor automatically returns the connection
    ~PooledConnection() {
        if (conn_) {
            manager_.return_connection(std::move(conn_));
        }
    }

    // Allow access to the underlying database object
    sqlite::database* operator->() const { return conn_.get(); }
    sqlite::database& operator*() const { return *conn_; }

    sqlite3* native_handle() const { return conn_->connection().get(); }

    // Delete copy/move to prevent ownership issues
    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

private:
    DatabaseManager& manager_;
    std::unique_ptr<sqlite::database> conn_;
};
}  // namespace docsearch_core
