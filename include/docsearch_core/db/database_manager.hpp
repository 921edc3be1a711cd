#pragma once

#include "docsearch_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace docsearch_core {

// Owns the connection pool for one database file. Built once in main and
// handed to the stores that need it.
class DatabaseManager {
public:
    DatabaseManager() = default;
    ~DatabaseManager();

    void initialize(const std::filesystem::path& db_path, int pool_size);

    // These methods are used by the PooledConnection guard
    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);

    void shutdown();

    bool is_initialized() const { return is_initialized_; }
    const std::filesystem::path& db_path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    std::unique_ptr<ConnectionPool> pool_;
    std::filesystem::path db_path_;
    bool is_initialized_ = false;
};

} // namespace docsearch_core
