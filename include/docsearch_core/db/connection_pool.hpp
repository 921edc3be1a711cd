#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace docsearch_core {

class ConnectionPool {
public:
    ConnectionPool(const std::string& db_path, int pool_size);

    // Blocks until a connection is free.
    std::unique_ptr<sqlite::database> get_connection();

    // Returns a connection to the pool.
    void return_connection(std::unique_ptr<sqlite::database> conn);
    void shutdown();

    // Opens a connection with pragmas applied and vector functions declared.
    static std::unique_ptr<sqlite::database> open_connection(const std::string& db_path);

private:
    bool shutting_down_ = false;
    std::string db_path_;
    std::queue<std::unique_ptr<sqlite::database>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace docsearch_core
