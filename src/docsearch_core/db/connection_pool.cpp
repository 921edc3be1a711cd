#include "docsearch_core/db/connection_pool.hpp"

#include "docsearch_core/db/sqlite_error_utils.hpp"
#include "docsearch_core/db/vector_functions.hpp"
#include "docsearch_core/errors.hpp"

namespace docsearch_core {

ConnectionPool::ConnectionPool(const std::string& db_path, int pool_size)
    : db_path_(db_path) {
  if (pool_size <= 0) {
    throw DatabaseError("Connection pool size must be greater than 0");
  }
  for (int i = 0; i < pool_size; ++i) {
    pool_.push(open_connection(db_path_));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::open_connection(const std::string& db_path) {
  try {
    auto db = std::make_unique<sqlite::database>(db_path);
    sqlite3* handle = db->connection().get();
    if (!handle) {
      throw DatabaseError("Failed to get native handle for connection to " + db_path);
    }

    // Run a test query to ensure the file is a readable database
    *db << "SELECT count(*) FROM sqlite_master;";
    *db << "PRAGMA journal_mode = WAL;";
    *db << "PRAGMA busy_timeout = 5000;";

    register_vector_functions(handle);
    return db;
  } catch (const sqlite::sqlite_exception& e) {
    throw DatabaseError(format_db_error("open_connection", e));
  }
}

std::unique_ptr<sqlite::database> ConnectionPool::get_connection() {
  std::unique_lock<std::mutex> lock(mtx_);
  // Wait until a connection is available or shutdown is requested
  cv_.wait(lock, [this] { return shutting_down_ || !pool_.empty(); });

  if (shutting_down_) {
    throw DatabaseError("Connection pool is shut down");
  }

  std::unique_ptr<sqlite::database> conn = std::move(pool_.front());
  pool_.pop();
  return conn;
}

void ConnectionPool::return_connection(std::unique_ptr<sqlite::database> conn) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!shutting_down_) {
    pool_.push(std::move(conn));
  }
  // Notify one waiting thread that a connection is available
  cv_.notify_one();
}

void ConnectionPool::shutdown() {
  std::lock_guard<std::mutex> lock(mtx_);
  shutting_down_ = true;
  while (!pool_.empty()) {
      pool_.pop();
  }
  cv_.notify_all();
}

}  // namespace docsearch_core
