#include "docsearch_core/db/database_manager.hpp"

#include <iostream>

#include "docsearch_core/errors.hpp"

namespace docsearch_core {

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::initialize(const std::filesystem::path& db_path, int pool_size) {
  if (is_initialized_) {
    return;
  }

  // Ensure parent directory exists
  if (db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      throw DatabaseError("Failed to create database directory " +
                          db_path.parent_path().string() + ": " + ec.message());
    }
  }

  pool_ = std::make_unique<ConnectionPool>(db_path.string(), pool_size);
  db_path_ = db_path;
  is_initialized_ = true;
  std::clog << "[Database] Opened " << db_path.string() << " with " << pool_size
            << " connection(s)" << std::endl;
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  pool_.reset();
  is_initialized_ = false;
}

std::unique_ptr<sqlite::database> DatabaseManager::get_connection() {
  if (!is_initialized_) {
    throw DatabaseError("DatabaseManager has not been initialized.");
  }
  return pool_->get_connection();
}

void DatabaseManager::return_connection(std::unique_ptr<sqlite::database> conn) {
  if (!is_initialized_) {
    return;
  }
  pool_->return_connection(std::move(conn));
}

}  // namespace docsearch_core
