#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "../../common/utilities_test.hpp"
#include "docsearch_core/db/database_manager.hpp"
#include "docsearch_core/db/pooled_connection.hpp"
#include "docsearch_core/errors.hpp"

namespace docsearch_core {

class DatabaseManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = docsearch_tests::TestUtilities::create_temp_test_db();
  }

  void TearDown() override {
    manager_.shutdown();
    docsearch_tests::TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
  DatabaseManager manager_;
};

TEST_F(DatabaseManagerTest, Initialize_CreatesDatabaseFile) {
  manager_.initialize(temp_db_path_, 2);

  EXPECT_TRUE(manager_.is_initialized());
  EXPECT_EQ(manager_.db_path(), temp_db_path_);
  EXPECT_TRUE(std::filesystem::exists(temp_db_path_));
}

TEST_F(DatabaseManagerTest, Initialize_CreatesMissingParentDirectory) {
  auto dir = docsearch_tests::TestUtilities::create_temp_dir("nested_db");
  auto nested_path = dir / "a" / "b" / "docs.db";

  manager_.initialize(nested_path, 1);

  EXPECT_TRUE(std::filesystem::exists(nested_path));
  manager_.shutdown();
  std::filesystem::remove_all(dir);
}

TEST_F(DatabaseManagerTest, GetConnection_BeforeInitialize_Throws) {
  EXPECT_THROW(PooledConnection conn(manager_), DatabaseError);
}

TEST_F(DatabaseManagerTest, GetConnection_AfterShutdown_Throws) {
  manager_.initialize(temp_db_path_, 1);
  manager_.shutdown();

  EXPECT_FALSE(manager_.is_initialized());
  EXPECT_THROW(PooledConnection conn(manager_), DatabaseError);
}

TEST_F(DatabaseManagerTest, Initialize_ZeroPoolSize_Throws) {
  EXPECT_THROW(manager_.initialize(temp_db_path_, 0), DatabaseError);
  EXPECT_FALSE(manager_.is_initialized());
}

TEST_F(DatabaseManagerTest, PooledConnection_IsReturnedOnScopeExit) {
  manager_.initialize(temp_db_path_, 1);

  for (int i = 0; i < 3; ++i) {
    PooledConnection conn(manager_);
    int count = -1;
    *conn << "SELECT COUNT(*) FROM sqlite_master" >> count;
    EXPECT_GE(count, 0);
  }
}

TEST_F(DatabaseManagerTest, PooledConnection_BlocksWhenPoolExhaustedAndResumes) {
  manager_.initialize(temp_db_path_, 2);

  auto holder1 = std::make_unique<PooledConnection>(manager_);
  auto holder2 = std::make_unique<PooledConnection>(manager_);

  std::atomic<bool> acquired{false};
  std::thread t([&]() {
    PooledConnection c3(manager_);
    acquired.store(true);
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(acquired.load());

  holder1.reset();  // returns connection to pool
  t.join();

  EXPECT_TRUE(acquired.load());
}

}  // namespace docsearch_core
