#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include "../../common/utilities_test.hpp"
#include "ragkit_core/db/connection_pool.hpp"
#include "ragkit_core/db/database_manager.hpp"
#include "ragkit_core/db/pooled_connection.hpp"
#include "ragkit_core/db/storage_error.hpp"

namespace ragkit_core {

using namespace std::chrono_literals;

class ConnectionPoolTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = ragkit_tests::TestUtilities::create_temp_test_db();
  }
  void TearDown() override {
    ragkit_tests::TestUtilities::cleanup_temp_db(db_path_);
  }

  std::unique_ptr<ConnectionPool> make_pool(int size, std::chrono::milliseconds timeout) {
    return std::make_unique<ConnectionPool>(db_path_.string(), "ragkit_test_key", size, timeout);
  }

  std::filesystem::path db_path_;
};

TEST_F(ConnectionPoolTest, OpensEveryConnectionUpFront) {
  auto pool = make_pool(3, 1000ms);
  EXPECT_EQ(pool->capacity(), 3u);
  EXPECT_EQ(pool->idle_count(), 3u);

  DbHandle conn = pool->acquire();
  EXPECT_EQ(pool->idle_count(), 2u);
  int fk_on = 0;
  *conn << "PRAGMA foreign_keys;" >> fk_on;
  EXPECT_EQ(fk_on, 1);

  pool->release(std::move(conn));
  EXPECT_EQ(pool->idle_count(), 3u);
}

TEST_F(ConnectionPoolTest, WaiterResumesWhenAConnectionComesBack) {
  auto pool = make_pool(1, 5000ms);
  DbHandle held = pool->acquire();

  std::atomic<bool> acquired{false};
  std::thread waiter([&] {
    DbHandle conn = pool->acquire();
    acquired = true;
    pool->release(std::move(conn));
  });

  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(acquired.load());
  pool->release(std::move(held));
  waiter.join();
  EXPECT_TRUE(acquired.load());
}

TEST_F(ConnectionPoolTest, TimesOutWithBusyKind) {
  auto pool = make_pool(1, 100ms);
  DbHandle held = pool->acquire();

  const auto started = std::chrono::steady_clock::now();
  try {
    pool->acquire();
    FAIL() << "expected PoolTimeoutError";
  } catch (const PoolTimeoutError& e) {
    EXPECT_EQ(e.kind(), DbErrorKind::BusyOrLocked);
  }
  EXPECT_GE(std::chrono::steady_clock::now() - started, 90ms);

  pool->release(std::move(held));
  EXPECT_NO_THROW(pool->release(pool->acquire()));
}

TEST_F(ConnectionPoolTest, CloseWakesWaitersWithStorageError) {
  auto pool = make_pool(1, 5000ms);
  DbHandle held = pool->acquire();

  auto waiter = std::async(std::launch::async, [&] { return pool->acquire(); });
  std::this_thread::sleep_for(30ms);
  pool->close();

  EXPECT_THROW(waiter.get(), StorageError);
  EXPECT_EQ(pool->idle_count(), 0u);
}

TEST_F(ConnectionPoolTest, RejectsNonPositivePoolSize) {
  EXPECT_THROW(make_pool(0, 100ms), StorageError);
  EXPECT_THROW(make_pool(-2, 100ms), StorageError);
}

TEST_F(ConnectionPoolTest, PooledConnectionReturnsHandleOnScopeExit) {
  DatabaseManager manager;
  manager.initialize(db_path_, "ragkit_test_key", 1, 100ms);
  {
    PooledConnection conn(manager);
    EXPECT_THROW(PooledConnection second(manager), PoolTimeoutError);
  }
  PooledConnection again(manager);
  int documents = -1;
  *again << "SELECT COUNT(*) FROM documents" >> documents;
  EXPECT_EQ(documents, 0);
}

TEST_F(ConnectionPoolTest, UninitializedManagerRefusesConnections) {
  DatabaseManager manager;
  EXPECT_FALSE(manager.is_initialized());
  EXPECT_THROW(PooledConnection conn(manager), StorageError);
}

TEST_F(ConnectionPoolTest, ManagerShutdownWakesWaitersAndRefusesNewConnections) {
  DatabaseManager manager;
  manager.initialize(db_path_, "ragkit_test_key", 1, 5000ms);

  auto held = std::make_unique<PooledConnection>(manager);
  auto waiter = std::async(std::launch::async, [&] { PooledConnection conn(manager); });
  std::this_thread::sleep_for(30ms);
  manager.shutdown();

  EXPECT_THROW(waiter.get(), StorageError);
  EXPECT_FALSE(manager.is_initialized());

  // Handing the connection back after shutdown is harmless.
  held.reset();
  EXPECT_THROW(PooledConnection late(manager), StorageError);

  manager.shutdown();
}

}  // namespace ragkit_core
