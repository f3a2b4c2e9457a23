#include "infrastructure/database/connection_pool.hpp"
#include "support/in_memory_storage.hpp"

#include <gtest/gtest.h>

#include <future>
#include <stdexcept>

using infrastructure::database::ConnectionPool;
using infrastructure::database::StorageConnection;
using test_support::InMemoryStore;
using test_support::makeFactory;
using test_support::makeReading;

static core::PoolConfig make_config(uint32_t min, uint32_t max, uint32_t timeoutMs = 100) {
    core::PoolConfig cfg;
    cfg.minConnections = min;
    cfg.maxConnections = max;
    cfg.acquireTimeoutMs = timeoutMs;
    return cfg;
}

static void expect_consistent(const ConnectionPool& pool) {
    auto stats = pool.stats();
    EXPECT_EQ(stats.idle + stats.active, stats.total);
    EXPECT_LE(stats.total, pool.config().maxConnections);
}

TEST(ConnectionPool, InitCreatesMinConnections) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(2, 5), makeFactory(store));

    EXPECT_EQ(store->created, 2);
    EXPECT_EQ(pool.totalCount(), 2u);
    EXPECT_EQ(pool.idleCount(), 2u);
    EXPECT_EQ(pool.activeCount(), 0u);
}

TEST(ConnectionPool, InvalidBoundsRejected) {
    auto store = std::make_shared<InMemoryStore>();
    EXPECT_THROW(ConnectionPool(make_config(3, 2), makeFactory(store)), core::ValidationError);
    EXPECT_THROW(ConnectionPool(make_config(0, 2), makeFactory(store)), core::ValidationError);
}

TEST(ConnectionPool, InitFailsWhenStorageUnreachable) {
    auto store = std::make_shared<InMemoryStore>();
    store->failConnect = true;
    EXPECT_THROW(ConnectionPool(make_config(2, 5), makeFactory(store)), core::StorageError);
}

TEST(ConnectionPool, AcquireUsesIdleBeforeCreating) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(2, 5), makeFactory(store));

    auto& a = pool.acquire();
    auto& b = pool.acquire();
    EXPECT_NE(&a, &b);
    EXPECT_EQ(store->created, 2);
    EXPECT_EQ(pool.activeCount(), 2u);
    EXPECT_EQ(pool.idleCount(), 0u);

    pool.release(a);
    pool.release(b);
    EXPECT_EQ(pool.idleCount(), 2u);
    expect_consistent(pool);
}

TEST(ConnectionPool, CreatesLazilyUpToMax) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(1, 3), makeFactory(store));

    auto& a = pool.acquire();
    auto& b = pool.acquire();
    auto& c = pool.acquire();
    EXPECT_EQ(store->created, 3);
    EXPECT_EQ(pool.totalCount(), 3u);
    expect_consistent(pool);

    pool.release(a);
    pool.release(b);
    pool.release(c);
    EXPECT_EQ(pool.totalCount(), 3u);
    EXPECT_EQ(pool.idleCount(), 3u);
}

TEST(ConnectionPool, ExhaustedAfterTimeout) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(1, 2), makeFactory(store));

    auto& a = pool.acquire();
    auto& b = pool.acquire();

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(pool.acquire(std::chrono::milliseconds(50)), core::PoolExhausted);
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(45));
    EXPECT_EQ(pool.totalCount(), 2u);
    expect_consistent(pool);

    pool.release(a);
    pool.release(b);
}

TEST(ConnectionPool, WaiterGetsReleasedConnection) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(1, 1, 2000), makeFactory(store));

    auto& held = pool.acquire();
    auto waiter = std::async(std::launch::async, [&pool]() -> StorageConnection* {
        return &pool.acquire();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pool.release(held);

    StorageConnection* got = waiter.get();
    EXPECT_EQ(got, &held);
    EXPECT_EQ(store->created, 1);
    pool.release(*got);
}

TEST(ConnectionPool, DoubleReleaseIsMisuse) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(1, 2), makeFactory(store));

    auto& conn = pool.acquire();
    pool.release(conn);
    EXPECT_THROW(pool.release(conn), core::HandleMisuseError);
    expect_consistent(pool);
}

TEST(ConnectionPool, ReleaseOfForeignConnectionIsMisuse) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(1, 2), makeFactory(store));

    test_support::InMemoryConnection stranger(store);
    EXPECT_THROW(pool.release(stranger), core::HandleMisuseError);
}

TEST(ConnectionPool, ScopedReleasesOnNormalExit) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(2, 4), makeFactory(store));

    {
        auto conn = pool.scopedAcquire();
        EXPECT_EQ(pool.activeCount(), 1u);
        conn->countAll();
    }
    EXPECT_EQ(pool.idleCount(), 2u);
    EXPECT_EQ(pool.activeCount(), 0u);
}

TEST(ConnectionPool, ScopedReleasesWhenWorkThrows) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(2, 4), makeFactory(store));
    const auto idleBefore = pool.idleCount();

    EXPECT_THROW({
        auto conn = pool.scopedAcquire();
        throw std::runtime_error("caller gave up");
    }, std::runtime_error);

    EXPECT_EQ(pool.idleCount(), idleBefore);
    EXPECT_EQ(pool.activeCount(), 0u);
}

TEST(ConnectionPool, ScopedExplicitReleaseOnlyOnce) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(1, 2), makeFactory(store));

    auto conn = pool.scopedAcquire();
    conn.release();
    EXPECT_EQ(pool.activeCount(), 0u);
    EXPECT_THROW(conn.release(), core::HandleMisuseError);
}

TEST(ConnectionPool, BrokenConnectionDiscardedAndFloorRestored) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(2, 4), makeFactory(store));

    store->failReads = true;
    EXPECT_THROW({
        auto conn = pool.scopedAcquire();
        conn->loadRange(domain::Timestamp{}, domain::nowTimestamp());
    }, core::StorageError);
    store->failReads = false;

    // 坏连接被丢弃，不回到空闲队列
    EXPECT_EQ(pool.totalCount(), 1u);
    EXPECT_EQ(pool.idleCount(), 1u);

    // 下一次借出时补回下限
    auto& conn = pool.acquire();
    EXPECT_FALSE(conn.broken());
    EXPECT_EQ(pool.totalCount(), 2u);
    EXPECT_EQ(store->created, 3);
    pool.release(conn);
    expect_consistent(pool);
}

TEST(ConnectionPool, NeverHandsOutBrokenIdleConnection) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(2, 4), makeFactory(store));

    store->failPing = true;
    auto& conn = pool.acquire();
    store->failPing = false;

    // 两条空闲连接 ping 失败被丢弃，换成新建的连接
    EXPECT_FALSE(conn.broken());
    EXPECT_EQ(store->created, 3);
    EXPECT_EQ(store->closed, 2);
    pool.release(conn);
    expect_consistent(pool);
}

TEST(ConnectionPool, FactoryFailureFreesSlot) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(1, 2), makeFactory(store));

    auto& held = pool.acquire();
    store->failConnect = true;
    EXPECT_THROW(pool.acquire(), core::StorageError);
    EXPECT_EQ(pool.totalCount(), 1u);
    expect_consistent(pool);

    store->failConnect = false;
    auto& second = pool.acquire();
    EXPECT_EQ(pool.totalCount(), 2u);
    pool.release(second);
    pool.release(held);
}

TEST(ConnectionPool, ShutdownRejectsAcquire) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(2, 4), makeFactory(store));

    pool.shutdown();
    EXPECT_TRUE(pool.closed());
    EXPECT_EQ(pool.totalCount(), 0u);
    EXPECT_EQ(store->closed, 2);
    EXPECT_THROW(pool.acquire(), core::PoolClosed);

    pool.shutdown();  // 幂等
}

TEST(ConnectionPool, ShutdownDoesNotCloseConnectionInUse) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(1, 2, 30), makeFactory(store));

    std::promise<void> acquired;
    std::promise<void> shutdownDone;
    auto shutdownSignal = shutdownDone.get_future();

    // 持有者在 shutdown 超时返回之后才使用连接
    auto holder = std::async(std::launch::async, [&]() {
        auto conn = pool.scopedAcquire();
        acquired.set_value();
        shutdownSignal.wait();

        auto& inMemory = static_cast<test_support::InMemoryConnection&>(*conn);
        EXPECT_FALSE(inMemory.isClosed());
        return conn->insert(makeReading("late", 20.0, domain::nowTimestamp()));
    });

    acquired.get_future().wait();
    pool.shutdown();
    EXPECT_EQ(pool.activeCount(), 1u);
    EXPECT_EQ(store->closed, 0);
    shutdownDone.set_value();

    EXPECT_GT(holder.get(), 0u);
    EXPECT_EQ(store->rowCount(), 1u);

    // 归还时才关闭并销毁
    EXPECT_EQ(store->closed, 1);
    EXPECT_EQ(pool.totalCount(), 0u);
}

TEST(ConnectionPool, ShutdownWakesWaiters) {
    auto store = std::make_shared<InMemoryStore>();
    ConnectionPool pool(make_config(1, 1, 5000), makeFactory(store));

    auto& held = pool.acquire();
    auto waiter = std::async(std::launch::async, [&pool]() {
        pool.acquire();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    auto closer = std::async(std::launch::async, [&pool]() { pool.shutdown(); });
    EXPECT_THROW(waiter.get(), core::PoolClosed);

    pool.release(held);
    closer.get();
    EXPECT_EQ(pool.totalCount(), 0u);
}
