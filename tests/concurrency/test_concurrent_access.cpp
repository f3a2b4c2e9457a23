#include "infrastructure/cache/recency_cache.hpp"
#include "infrastructure/database/connection_pool.hpp"
#include "services/reading_service.hpp"
#include "support/in_memory_storage.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <future>
#include <thread>
#include <vector>

using infrastructure::cache::RecencyCache;
using infrastructure::database::ConnectionPool;
using test_support::InMemoryStore;
using test_support::makeReading;

TEST(ConcurrentAccess, CacheNeverExceedsCapacity) {
    RecencyCache cache(50);
    std::atomic<bool> done{false};
    std::atomic<bool> overflow{false};

    std::thread sampler([&]() {
        while (!done) {
            if (cache.size() > cache.capacity() || cache.mostRecent(1000).size() > cache.capacity()) {
                overflow = true;
            }
        }
    });

    std::vector<std::thread> writers;
    for (int t = 0; t < 8; ++t) {
        writers.emplace_back([&cache, t]() {
            for (int i = 0; i < 1000; ++i) {
                cache.record(makeReading("sensor_" + std::to_string(t), i % 50, domain::nowTimestamp()));
            }
        });
    }
    for (auto& w : writers) {
        w.join();
    }
    done = true;
    sampler.join();

    EXPECT_FALSE(overflow);
    EXPECT_EQ(cache.size(), 50u);
}

TEST(ConcurrentAccess, PoolCountersStayConsistent) {
    auto store = std::make_shared<InMemoryStore>();
    store->latencyMs = 1;
    core::PoolConfig cfg;
    cfg.minConnections = 2;
    cfg.maxConnections = 4;
    cfg.acquireTimeoutMs = 5000;
    ConnectionPool pool(cfg, test_support::makeFactory(store));

    std::atomic<bool> done{false};
    std::atomic<bool> inconsistent{false};
    std::thread sampler([&]() {
        while (!done) {
            auto stats = pool.stats();
            if (stats.idle + stats.active != stats.total || stats.total > cfg.maxConnections) {
                inconsistent = true;
            }
        }
    });

    std::vector<std::thread> workers;
    for (int t = 0; t < 10; ++t) {
        workers.emplace_back([&pool, t]() {
            for (int i = 0; i < 20; ++i) {
                auto conn = pool.scopedAcquire();
                conn->insert(makeReading("worker_" + std::to_string(t), 20.0, domain::nowTimestamp()));
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    done = true;
    sampler.join();

    EXPECT_FALSE(inconsistent);
    EXPECT_EQ(store->rowCount(), 200u);
    EXPECT_EQ(pool.activeCount(), 0u);
    EXPECT_LE(pool.totalCount(), 4u);
}

TEST(ConcurrentAccess, ThirdCallerTimesOutWhileTwoHoldAllConnections) {
    auto store = std::make_shared<InMemoryStore>();
    core::PoolConfig cfg;
    cfg.minConnections = 1;
    cfg.maxConnections = 2;
    cfg.acquireTimeoutMs = 100;
    ConnectionPool pool(cfg, test_support::makeFactory(store));

    std::promise<void> release;
    auto releaseSignal = release.get_future().share();
    std::atomic<int> holding{0};

    auto holder = [&]() {
        auto conn = pool.scopedAcquire();
        ++holding;
        releaseSignal.wait();
    };
    auto first = std::async(std::launch::async, holder);
    auto second = std::async(std::launch::async, holder);

    while (holding < 2) {
        std::this_thread::yield();
    }

    EXPECT_THROW(pool.acquire(), core::PoolExhausted);
    EXPECT_EQ(pool.totalCount(), 2u);

    release.set_value();
    first.get();
    second.get();

    auto& conn = pool.acquire();
    pool.release(conn);
}

TEST(ConcurrentAccess, FailingWorkDoesNotLeakConnections) {
    auto store = std::make_shared<InMemoryStore>();
    core::PoolConfig cfg;
    cfg.minConnections = 2;
    cfg.maxConnections = 3;
    cfg.acquireTimeoutMs = 5000;
    ConnectionPool pool(cfg, test_support::makeFactory(store));

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 6; ++t) {
        workers.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                try {
                    auto conn = pool.scopedAcquire();
                    conn->countAll();
                    throw std::runtime_error("request aborted");
                } catch (const std::runtime_error&) {
                    ++failures;
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(failures, 300);
    EXPECT_EQ(pool.activeCount(), 0u);
    EXPECT_EQ(pool.idleCount(), pool.totalCount());
}

TEST(ConcurrentAccess, IngestAndAverageInParallel) {
    auto store = std::make_shared<InMemoryStore>();
    core::Configuration cfg;
    cfg.pool.minConnections = 2;
    cfg.pool.maxConnections = 4;
    cfg.pool.acquireTimeoutMs = 5000;
    cfg.cache.capacity = 64;
    cfg.analytics.sufficiencyThreshold = 30;

    monitoring::HealthMonitor monitor(
        (std::filesystem::temp_directory_path() / "weather_station_concurrency_health.json").string(),
        std::chrono::seconds(60));
    services::StationContext context(cfg, test_support::makeFactory(store));
    services::ReadingService service(context, monitor);

    std::vector<std::future<void>> tasks;
    for (int t = 0; t < 4; ++t) {
        tasks.push_back(std::async(std::launch::async, [&service, t]() {
            for (int i = 0; i < 50; ++i) {
                service.ingest(makeReading("sensor_" + std::to_string(t), 20.0, domain::nowTimestamp()));
            }
        }));
        tasks.push_back(std::async(std::launch::async, [&service]() {
            for (int i = 0; i < 50; ++i) {
                auto result = service.queryAverage();
                if (result.count > 0) {
                    EXPECT_DOUBLE_EQ(*result.average, 20.0);
                }
            }
        }));
    }
    for (auto& task : tasks) {
        task.get();
    }

    EXPECT_EQ(store->rowCount(), 200u);
    EXPECT_EQ(context.cache().size(), 64u);
    EXPECT_EQ(context.pool().activeCount(), 0u);
}
