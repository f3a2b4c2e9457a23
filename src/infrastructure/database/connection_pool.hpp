// 数据库连接池：启动时建立 minConnections 条连接，按需懒创建到 maxConnections
// 每条连接要么空闲（在池里），要么被唯一一个调用方借出
// 不变量：minConnections <= total <= maxConnections（出错丢弃后会在下次借出时补回下限）
//        idle + active == total

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

#include "core/configuration.hpp"
#include "domain/reading.hpp"
#include "infrastructure/database/storage_connection.hpp"

namespace infrastructure::database {

class ConnectionPool;

// 作用域内持有一条连接，析构时一定归还（正常返回、抛异常都一样）
// 使用中出错的连接（broken）归还时会被连接池丢弃
// 不能比创建它的 ConnectionPool 活得更久
class ScopedConnection {
public:
    ScopedConnection(ConnectionPool& pool, StorageConnection& connection)
        : pool_(&pool)
        , connection_(&connection) {}

    ~ScopedConnection();

    ScopedConnection(const ScopedConnection&) = delete;
    ScopedConnection& operator=(const ScopedConnection&) = delete;

    ScopedConnection(ScopedConnection&& other) noexcept
        : pool_(other.pool_)
        , connection_(other.connection_) {
        other.pool_ = nullptr;
        other.connection_ = nullptr;
    }

    ScopedConnection& operator=(ScopedConnection&&) = delete;

    StorageConnection& operator*() const { return *connection_; }
    StorageConnection* operator->() const { return connection_; }

    // 提前归还
    void release();

private:
    ConnectionPool* pool_;
    StorageConnection* connection_;
};

class ConnectionPool {
public:
    // 构造即初始化：同步建立 minConnections 条连接，任何一条失败都抛 core::StorageError
    ConnectionPool(const core::PoolConfig& config, ConnectionFactory factory);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // 借出一条连接（使用配置里的超时）
    StorageConnection& acquire();

    // 阻塞直到有空闲连接、可以新建连接或超时
    // 超时抛 core::PoolExhausted，已关闭抛 core::PoolClosed，新建连接失败抛 core::StorageError
    StorageConnection& acquire(std::chrono::milliseconds timeout);

    // 归还连接；不是当前借出状态的连接抛 core::HandleMisuseError
    void release(StorageConnection& connection);

    ScopedConnection scopedAcquire();
    ScopedConnection scopedAcquire(std::chrono::milliseconds timeout);

    // 关闭所有连接（空闲的立即关闭并销毁，借出的在归还时关闭并销毁），之后 acquire 抛 PoolClosed
    // 最多等待 acquireTimeoutMs 让借出的连接归还；不会关闭其他线程正在使用的连接
    void shutdown();

    std::size_t activeCount() const;
    std::size_t idleCount() const;
    std::size_t totalCount() const;
    domain::PoolStats stats() const;   // 三个计数在同一把锁下读取
    bool closed() const;

    const core::PoolConfig& config() const { return config_; }

private:
    // 总数低于下限时补建空闲连接（出错丢弃之后）
    void replenishLocked(std::unique_lock<std::mutex>& lk);

    // 在锁外调用 factory；失败时抛 StorageError
    std::unique_ptr<StorageConnection> createConnection();

    // 新连接创建完成后登记为借出状态
    StorageConnection& adoptCheckedOut(std::unique_ptr<StorageConnection> connection);

    // 丢弃一条连接（已持锁）
    void destroyLocked(StorageConnection* connection);

    core::PoolConfig config_;
    ConnectionFactory factory_;

    mutable std::mutex mutex_;
    std::condition_variable available_;

    std::unordered_map<StorageConnection*, std::unique_ptr<StorageConnection>> connections_;   // 所有连接（所有权）
    std::deque<StorageConnection*> idle_;
    std::unordered_set<StorageConnection*> checkedOut_;
    std::size_t pending_{0};    // 正在创建中的连接（已占名额，计入 active）
    bool closed_{false};
};

} // namespace infrastructure::database
