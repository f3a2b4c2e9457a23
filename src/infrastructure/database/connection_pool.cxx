#include "infrastructure/database/connection_pool.hpp"

#include "core/errors.hpp"
#include "core/logger.hpp"

namespace infrastructure::database {

ScopedConnection::~ScopedConnection() {
    if (pool_ != nullptr) {
        pool_->release(*connection_);
    }
}

void ScopedConnection::release() {
    if (pool_ == nullptr) {
        throw core::HandleMisuseError("scoped connection already released");
    }
    auto* pool = pool_;
    pool_ = nullptr;
    pool->release(*connection_);
}

ConnectionPool::ConnectionPool(const core::PoolConfig& config, ConnectionFactory factory)
    : config_(config)
    , factory_(std::move(factory)) {
    if (config_.minConnections == 0 || config_.minConnections > config_.maxConnections) {
        throw core::ValidationError("pool bounds require 0 < minConnections <= maxConnections");
    }

    // 启动时一次性建立下限数量的连接
    for (uint32_t i = 0; i < config_.minConnections; ++i) {
        auto connection = createConnection();
        auto* raw = connection.get();
        connections_.emplace(raw, std::move(connection));
        idle_.push_back(raw);
    }
    LOG_INFO("pool", "Connection pool ready (min=", config_.minConnections,
             ", max=", config_.maxConnections, ", timeout=", config_.acquireTimeoutMs, "ms)");
}

ConnectionPool::~ConnectionPool() {
    shutdown();
}

StorageConnection& ConnectionPool::acquire() {
    return acquire(std::chrono::milliseconds(config_.acquireTimeoutMs));
}

StorageConnection& ConnectionPool::acquire(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lk(mutex_);

    replenishLocked(lk);

    while (true) {
        if (closed_) {
            throw core::PoolClosed("connection pool is closed");
        }

        // 1. 优先使用空闲连接（借出前先 ping，坏连接直接丢弃）
        if (!idle_.empty()) {
            StorageConnection* connection = idle_.front();
            idle_.pop_front();
            checkedOut_.insert(connection);

            lk.unlock();
            bool alive = !connection->broken() && connection->ping();
            lk.lock();

            if (closed_) {
                checkedOut_.erase(connection);
                destroyLocked(connection);
                available_.notify_all();
                throw core::PoolClosed("connection pool is closed");
            }
            if (alive) {
                return *connection;
            }

            LOG_WARN("pool", "Discarding broken idle connection");
            checkedOut_.erase(connection);
            destroyLocked(connection);
            available_.notify_one();
            continue;
        }

        // 2. 没有空闲连接但还没到上限：占一个名额，在锁外新建
        if (connections_.size() + pending_ < config_.maxConnections) {
            ++pending_;
            lk.unlock();

            std::unique_ptr<StorageConnection> connection;
            try {
                connection = createConnection();
            } catch (...) {
                lk.lock();
                --pending_;
                available_.notify_all();
                throw;
            }

            lk.lock();
            --pending_;
            if (closed_) {
                connection->close();
                available_.notify_all();
                throw core::PoolClosed("connection pool is closed");
            }
            return adoptCheckedOut(std::move(connection));
        }

        // 3. 已到上限：等待归还，直到超时
        if (available_.wait_until(lk, deadline) == std::cv_status::timeout) {
            bool canProceed = closed_ || !idle_.empty()
                || connections_.size() + pending_ < config_.maxConnections;
            if (!canProceed) {
                LOG_WARN("pool", "Acquire timed out after ", timeout.count(), "ms (",
                         checkedOut_.size() + pending_, "/", config_.maxConnections, " in use)");
                throw core::PoolExhausted("no connection available within " + std::to_string(timeout.count()) + "ms");
            }
        }
    }
}

void ConnectionPool::release(StorageConnection& connection) {
    std::lock_guard<std::mutex> lk(mutex_);

    auto it = checkedOut_.find(&connection);
    if (it == checkedOut_.end()) {
        LOG_ERROR("pool", "Release of a connection that is not checked out");
        throw core::HandleMisuseError("release of a connection that is not checked out");
    }
    checkedOut_.erase(it);

    if (closed_) {
        destroyLocked(&connection);
        available_.notify_all();    // shutdown() 可能在等待借出的连接归还
        return;
    }

    if (connection.broken()) {
        // 坏连接不回池；低于下限的部分在下次 acquire 时补建
        LOG_WARN("pool", "Discarding broken connection on release (total=", connections_.size() - 1, ")");
        destroyLocked(&connection);
        available_.notify_one();
        return;
    }

    idle_.push_back(&connection);
    available_.notify_one();
}

ScopedConnection ConnectionPool::scopedAcquire() {
    return ScopedConnection(*this, acquire());
}

ScopedConnection ConnectionPool::scopedAcquire(std::chrono::milliseconds timeout) {
    return ScopedConnection(*this, acquire(timeout));
}

void ConnectionPool::shutdown() {
    std::unique_lock<std::mutex> lk(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    for (auto* connection : idle_) {
        destroyLocked(connection);
    }
    idle_.clear();
    available_.notify_all();

    // 给借出的连接一个超时时间归还
    // 仍未归还的连接可能正在被持有线程使用，不在这里关闭，由持有者 release 时关闭并销毁
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.acquireTimeoutMs);
    available_.wait_until(lk, deadline, [this] { return checkedOut_.empty() && pending_ == 0; });

    if (!checkedOut_.empty()) {
        LOG_WARN("pool", checkedOut_.size(), " connection(s) still checked out at shutdown; "
                 "they will be closed when released");
    }
    LOG_INFO("pool", "Connection pool closed");
}

std::size_t ConnectionPool::activeCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return checkedOut_.size() + pending_;
}

std::size_t ConnectionPool::idleCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return idle_.size();
}

std::size_t ConnectionPool::totalCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return connections_.size() + pending_;
}

domain::PoolStats ConnectionPool::stats() const {
    std::lock_guard<std::mutex> lk(mutex_);
    domain::PoolStats stats;
    stats.idle = idle_.size();
    stats.active = checkedOut_.size() + pending_;
    stats.total = connections_.size() + pending_;
    return stats;
}

bool ConnectionPool::closed() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return closed_;
}

void ConnectionPool::replenishLocked(std::unique_lock<std::mutex>& lk) {
    while (!closed_ && connections_.size() + pending_ < config_.minConnections) {
        ++pending_;
        lk.unlock();

        std::unique_ptr<StorageConnection> connection;
        try {
            connection = createConnection();
        } catch (const core::StorageError& ex) {
            // 补建失败不影响本次借出，后续步骤会自行新建或报错
            lk.lock();
            --pending_;
            available_.notify_all();
            LOG_WARN("pool", "Could not restore the connection floor: ", ex.what());
            return;
        } catch (...) {
            lk.lock();
            --pending_;
            available_.notify_all();
            throw;
        }

        lk.lock();
        --pending_;
        if (closed_) {
            connection->close();
            available_.notify_all();
            return;
        }
        auto* raw = connection.get();
        connections_.emplace(raw, std::move(connection));
        idle_.push_back(raw);
        available_.notify_one();
        LOG_INFO("pool", "Restored connection floor (total=", connections_.size() + pending_, ")");
    }
}

std::unique_ptr<StorageConnection> ConnectionPool::createConnection() {
    auto connection = factory_();
    if (!connection) {
        throw core::StorageError("connection factory returned no connection");
    }
    LOG_DEBUG("pool", "Created storage connection");
    return connection;
}

StorageConnection& ConnectionPool::adoptCheckedOut(std::unique_ptr<StorageConnection> connection) {
    auto* raw = connection.get();
    connections_.emplace(raw, std::move(connection));
    checkedOut_.insert(raw);
    return *raw;
}

void ConnectionPool::destroyLocked(StorageConnection* connection) {
    auto it = connections_.find(connection);
    if (it == connections_.end()) {
        return;
    }
    it->second->close();
    connections_.erase(it);
}

} // namespace infrastructure::database
