// 进程级共享状态的持有者：最近读数缓存 + 数据库连接池
// 启动时构造一次（init），所有请求共享，退出时 shutdown；通过引用传给各个服务，不做隐式单例

#pragma once

#include <memory>

#include "core/configuration.hpp"
#include "infrastructure/cache/recency_cache.hpp"
#include "infrastructure/database/connection_pool.hpp"

namespace services {

class StationContext {
public:
    // 建立连接池（minConnections 条）并确保表结构存在；失败抛 core::StorageError
    StationContext(const core::Configuration& config, infrastructure::database::ConnectionFactory factory);
    ~StationContext();

    StationContext(const StationContext&) = delete;
    StationContext& operator=(const StationContext&) = delete;

    // 幂等：关闭连接池、清空缓存
    void shutdown();

    const core::Configuration& config() const { return config_; }
    infrastructure::cache::RecencyCache& cache() { return cache_; }
    const infrastructure::cache::RecencyCache& cache() const { return cache_; }
    infrastructure::database::ConnectionPool& pool() { return *pool_; }
    const infrastructure::database::ConnectionPool& pool() const { return *pool_; }

private:
    core::Configuration config_;
    infrastructure::cache::RecencyCache cache_;
    std::unique_ptr<infrastructure::database::ConnectionPool> pool_;
};

} // namespace services
