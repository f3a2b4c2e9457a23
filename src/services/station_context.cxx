#include "services/station_context.hpp"

#include "core/logger.hpp"

namespace services {

StationContext::StationContext(const core::Configuration& config,
                               infrastructure::database::ConnectionFactory factory)
    : config_(config)
    , cache_(config.cache.capacity)
    , pool_(std::make_unique<infrastructure::database::ConnectionPool>(config.pool, std::move(factory))) {
    {
        auto connection = pool_->scopedAcquire();
        connection->ensureSchema();
    }
    LOG_INFO("station", "Station context initialised (cache capacity=", cache_.capacity(),
             ", pool ", pool_->totalCount(), "/", config_.pool.maxConnections, ")");
}

StationContext::~StationContext() {
    shutdown();
}

void StationContext::shutdown() {
    if (pool_->closed()) {
        return;
    }
    pool_->shutdown();
    cache_.clear();
    LOG_INFO("station", "Station context shut down");
}

} // namespace services
