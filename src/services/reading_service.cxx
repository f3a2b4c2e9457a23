#include "services/reading_service.hpp"

#include <chrono>

#include "core/errors.hpp"
#include "core/logger.hpp"

namespace services {

ReadingService::ReadingService(StationContext& context, monitoring::HealthMonitor& monitor)
    : context_(context)
    , monitor_(monitor)
    , aggregator_(context.cache(), context.pool(), context.config().analytics.sufficiencyThreshold) {
}

domain::Reading ReadingService::ingest(domain::Reading reading) {
    domain::validate(reading);

    try {
        auto connection = context_.pool().scopedAcquire();
        reading.id = connection->insert(reading);
    } catch (const core::StationError& ex) {
        monitor_.update("storage", false, std::string("ingest failed: ") + ex.what());
        LOG_ERROR("ingest", "Failed to store reading from ", reading.sensorId, ": ", ex.what());
        throw;
    }

    // 只有确认写库成功才进入缓存
    context_.cache().record(reading);
    monitor_.update("storage", true, "last write ok");

    LOG_INFO("ingest", "Stored reading ", reading.id, ": ", reading.sensorId, " ",
             reading.temperature, "C at ", domain::formatTimestamp(reading.timestamp));
    return reading;
}

domain::AverageResult ReadingService::queryAverage(const std::optional<domain::TimeWindow>& window) {
    auto effective = window.value_or(domain::windowEndingAt(
        domain::nowTimestamp(), std::chrono::minutes(context_.config().analytics.windowMinutes)));
    if (effective.start > effective.end) {
        throw core::ValidationError("window start must not be after window end");
    }

    try {
        auto result = aggregator_.average(effective);
        if (result.source == domain::DataSource::Storage) {
            monitor_.update("storage", true, "last query ok");
        }
        return result;
    } catch (const core::StationError& ex) {
        monitor_.update("storage", false, std::string("average failed: ") + ex.what());
        throw;
    }
}

std::vector<domain::Reading> ReadingService::recent(long limit) const {
    const auto maxLimit = context_.config().analytics.recentLimitMax;
    if (limit > static_cast<long>(maxLimit)) {
        throw core::ValidationError("limit cannot exceed " + std::to_string(maxLimit));
    }
    return context_.cache().mostRecent(limit);
}

domain::HealthSnapshot ReadingService::health() const {
    domain::HealthSnapshot snapshot;
    snapshot.cacheSize = context_.cache().size();
    snapshot.cacheCapacity = context_.cache().capacity();
    snapshot.pool = context_.pool().stats();
    return snapshot;
}

nlohmann::json ReadingService::status() {
    auto json = domain::toJson(health());

    auto lastHour = domain::nowTimestamp() - std::chrono::hours(1);
    try {
        auto connection = context_.pool().scopedAcquire();
        json["storage"] = {
            {"total_readings", connection->countAll()},
            {"recent_readings_last_hour", connection->countSince(lastHour)}
        };
    } catch (core::StationError& ex) {
        ex.setSource(domain::sourceName(domain::DataSource::Storage));
        monitor_.update("storage", false, std::string("status check failed: ") + ex.what());
        throw;
    }
    json["timestamp"] = domain::formatTimestamp(domain::nowTimestamp());
    return json;
}

} // namespace services
