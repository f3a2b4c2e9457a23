#include "services/cache_first_aggregator.hpp"

#include <algorithm>

#include "core/errors.hpp"
#include "core/logger.hpp"

namespace services {

domain::AverageResult CacheFirstAggregator::average(const domain::TimeWindow& window) const {
    auto cached = cache_.snapshotSince(window.start);
    cached.erase(std::remove_if(cached.begin(), cached.end(),
                                [&](const domain::Reading& r) { return !window.contains(r.timestamp); }),
                 cached.end());

    if (cached.size() >= threshold_) {
        domain::AverageResult result;
        result.average = domain::meanTemperature(cached);
        result.count = cached.size();
        result.windowStart = window.start;
        result.windowEnd = window.end;
        result.source = domain::DataSource::Cache;
        LOG_DEBUG("aggregator", "Cache hit: ", cached.size(), " readings in window");
        return result;
    }

    LOG_DEBUG("aggregator", "Cache holds ", cached.size(), "/", threshold_, " readings, querying storage");
    return fromStorage(window);
}

domain::AverageResult CacheFirstAggregator::fromStorage(const domain::TimeWindow& window) const {
    try {
        std::vector<domain::Reading> rows;
        {
            auto connection = pool_.scopedAcquire();
            rows = connection->loadRange(window.start, window.end);
        }

        domain::AverageResult result;
        result.average = domain::meanTemperature(rows);
        result.count = rows.size();
        result.windowStart = window.start;
        result.windowEnd = window.end;
        result.source = domain::DataSource::Storage;
        return result;
    } catch (core::StationError& ex) {
        ex.setSource(domain::sourceName(domain::DataSource::Storage));
        LOG_ERROR("aggregator", "Storage aggregation failed (", core::errorCode(ex.kind()), "): ", ex.what());
        throw;
    }
}

} // namespace services
