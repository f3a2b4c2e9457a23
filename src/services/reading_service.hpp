// 对外接口（传输层调用）：写入读数、窗口平均值、最近读数、健康状态

#pragma once

#include <optional>
#include <vector>

#include <nlohmann/json.hpp>

#include "domain/reading.hpp"
#include "monitoring/health_monitor.hpp"
#include "services/cache_first_aggregator.hpp"
#include "services/station_context.hpp"

namespace services {

class ReadingService {
public:
    ReadingService(StationContext& context, monitoring::HealthMonitor& monitor);

    // 校验 -> 写库 -> 写库成功后才写缓存；返回带行 id 的读数
    // 失败抛 ValidationError / PoolExhausted / PoolClosed / StorageError，缓存不会被修改
    domain::Reading ingest(domain::Reading reading);

    // 不传窗口时使用配置的默认窗口（以当前时间结尾）
    domain::AverageResult queryAverage(const std::optional<domain::TimeWindow>& window = std::nullopt);

    // 从缓存取最近写入的读数（最新在前）；limit 超过配置上限抛 ValidationError
    std::vector<domain::Reading> recent(long limit) const;

    // 只读缓存和连接池的计数，不访问数据库
    domain::HealthSnapshot health() const;

    // health() + 数据库里的读数总数、最近一小时的读数
    nlohmann::json status();

private:
    StationContext& context_;
    monitoring::HealthMonitor& monitor_;
    CacheFirstAggregator aggregator_;
};

} // namespace services
