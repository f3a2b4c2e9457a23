// 缓存优先的窗口平均值计算
//
// 1. 从缓存取 timestamp >= start 的读数，再筛掉 > end 的
// 2. 数量 >= 阈值：直接用缓存算，source = cache
//    这是近似结果：窗口结束前已被淘汰出缓存的读数不会计入，换来不访问数据库的响应速度
// 3. 否则借一条连接按 [start, end] 查库，source = storage
//    只用数据库结果，不与缓存合并（缓存里的读数都已写库，合并会重复计数）
// 4. 走了数据库路径后出错直接抛给调用方（打上 source = "storage" 标签），不会退回缓存的部分结果
// 5. 窗口内没有数据：count = 0，average 为空
//
// 每次调用互不影响，除了缓存和连接池之外没有共享的可变状态

#pragma once

#include <cstdint>

#include "domain/reading.hpp"
#include "infrastructure/cache/recency_cache.hpp"
#include "infrastructure/database/connection_pool.hpp"

namespace services {

class CacheFirstAggregator {
public:
    CacheFirstAggregator(infrastructure::cache::RecencyCache& cache,
                         infrastructure::database::ConnectionPool& pool,
                         uint32_t sufficiencyThreshold)
        : cache_(cache)
        , pool_(pool)
        , threshold_(sufficiencyThreshold) {}

    domain::AverageResult average(const domain::TimeWindow& window) const;

private:
    domain::AverageResult fromStorage(const domain::TimeWindow& window) const;

    infrastructure::cache::RecencyCache& cache_;
    infrastructure::database::ConnectionPool& pool_;
    uint32_t threshold_;
};

} // namespace services
