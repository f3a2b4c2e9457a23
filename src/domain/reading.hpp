#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace domain {

// 读数时间戳统一为微秒精度（与数据库 DATETIME(6) 一致，缓存和数据库比较结果相同）
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

inline Timestamp nowTimestamp() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

// 温度合法范围（摄氏度）
constexpr double kMinTemperature = -50.0;
constexpr double kMaxTemperature = 60.0;
constexpr std::size_t kMaxSensorIdLength = 64;

// 统计窗口最长 10 年（分钟）；换算成微秒后远小于 int64 上限
constexpr long kMaxWindowMinutes = 10L * 366 * 24 * 60;

// 单条温度读数（不可变值，创建后不再修改）
struct Reading {
    uint64_t id{0};     // 数据库行 id，写库之前为 0
    Timestamp timestamp{};
    double temperature{0.0};
    std::string sensorId;
};

// 统计窗口 [start, end]，两端都包含
struct TimeWindow {
    Timestamp start{};
    Timestamp end{};

    bool contains(Timestamp t) const { return t >= start && t <= end; }
};

// 以 end 结尾、长度为 length 的窗口
inline TimeWindow windowEndingAt(Timestamp end, std::chrono::minutes length) {
    return TimeWindow{end - length, end};
}

enum class DataSource {
    Cache,
    Storage
};

inline std::string sourceName(DataSource source) {
    switch (source) {
    case DataSource::Cache: return "cache";
    case DataSource::Storage: return "storage";
    default: return "unknown";
    }
}

// 平均值查询结果；窗口内没有数据时 count 为 0，average 为空（不是 0）
struct AverageResult {
    std::optional<double> average;
    std::size_t count{0};
    Timestamp windowStart{};
    Timestamp windowEnd{};
    DataSource source{DataSource::Cache};
};

// 连接池状态
struct PoolStats {
    std::size_t idle{0};
    std::size_t active{0};
    std::size_t total{0};
};

struct HealthSnapshot {
    std::size_t cacheSize{0};
    std::size_t cacheCapacity{0};
    PoolStats pool;
};

// 校验读数（温度范围、传感器 id），非法时抛 core::ValidationError
void validate(const Reading& reading);

// 算术平均；空集合返回 nullopt
std::optional<double> meanTemperature(const std::vector<Reading>& readings);

// UTC 时间文本：2026-10-19T10:30:45.123456Z；separator 为 ' ' 且 zulu 为 false 时即数据库格式
std::string formatTimestamp(Timestamp timestamp, char separator = 'T', bool zulu = true);

// 解析 YYYY-MM-DD[T| ]HH:MM:SS[.ffffff][Z]（按 UTC），格式错误抛 core::ValidationError
Timestamp parseTimestamp(const std::string& text);

nlohmann::json toJson(const Reading& reading);
nlohmann::json toJson(const AverageResult& result);
nlohmann::json toJson(const HealthSnapshot& health);

// 从协议 JSON 构造读数：sensor_id、temperature 必填，timestamp 缺省为当前时间
Reading readingFromJson(const nlohmann::json& json);

} // namespace domain
