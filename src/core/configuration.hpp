#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace core {

// 数据库配置（MariaDB）
struct DatabaseConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 3306;
    std::string user = "weather";
    std::string password = "weather";
    std::string schema = "weather_station";
    uint32_t connectTimeoutSeconds = 5;
};

// 连接池配置
struct PoolConfig {
    uint32_t minConnections = 2;    // 启动时预先建立的连接数（下限）
    uint32_t maxConnections = 5;    // 上限
    uint32_t acquireTimeoutMs = 3000;   // 借连接的最长等待时间
};

// 最近读数缓存配置
struct CacheConfig {
    uint32_t capacity = 100;
};

// 平均值分析配置
struct AnalyticsConfig {
    uint32_t windowMinutes = 60;    // 默认统计窗口：最近一小时
    uint32_t sufficiencyThreshold = 30; // 缓存命中至少这么多条才不查库
    uint32_t recentLimitMax = 100;  // recent 查询允许的最大条数
};

// TCP 命令服务配置
struct ServerConfig {
    std::string bindAddress = "0.0.0.0";
    uint16_t port = 8000;
    uint16_t workerThreads = 4;
    uint16_t maxConnections = 200;
};

// 健康监控配置
struct HealthConfig {
    std::string statusFile = "artifacts/health_status.json";
    uint16_t intervalSeconds = 10;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file = "logs/weather_station.log";
    bool console = true;
};

// 聚合所有配置
struct Configuration {
    DatabaseConfig database;
    PoolConfig pool;
    CacheConfig cache;
    AnalyticsConfig analytics;
    ServerConfig server;
    HealthConfig health;
    LoggingConfig logging;
};

class ConfigurationManager {
public:
    explicit ConfigurationManager(std::string path);

    const Configuration& get() const { return config_; }

    // 文件修改时间变化时重新加载，返回是否重新加载过
    bool reloadIfChanged();

    // 不比较修改时间，直接重新读文件（config_reload 命令）
    void reload();

    // 解析 JSON 文本；解析失败返回默认配置，某个段不合法时该段整体回退为默认值
    static Configuration fromJson(const std::string& jsonText);

    // 文件不存在时写出的默认模板
    static std::string defaultJson();

private:
    void loadFromDisk();

    Configuration config_;
    std::string path_;
    std::filesystem::file_time_type lastWriteTime_{};
};

} // namespace core
