#include "core/configuration.hpp"

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

#include "core/logger.hpp"

namespace core {
namespace {

// 读取一个正整数字段；字段不存在返回 true 并保留原值，存在但不是正整数返回 false
bool readPositive(const nlohmann::json& section, const char* key, uint32_t& out) {
    auto it = section.find(key);
    if (it == section.end()) {
        return true;
    }
    if (!it->is_number_integer()) {
        return false;
    }
    auto value = it->get<int64_t>();
    if (value <= 0 || value > static_cast<int64_t>(UINT32_MAX)) {
        return false;
    }
    out = static_cast<uint32_t>(value);
    return true;
}

void parsePool(const nlohmann::json& section, PoolConfig& pool) {
    PoolConfig parsed;
    bool ok = readPositive(section, "minConnections", parsed.minConnections)
        && readPositive(section, "maxConnections", parsed.maxConnections)
        && readPositive(section, "acquireTimeoutMs", parsed.acquireTimeoutMs);

    if (!ok || parsed.minConnections > parsed.maxConnections) {
        LOG_ERROR("config", "Invalid pool section (need positive integers and minConnections <= maxConnections). Using defaults.");
        pool = PoolConfig{};
        return;
    }
    pool = parsed;
}

void parseCache(const nlohmann::json& section, CacheConfig& cache) {
    CacheConfig parsed;
    if (!readPositive(section, "capacity", parsed.capacity)) {
        LOG_ERROR("config", "Invalid cache capacity. Using default ", CacheConfig{}.capacity);
        cache = CacheConfig{};
        return;
    }
    cache = parsed;
}

void parseAnalytics(const nlohmann::json& section, AnalyticsConfig& analytics) {
    AnalyticsConfig parsed;
    bool ok = readPositive(section, "windowMinutes", parsed.windowMinutes)
        && readPositive(section, "sufficiencyThreshold", parsed.sufficiencyThreshold)
        && readPositive(section, "recentLimitMax", parsed.recentLimitMax);
    if (!ok) {
        LOG_ERROR("config", "Invalid analytics section. Using defaults.");
        analytics = AnalyticsConfig{};
        return;
    }
    analytics = parsed;
}

} // namespace

ConfigurationManager::ConfigurationManager(std::string path)
    : path_(std::move(path)) {
    loadFromDisk();
}

bool ConfigurationManager::reloadIfChanged() {
    std::error_code ec;
    auto current = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        return false;
    }
    if (current != lastWriteTime_) {
        loadFromDisk();
        lastWriteTime_ = current;
        return true;
    }
    return false;
}

void ConfigurationManager::reload() {
    loadFromDisk();
}

void ConfigurationManager::loadFromDisk() {
    std::ifstream in(path_);

    if (!in.good()) {
        // 文件不存在：写出默认模板
        auto parent = std::filesystem::path(path_).parent_path();
        std::error_code ec;
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        std::ofstream out(path_);
        out << defaultJson();
        out.close();
        LOG_WARN("config", "Configuration file missing. A default template was created at ", path_);
        config_ = Configuration{};
        lastWriteTime_ = std::filesystem::last_write_time(path_, ec);
        return;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    config_ = fromJson(buffer.str());

    std::error_code ec;
    lastWriteTime_ = std::filesystem::last_write_time(path_, ec);
}

Configuration ConfigurationManager::fromJson(const std::string& jsonText) {
    Configuration cfg;
    try {
        auto json = nlohmann::json::parse(jsonText);

        if (auto it = json.find("database"); it != json.end()) {
            cfg.database.host = it->value("host", cfg.database.host);
            cfg.database.port = it->value("port", cfg.database.port);
            cfg.database.user = it->value("user", cfg.database.user);
            cfg.database.password = it->value("password", cfg.database.password);
            cfg.database.schema = it->value("schema", cfg.database.schema);
            cfg.database.connectTimeoutSeconds = it->value("connectTimeoutSeconds", cfg.database.connectTimeoutSeconds);
        }

        if (auto it = json.find("pool"); it != json.end()) {
            parsePool(*it, cfg.pool);
        }

        if (auto it = json.find("cache"); it != json.end()) {
            parseCache(*it, cfg.cache);
        }

        if (auto it = json.find("analytics"); it != json.end()) {
            parseAnalytics(*it, cfg.analytics);
        }

        if (auto it = json.find("server"); it != json.end()) {
            cfg.server.bindAddress = it->value("bindAddress", cfg.server.bindAddress);
            cfg.server.port = it->value("port", cfg.server.port);
            cfg.server.workerThreads = it->value("workerThreads", cfg.server.workerThreads);
            cfg.server.maxConnections = it->value("maxConnections", cfg.server.maxConnections);
        }

        if (auto it = json.find("health"); it != json.end()) {
            cfg.health.statusFile = it->value("statusFile", cfg.health.statusFile);
            cfg.health.intervalSeconds = it->value("intervalSeconds", cfg.health.intervalSeconds);
        }

        if (auto it = json.find("logging"); it != json.end()) {
            cfg.logging.level = it->value("level", cfg.logging.level);
            cfg.logging.file = it->value("file", cfg.logging.file);
            cfg.logging.console = it->value("console", cfg.logging.console);
        }

    } catch (const std::exception& ex) {
        LOG_ERROR("config", "Failed to parse configuration. Using defaults. Error: ", ex.what());
        return Configuration{};
    }
    return cfg;
}

std::string ConfigurationManager::defaultJson() {
    Configuration defaults;
    nlohmann::json json{
        {"database",
         {{"host", defaults.database.host},
          {"port", defaults.database.port},
          {"user", defaults.database.user},
          {"password", defaults.database.password},
          {"schema", defaults.database.schema},
          {"connectTimeoutSeconds", defaults.database.connectTimeoutSeconds}}},
        {"pool",
         {{"minConnections", defaults.pool.minConnections},
          {"maxConnections", defaults.pool.maxConnections},
          {"acquireTimeoutMs", defaults.pool.acquireTimeoutMs}}},
        {"cache",
         {{"capacity", defaults.cache.capacity}}},
        {"analytics",
         {{"windowMinutes", defaults.analytics.windowMinutes},
          {"sufficiencyThreshold", defaults.analytics.sufficiencyThreshold},
          {"recentLimitMax", defaults.analytics.recentLimitMax}}},
        {"server",
         {{"bindAddress", defaults.server.bindAddress},
          {"port", defaults.server.port},
          {"workerThreads", defaults.server.workerThreads},
          {"maxConnections", defaults.server.maxConnections}}},
        {"health",
         {{"statusFile", defaults.health.statusFile},
          {"intervalSeconds", defaults.health.intervalSeconds}}},
        {"logging",
         {{"level", defaults.logging.level},
          {"file", defaults.logging.file},
          {"console", defaults.logging.console}}}
    };

    return json.dump(4);
}

} // namespace core
