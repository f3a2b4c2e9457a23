#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace monitoring {

// 单个组件的健康状态
struct HealthState {
    bool healthy{false};
    std::string detail;
    std::chrono::system_clock::time_point updatedAt;
};

// 定期把各组件健康状态（以及缓存/连接池指标）写入 JSON 文件，供外部监控读取
class HealthMonitor {
public:
    using MetricsProvider = std::function<nlohmann::json()>;

    HealthMonitor(std::string path, std::chrono::seconds interval);
    ~HealthMonitor();

    void start();
    void stop();

    void update(const std::string& component, bool healthy, const std::string& detail);

    std::optional<HealthState> state(const std::string& component) const;

    // 每次写文件时调用，结果写在 "station" 字段下
    void setMetricsProvider(MetricsProvider provider);

    // 立即写一次文件
    void flush();

private:
    void writerLoop();
    nlohmann::json render() const;

    std::string filePath_;
    std::chrono::seconds interval_;

    std::map<std::string, HealthState> states_;
    MetricsProvider metricsProvider_;
    mutable std::mutex mutex_;

    std::condition_variable wakeup_;    // stop() 时立即唤醒写线程
    std::thread worker_;
    std::atomic<bool> running_{false};
};

} // namespace monitoring
