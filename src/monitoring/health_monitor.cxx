#include "monitoring/health_monitor.hpp"

#include <filesystem>
#include <fstream>

#include "core/logger.hpp"

namespace monitoring {

HealthMonitor::HealthMonitor(std::string path, std::chrono::seconds interval)
    : filePath_(std::move(path))
    , interval_(interval) {
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&HealthMonitor::writerLoop, this);
}

void HealthMonitor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);    // 避免写线程错过唤醒
    }
    wakeup_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void HealthMonitor::update(const std::string& component, bool healthy, const std::string& detail) {
    std::lock_guard<std::mutex> lk(mutex_);
    states_[component] = HealthState{healthy, detail, std::chrono::system_clock::now()};
}

std::optional<HealthState> HealthMonitor::state(const std::string& component) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = states_.find(component);
    if (it == states_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void HealthMonitor::setMetricsProvider(MetricsProvider provider) {
    std::lock_guard<std::mutex> lk(mutex_);
    metricsProvider_ = std::move(provider);
}

void HealthMonitor::writerLoop() {
    std::unique_lock<std::mutex> lk(mutex_);
    while (running_) {
        lk.unlock();
        flush();
        lk.lock();
        wakeup_.wait_for(lk, interval_, [this] { return !running_; });
    }
    lk.unlock();

    // 线程退出前最后写一次
    flush();
}

nlohmann::json HealthMonitor::render() const {
    std::map<std::string, HealthState> snapshot;
    MetricsProvider provider;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        snapshot = states_;
        provider = metricsProvider_;
    }

    nlohmann::json json;
    json["components"] = nlohmann::json::object();
    for (const auto& [component, state] : snapshot) {
        auto time = std::chrono::system_clock::to_time_t(state.updatedAt);
        json["components"][component] = {
            {"healthy", state.healthy},
            {"detail", state.detail},
            {"updatedAt", time}
        };
    }
    if (provider) {
        json["station"] = provider();
    }
    return json;
}

void HealthMonitor::flush() {
    try {
        auto json = render();

        auto parent = std::filesystem::path(filePath_).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream out(filePath_, std::ios::out | std::ios::trunc);
        out << json.dump(4);
    } catch (const std::exception& ex) {
        LOG_ERROR("health_monitor", "Failed to persist health information: ", ex.what());
    }
}

} // namespace monitoring
