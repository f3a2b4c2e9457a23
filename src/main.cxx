// 应用启动入口：初始化各模块，管理生命周期

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <thread>

#include "core/configuration.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "infrastructure/database/reading_repository.hpp"
#include "monitoring/health_monitor.hpp"
#include "services/reading_service.hpp"
#include "services/station_context.hpp"
#include "transport/command_router.hpp"
#include "transport/command_server.hpp"

namespace {
std::atomic<bool>* g_shouldRun = nullptr;

// SIGINT / SIGTERM
void handleSignal(int)
{
    if (g_shouldRun)
    {
        g_shouldRun->store(false);
    }
}
}

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config/weather_station.json";

    core::ConfigurationManager configManager(configPath);
    const auto config = configManager.get();    // 运行期间使用启动时的配置副本

    core::Logger::instance().configure(core::parseLogLevel(config.logging.level),
                                       config.logging.file,
                                       config.logging.console);

    monitoring::HealthMonitor healthMonitor(config.health.statusFile,
                                            std::chrono::seconds(config.health.intervalSeconds));
    healthMonitor.start();

    // 初始化连接池（minConnections 条 MariaDB 连接）和缓存
    std::unique_ptr<services::StationContext> context;
    try {
        context = std::make_unique<services::StationContext>(
            config, infrastructure::database::makeMariaDbFactory(config.database));
    } catch (const core::StationError& ex) {
        LOG_CRITICAL("bootstrap", "Failed to initialise storage: ", ex.what(), ". Exiting.");
        healthMonitor.update("storage", false, ex.what());
        healthMonitor.stop();
        return EXIT_FAILURE;
    }
    healthMonitor.update("storage", true, "Connection pool ready");

    services::ReadingService readingService(*context, healthMonitor);
    healthMonitor.setMetricsProvider([&readingService]() {
        return domain::toJson(readingService.health());
    });

    std::atomic<bool> reloadRequested{false};
    transport::StationCommandRouter router(readingService, healthMonitor, [&]() {
        reloadRequested.store(true);
    });

    transport::StationCommandServer server(config.server, router, healthMonitor);
    if (!server.start()) {
        LOG_CRITICAL("bootstrap", "Failed to start command server");
        context->shutdown();
        healthMonitor.stop();
        return EXIT_FAILURE;
    }

    std::atomic<bool> shouldRun{true};
    g_shouldRun = &shouldRun;

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    LOG_INFO("bootstrap", "Weather station is running");

    while (shouldRun.load())
    {
        bool reloaded = false;
        if (reloadRequested.exchange(false))
        {
            configManager.reload();
            reloaded = true;
        }
        else
        {
            reloaded = configManager.reloadIfChanged();
        }
        if (reloaded)
        {
            // 连接池和缓存的大小在启动时确定，重载只影响下次启动
            LOG_INFO("bootstrap", "Configuration reloaded; pool and cache settings apply on next restart.");
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    LOG_INFO("bootstrap", "Shutting down");
    server.stop();
    context->shutdown();
    healthMonitor.stop();

    return EXIT_SUCCESS;
}
