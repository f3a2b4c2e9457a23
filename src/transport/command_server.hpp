// TCP 命令服务：接收客户端按行发送的 JSON 命令，交给 StationCommandRouter 处理，响应末尾加 \n 发回

#pragma once

#include <cstdint>
#include <string>

#include "core/configuration.hpp"
#include "core/logger.hpp"
#include "monitoring/health_monitor.hpp"
#include "network/server_listener_tcp.hpp"
#include "transport/command_router.hpp"

namespace transport {

class StationCommandServer : public ServerListener {
public:
    StationCommandServer(const core::ServerConfig& config,
                         StationCommandRouter& router,
                         monitoring::HealthMonitor& monitor)
        : config_(config)
        , router_(router)
        , monitor_(monitor)
        , server_(this) {
    }

    bool start()
    {
        server_->SetMaxConnectionCount(config_.maxConnections);
        server_->SetWorkerThreadCount(config_.workerThreads);

        if (!server_->Start(config_.bindAddress.c_str(), config_.port))
        {
            LOG_ERROR("command_server", "Failed to start server on ", config_.bindAddress, ":", config_.port);
            monitor_.update("command_server", false, "Failed to listen");
            return false;
        }
        monitor_.update("command_server", true, "Server listening");
        LOG_INFO("command_server", "Listening on ", config_.bindAddress, ":", config_.port);
        return true;
    }

    void stop()
    {
        LOG_INFO("command_server", "Stopping, ", connectionCount(), " client(s) still connected");
        server_->Stop();
        monitor_.update("command_server", false, "Server stopped");
    }

protected:
    EnHandleResult OnClose(ITcpServer* pSender, CONNID dwConnID, EnSocketOperation op, int errorCode) override
    {
        router_.forget(static_cast<uint64_t>(dwConnID));
        return ServerListener::OnClose(pSender, dwConnID, op, errorCode);
    }

    // 数据到达：交给路由器切分、执行，响应通过回调写回同一个连接
    EnHandleResult OnReceive(ITcpServer* pSender, CONNID dwConnID, const BYTE* pData, int iLength) override
    {
        std::string chunk(reinterpret_cast<const char*>(pData), iLength);

        router_.feed(static_cast<uint64_t>(dwConnID), chunk, [&](const std::string& reply) {
            auto payload = reply + "\n";
            pSender->Send(dwConnID, reinterpret_cast<const BYTE*>(payload.data()), static_cast<int>(payload.size()));
        });
        return HR_OK;
    }

private:
    core::ServerConfig config_;
    StationCommandRouter& router_;
    monitoring::HealthMonitor& monitor_;
    CTcpServerPtr server_;  // HPSocket 服务器对象（构造时传入监听器）
};

} // namespace transport
