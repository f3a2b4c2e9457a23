#pragma once

#include "HPSocket.h"

#include <algorithm>
#include <mutex>
#include <vector>

#include "core/logger.hpp"

// HPSocket 监听器基类：只负责记录当前在线的连接
class ServerListener : public CTcpServerListener
{
private:
    std::vector<CONNID> _connIDs;   // 所有在线连接
    mutable std::mutex _connMutex;

public:
    EnHandleResult OnPrepareListen(ITcpServer *pSender, SOCKET soListen) override
    {
        return HR_OK;
    }

    EnHandleResult OnAccept(ITcpServer *pSender, CONNID dwConnID, UINT_PTR soClient) override
    {
        {
            std::lock_guard<std::mutex> lk(_connMutex);
            _connIDs.push_back(dwConnID);
        }
        LOG_DEBUG("tcp_server", "Client connected: ", dwConnID);
        return HR_OK;
    }

    EnHandleResult OnReceive(ITcpServer *pSender, CONNID dwConnID, const BYTE *pData, int iLength) override
    {
        return HR_OK;
    }

    EnHandleResult OnClose(ITcpServer *pSender, CONNID dwConnID, EnSocketOperation, int iErrorCode) override
    {
        LOG_DEBUG("tcp_server", "Client disconnected: ", dwConnID, " (error ", iErrorCode, ")");
        std::lock_guard<std::mutex> lk(_connMutex);
        _connIDs.erase(
            std::remove(_connIDs.begin(), _connIDs.end(), dwConnID),
            _connIDs.end());
        return HR_OK;
    }

    std::size_t connectionCount() const
    {
        std::lock_guard<std::mutex> lk(_connMutex);
        return _connIDs.size();
    }
};
