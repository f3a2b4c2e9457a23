// 处理来自客户端的命令（每行一个 JSON），调用 ReadingService 并返回 JSON 响应
//
// 命令格式
// 1. 写入读数（timestamp 可省略，缺省为当前时间）
//    {"type":"ingest","sensor_id":"sensor_01","temperature":21.5,"timestamp":"2026-10-19T10:30:00Z"}
//    -> {"status":"ok","reading":{"id":1,"timestamp":"...","temperature":21.5,"sensor_id":"sensor_01"}}
// 2. 窗口平均值（默认最近 windowMinutes 分钟；也可以指定 window_minutes 或 start/end）
//    {"type":"average"} / {"type":"average","window_minutes":15} / {"type":"average","start":"...","end":"..."}
//    -> {"status":"ok","average":21.37,"count":42,"window_start":"...","window_end":"...","source":"cache"}
//    窗口内没有数据 -> {"status":"ok","average":null,"count":0,...}
// 3. 最近读数 {"type":"recent","limit":10} -> {"status":"ok","readings":[...]}
// 4. 健康状态 {"type":"health"} -> {"status":"ok","cache":{...},"pool":{...}}
// 5. 运行状态（含数据库统计） {"type":"status"}
// 6. 配置重载 {"type":"config_reload"}
//
// 错误统一为 {"status":"error","error":"<code>","message":"...","source":"storage"?}
// 与“窗口内没有数据”的响应形状不同

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "core/logger.hpp"
#include "monitoring/health_monitor.hpp"
#include "services/reading_service.hpp"

namespace transport {

class StationCommandRouter {
public:
    using ReloadCallback = std::function<void()>;
    using ResponseCallback = std::function<void(const std::string&)>;

    // 单个连接未收到换行时允许缓存的最大字节数
    static constexpr std::size_t kMaxPendingBytes = 64 * 1024;

    StationCommandRouter(services::ReadingService& service,
                         monitoring::HealthMonitor& monitor,
                         ReloadCallback reloadCallback)
        : service_(service)
        , monitor_(monitor)
        , reloadCallback_(std::move(reloadCallback)) {}

    // 收到的数据块可能是半条命令，也可能是多条命令
    // 追加到该连接的缓冲区，按 \n 切出完整命令逐条处理，通过 respond 回调返回响应
    void feed(uint64_t connectionId, const std::string& chunk, const ResponseCallback& respond) {
        std::vector<std::string> lines;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            auto& buffer = buffers_[connectionId];
            buffer += chunk;

            std::size_t pos;
            while ((pos = buffer.find('\n')) != std::string::npos) {
                lines.push_back(buffer.substr(0, pos));
                buffer.erase(0, pos + 1);
            }

            if (buffer.size() > kMaxPendingBytes) {
                buffer.clear();
                if (respond) {
                    respond(errorReply("invalid_payload", "command exceeds maximum size"));
                }
            }
        }

        // 处理命令时不持有缓冲区锁（ingest/average 可能阻塞在连接池上）
        for (const auto& line : lines) {
            if (line.empty() || line == "\r") {
                continue;
            }
            auto reply = handleLine(line);
            if (!reply.empty() && respond) {
                respond(reply);
            }
        }
    }

    // 连接关闭时丢弃它的缓冲区
    void forget(uint64_t connectionId) {
        std::lock_guard<std::mutex> lk(mutex_);
        buffers_.erase(connectionId);
    }

private:
    std::string handleLine(const std::string& line) {
        try {
            auto msg = nlohmann::json::parse(line);
            const std::string type = msg.value("type", "");

            if (type == "ingest") {
                return handleIngest(msg);
            } else if (type == "average") {
                return handleAverage(msg);
            } else if (type == "recent") {
                return handleRecent(msg);
            } else if (type == "health") {
                auto json = domain::toJson(service_.health());
                json["status"] = "ok";
                return json.dump();
            } else if (type == "status") {
                auto json = service_.status();
                json["status"] = "ok";
                return json.dump();
            } else if (type == "config_reload") {
                if (reloadCallback_) {
                    reloadCallback_();
                }
                return R"({"status":"ok","message":"configuration will be reloaded from disk"})";
            }
            return errorReply("unknown_command", "unknown command: " + type);
        } catch (const core::StationError& ex) {
            return errorReply(core::errorCode(ex.kind()), ex.what(), ex.source());
        } catch (const nlohmann::json::exception& ex) {
            monitor_.update("command_router", false, ex.what());
            return errorReply("invalid_payload", ex.what());
        } catch (const std::exception& ex) {
            LOG_ERROR("command_router", "Unhandled error: ", ex.what());
            monitor_.update("command_router", false, ex.what());
            return errorReply("internal", ex.what());
        }
    }

    std::string handleIngest(const nlohmann::json& msg) {
        auto stored = service_.ingest(domain::readingFromJson(msg));
        nlohmann::json json{{"status", "ok"}, {"reading", domain::toJson(stored)}};
        return json.dump();
    }

    std::string handleAverage(const nlohmann::json& msg) {
        std::optional<domain::TimeWindow> window;
        if (msg.contains("start") || msg.contains("end")) {
            if (!msg.contains("start") || !msg.contains("end")
                || !msg["start"].is_string() || !msg["end"].is_string()) {
                throw core::ValidationError("start and end must both be timestamps");
            }
            window = domain::TimeWindow{
                domain::parseTimestamp(msg["start"].get<std::string>()),
                domain::parseTimestamp(msg["end"].get<std::string>())};
        } else if (msg.contains("window_minutes")) {
            const auto& minutes = msg["window_minutes"];
            if (!minutes.is_number_integer() || minutes.get<long>() <= 0
                || minutes.get<long>() > domain::kMaxWindowMinutes) {
                throw core::ValidationError("window_minutes must be an integer between 1 and "
                                            + std::to_string(domain::kMaxWindowMinutes));
            }
            window = domain::windowEndingAt(domain::nowTimestamp(),
                                            std::chrono::minutes(msg["window_minutes"].get<long>()));
        }

        auto json = domain::toJson(service_.queryAverage(window));
        json["status"] = "ok";
        return json.dump();
    }

    std::string handleRecent(const nlohmann::json& msg) {
        long limit = 10;
        if (auto it = msg.find("limit"); it != msg.end()) {
            if (!it->is_number_integer()) {
                throw core::ValidationError("limit must be an integer");
            }
            limit = it->get<long>();
        }

        nlohmann::json json;
        json["status"] = "ok";
        json["readings"] = nlohmann::json::array();
        for (const auto& reading : service_.recent(limit)) {
            json["readings"].push_back(domain::toJson(reading));
        }
        return json.dump();
    }

    static std::string errorReply(const std::string& code, const std::string& message,
                                  const std::string& source = "") {
        nlohmann::json json{{"status", "error"}, {"error", code}, {"message", message}};
        if (!source.empty()) {
            json["source"] = source;
        }
        return json.dump();
    }

    services::ReadingService& service_;
    monitoring::HealthMonitor& monitor_;
    ReloadCallback reloadCallback_;

    std::mutex mutex_;
    std::unordered_map<uint64_t, std::string> buffers_; // TCP 粘包处理：每个连接一个缓冲区
};

} // namespace transport

// 粘包/分包示例：
//   数据包1: {"type":"ingest","sensor_id":"s1","tem
//   数据包2: perature":21.5}\n{"type":"hea
//   数据包3: lth"}\n
// 第 2 次 feed 时切出第一条命令，第 3 次 feed 时切出第二条
