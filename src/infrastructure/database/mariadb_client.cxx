#include "infrastructure/database/mariadb_client.hpp"

#include <vector>

#include "core/errors.hpp"
#include "core/logger.hpp"

namespace infrastructure::database {

// 析构时关闭连接，避免资源泄漏
MariaDbClient::~MariaDbClient() {
    disconnect();
}

// 只初始化结构体，不建立真实连接
bool MariaDbClient::initialize() {
    handle_ = mysql_init(nullptr);
    if (handle_ == nullptr) {
        LOG_ERROR("database", "mysql_init() failed");
        return false;
    }
    return true;
}

bool MariaDbClient::connect(const core::DatabaseConfig& cfg) {
    if (handle_ == nullptr && !initialize()) {
        return false;
    }

    unsigned int timeout = cfg.connectTimeoutSeconds;
    mysql_options(handle_, MYSQL_OPT_CONNECT_TIMEOUT, &timeout);

    MYSQL* result = mysql_real_connect(
        handle_,
        cfg.host.c_str(),
        cfg.user.c_str(),
        cfg.password.c_str(),
        cfg.schema.c_str(),
        cfg.port,
        nullptr,
        0);

    if (result == nullptr) {
        LOG_ERROR("database", "mysql_real_connect() failed: ", mysql_error(handle_));
        return false;
    }
    connected_ = true;
    LOG_DEBUG("database", "Connected to MariaDB at ", cfg.host, ":", cfg.port);
    return true;
}

bool MariaDbClient::isConnected() const {
    return handle_ != nullptr && connected_;
}

// 返回 0 表示连接仍然活跃
bool MariaDbClient::ping() {
    if (!isConnected()) {
        return false;
    }
    return mysql_ping(handle_) == 0;
}

bool MariaDbClient::execute(const std::string& query) {
    if (!isConnected()) {
        LOG_ERROR("database", "Query on a closed connection. SQL: ", query);
        return false;
    }

    if (mysql_query(handle_, query.c_str()) != 0) {
        LOG_ERROR("database", "Query failed: ", mysql_error(handle_), ". SQL: ", query);
        return false;
    }
    return true;
}

MYSQL_RES* MariaDbClient::storeResult() {
    if (handle_ == nullptr) {
        return nullptr;
    }
    return mysql_store_result(handle_);
}

std::string MariaDbClient::escape(const std::string& value) const {
    if (handle_ == nullptr) {
        throw core::StorageError("cannot escape a value on a closed connection");
    }
    // 最坏情况每个字符都要转义：2n + 1
    std::vector<char> buffer(value.size() * 2 + 1);
    unsigned long length = mysql_real_escape_string(handle_, buffer.data(), value.c_str(),
                                                    static_cast<unsigned long>(value.size()));
    return std::string(buffer.data(), length);
}

uint64_t MariaDbClient::insertId() const {
    return handle_ == nullptr ? 0 : static_cast<uint64_t>(mysql_insert_id(handle_));
}

std::string MariaDbClient::lastError() const {
    return handle_ == nullptr ? std::string("connection closed") : std::string(mysql_error(handle_));
}

void MariaDbClient::disconnect() {
    if (handle_ != nullptr) {
        mysql_close(handle_);
        handle_ = nullptr;
    }
    connected_ = false;
}

} // namespace infrastructure::database
