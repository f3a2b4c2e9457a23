// MariaDB Client（单条数据库连接的薄封装）

#pragma once

#include <mariadb/mysql.h>
#include <cstdint>
#include <string>

#include "core/configuration.hpp"

// mysql API 基础概念
// MYSQL* handle
//   ├─ mysql_init() 创建
//   ├─ mysql_real_connect() 建立真实连接
//   ├─ mysql_query() 执行 SQL
//   ├─ mysql_store_result() 获取结果
//   └─ mysql_close() 关闭连接
//
// MYSQL_RES* 结果集
//   ├─ mysql_fetch_row() 逐行读取（MYSQL_ROW 即 char**）
//   └─ mysql_free_result() 释放内存

namespace infrastructure::database {

class MariaDbClient {
public:
    MariaDbClient() = default;
    ~MariaDbClient();

    MariaDbClient(const MariaDbClient&) = delete;
    MariaDbClient& operator=(const MariaDbClient&) = delete;

    bool initialize();  // 创建 MySQL 上下文
    bool connect(const core::DatabaseConfig& cfg);
    bool isConnected() const;
    bool ping();

    bool execute(const std::string& query);
    MYSQL_RES* storeResult();   // 仅在 execute 成功后调用

    // 转义字符串参数，防止 SQL 注入；连接已关闭时抛 core::StorageError
    std::string escape(const std::string& value) const;

    uint64_t insertId() const;
    std::string lastError() const;

    void disconnect();

private:
    MYSQL* handle_{nullptr};
    bool connected_{false};
};

} // namespace infrastructure::database
