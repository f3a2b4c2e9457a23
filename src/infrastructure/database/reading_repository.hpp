// ReadingRepository（MariaDB 上的读数表访问，一个实例 = 连接池中的一个连接）

#pragma once

#include <memory>
#include <vector>

#include "core/configuration.hpp"
#include "domain/reading.hpp"
#include "infrastructure/database/mariadb_client.hpp"
#include "infrastructure/database/storage_connection.hpp"

namespace infrastructure::database {

class ReadingRepository : public StorageConnection {
public:
    ReadingRepository() = default;

    // 建立连接，失败抛 core::StorageError
    void open(const core::DatabaseConfig& cfg);

    void ensureSchema() override;
    uint64_t insert(const domain::Reading& reading) override;
    std::vector<domain::Reading> loadRange(domain::Timestamp start, domain::Timestamp end) override;
    uint64_t countAll() override;
    uint64_t countSince(domain::Timestamp cutoff) override;
    bool ping() override;
    bool broken() const override { return broken_; }
    void close() override;

private:
    // 执行失败：标记连接损坏并抛 StorageError
    void run(const std::string& sql);
    [[noreturn]] void fail(const std::string& what);

    uint64_t queryCount(const std::string& sql);

    // MYSQL_ROW -> Reading（列顺序：id, timestamp, temperature, sensor_id）
    domain::Reading buildReading(MYSQL_ROW row) const;

    MariaDbClient client_;
    bool broken_{false};
};

// 连接池使用的工厂：每次调用建立一条新的 MariaDB 连接
ConnectionFactory makeMariaDbFactory(const core::DatabaseConfig& cfg);

} // namespace infrastructure::database
