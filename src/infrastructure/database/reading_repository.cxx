#include "infrastructure/database/reading_repository.hpp"

#include <sstream>

#include "core/errors.hpp"
#include "core/logger.hpp"

namespace infrastructure::database {
namespace {

// 数据库内统一使用 UTC 文本：2026-10-19 10:30:45.123456
std::string sqlTime(domain::Timestamp t) {
    return "'" + domain::formatTimestamp(t, ' ', false) + "'";
}

// 结果集 RAII，保证 mysql_free_result 一定被调用
struct ResultGuard {
    MYSQL_RES* res;
    ~ResultGuard() {
        if (res != nullptr) {
            mysql_free_result(res);
        }
    }
};

} // namespace

void ReadingRepository::open(const core::DatabaseConfig& cfg) {
    if (!client_.initialize() || !client_.connect(cfg)) {
        broken_ = true;
        throw core::StorageError("unable to connect to MariaDB at " + cfg.host + ":" + std::to_string(cfg.port));
    }
    broken_ = false;
}

void ReadingRepository::ensureSchema() {
    run("CREATE TABLE IF NOT EXISTS temperature_readings ("
        "id BIGINT UNSIGNED NOT NULL AUTO_INCREMENT PRIMARY KEY, "
        "timestamp DATETIME(6) NOT NULL, "
        "temperature DOUBLE NOT NULL, "
        "sensor_id VARCHAR(64) NOT NULL, "
        "created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP, "
        "INDEX idx_timestamp (timestamp), "
        "INDEX idx_sensor_timestamp (sensor_id, timestamp))");
    LOG_INFO("reading_repo", "Schema ready");
}

uint64_t ReadingRepository::insert(const domain::Reading& reading) {
    if (!client_.isConnected()) {
        fail("connection closed");
    }
    std::ostringstream oss;
    oss.precision(17);
    oss << "INSERT INTO temperature_readings (timestamp, temperature, sensor_id) VALUES ("
        << sqlTime(reading.timestamp) << ", "
        << reading.temperature << ", "
        << "'" << client_.escape(reading.sensorId) << "')";

    run(oss.str());
    return client_.insertId();
}

std::vector<domain::Reading> ReadingRepository::loadRange(domain::Timestamp start, domain::Timestamp end) {
    std::ostringstream oss;
    oss << "SELECT id, timestamp, temperature, sensor_id "
        << "FROM temperature_readings "
        << "WHERE timestamp BETWEEN " << sqlTime(start) << " AND " << sqlTime(end) << " "
        << "ORDER BY timestamp ASC";

    run(oss.str());

    ResultGuard guard{client_.storeResult()};
    if (guard.res == nullptr) {
        fail("mysql_store_result() returned null");
    }

    std::vector<domain::Reading> readings;
    MYSQL_ROW row;
    while ((row = mysql_fetch_row(guard.res)) != nullptr) {
        readings.emplace_back(buildReading(row));
    }
    return readings;
}

uint64_t ReadingRepository::countAll() {
    return queryCount("SELECT COUNT(*) FROM temperature_readings");
}

uint64_t ReadingRepository::countSince(domain::Timestamp cutoff) {
    return queryCount("SELECT COUNT(*) FROM temperature_readings WHERE timestamp > " + sqlTime(cutoff));
}

bool ReadingRepository::ping() {
    if (broken_) {
        return false;
    }
    if (!client_.ping()) {
        LOG_WARN("reading_repo", "Ping failed: ", client_.lastError());
        broken_ = true;
        return false;
    }
    return true;
}

void ReadingRepository::close() {
    client_.disconnect();
}

void ReadingRepository::run(const std::string& sql) {
    if (!client_.execute(sql)) {
        fail(client_.lastError());
    }
}

void ReadingRepository::fail(const std::string& what) {
    broken_ = true;
    throw core::StorageError(what);
}

uint64_t ReadingRepository::queryCount(const std::string& sql) {
    run(sql);

    ResultGuard guard{client_.storeResult()};
    if (guard.res == nullptr) {
        fail("mysql_store_result() returned null");
    }
    MYSQL_ROW row = mysql_fetch_row(guard.res);
    if (row == nullptr || row[0] == nullptr) {
        return 0;
    }
    return std::stoull(row[0]);
}

domain::Reading ReadingRepository::buildReading(MYSQL_ROW row) const {
    domain::Reading reading;
    reading.id = row[0] ? std::stoull(row[0]) : 0;
    reading.timestamp = row[1] ? domain::parseTimestamp(row[1]) : domain::Timestamp{};
    reading.temperature = row[2] ? std::stod(row[2]) : 0.0;
    reading.sensorId = row[3] ? row[3] : "";
    return reading;
}

ConnectionFactory makeMariaDbFactory(const core::DatabaseConfig& cfg) {
    return [cfg]() -> std::unique_ptr<StorageConnection> {
        auto repository = std::make_unique<ReadingRepository>();
        repository->open(cfg);
        return repository;
    };
}

} // namespace infrastructure::database
