#include "domain/reading.hpp"

#include <cctype>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

#include "core/errors.hpp"

namespace domain {

void validate(const Reading& reading) {
    if (!std::isfinite(reading.temperature)
        || reading.temperature < kMinTemperature
        || reading.temperature > kMaxTemperature) {
        std::ostringstream oss;
        oss << "temperature must be between " << kMinTemperature << " and " << kMaxTemperature
            << " degrees Celsius";
        throw core::ValidationError(oss.str());
    }
    if (reading.sensorId.empty()) {
        throw core::ValidationError("sensor_id must not be empty");
    }
    if (reading.sensorId.size() > kMaxSensorIdLength) {
        throw core::ValidationError("sensor_id must be at most 64 characters");
    }
}

std::optional<double> meanTemperature(const std::vector<Reading>& readings) {
    if (readings.empty()) {
        return std::nullopt;
    }
    double sum = 0.0;
    for (const auto& reading : readings) {
        sum += reading.temperature;
    }
    return sum / static_cast<double>(readings.size());
}

std::string formatTimestamp(Timestamp timestamp, char separator, bool zulu) {
    using namespace std::chrono;

    auto whole = floor<seconds>(timestamp);
    auto micros = duration_cast<microseconds>(timestamp - whole).count();

    std::time_t time = system_clock::to_time_t(whole);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d") << separator << std::put_time(&tm, "%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros;
    if (zulu) {
        oss << 'Z';
    }
    return oss.str();
}

Timestamp parseTimestamp(const std::string& text) {
    // 日期和时间之间允许 'T' 或空格
    if (text.size() < 19 || (text[10] != 'T' && text[10] != ' ')) {
        throw core::ValidationError("invalid timestamp: " + text);
    }
    std::string normalized = text;
    normalized[10] = ' ';

    std::istringstream iss(normalized.substr(0, 19));
    std::tm tm{};
    iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (iss.fail()) {
        throw core::ValidationError("invalid timestamp: " + text);
    }

    // 可选的小数秒（最多 6 位）和结尾的 Z
    std::size_t pos = 19;
    long micros = 0;
    if (pos < normalized.size() && normalized[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < normalized.size() && std::isdigit(static_cast<unsigned char>(normalized[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (normalized[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            throw core::ValidationError("invalid timestamp: " + text);
        }
        for (; digits < 6; ++digits) {
            micros *= 10;
        }
    }
    if (pos < normalized.size() && normalized[pos] == 'Z') {
        ++pos;
    }
    if (pos != normalized.size()) {
        throw core::ValidationError("invalid timestamp: " + text);
    }

    // get_time 接受 02-31 这类日期，timegm 会把它顺延到下个月，这里按原样比较后拒绝
    const std::tm parsed = tm;
    std::time_t seconds = timegm(&tm);
    if (tm.tm_year != parsed.tm_year || tm.tm_mon != parsed.tm_mon || tm.tm_mday != parsed.tm_mday
        || tm.tm_hour != parsed.tm_hour || tm.tm_min != parsed.tm_min || tm.tm_sec != parsed.tm_sec) {
        throw core::ValidationError("invalid calendar date: " + text);
    }
    return Timestamp(std::chrono::seconds(seconds) + std::chrono::microseconds(micros));
}

nlohmann::json toJson(const Reading& reading) {
    return nlohmann::json{
        {"id", reading.id},
        {"timestamp", formatTimestamp(reading.timestamp)},
        {"temperature", reading.temperature},
        {"sensor_id", reading.sensorId}
    };
}

nlohmann::json toJson(const AverageResult& result) {
    nlohmann::json json;
    if (result.average.has_value()) {
        json["average"] = std::round(*result.average * 100.0) / 100.0;    // 保留两位小数
    } else {
        json["average"] = nullptr;
    }
    json["count"] = result.count;
    json["window_start"] = formatTimestamp(result.windowStart);
    json["window_end"] = formatTimestamp(result.windowEnd);
    json["source"] = sourceName(result.source);
    return json;
}

nlohmann::json toJson(const HealthSnapshot& health) {
    return nlohmann::json{
        {"cache", {{"size", health.cacheSize}, {"capacity", health.cacheCapacity}}},
        {"pool", {{"idle", health.pool.idle}, {"active", health.pool.active}, {"total", health.pool.total}}}
    };
}

Reading readingFromJson(const nlohmann::json& json) {
    if (!json.contains("sensor_id") || !json["sensor_id"].is_string()) {
        throw core::ValidationError("sensor_id is required and must be a string");
    }
    if (!json.contains("temperature") || !json["temperature"].is_number()) {
        throw core::ValidationError("temperature is required and must be a number");
    }

    Reading reading;
    reading.sensorId = json["sensor_id"].get<std::string>();
    reading.temperature = json["temperature"].get<double>();

    auto it = json.find("timestamp");
    if (it == json.end() || it->is_null()) {
        reading.timestamp = nowTimestamp();
    } else if (it->is_string()) {
        reading.timestamp = parseTimestamp(it->get<std::string>());
    } else {
        throw core::ValidationError("timestamp must be a string");
    }
    return reading;
}

} // namespace domain
