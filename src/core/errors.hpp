// 业务异常体系：所有可以被调用方感知的失败都从 StationError 派生
// 缓存本身不抛异常（容量在内部保证），这里的异常只来自校验、连接池和存储

#pragma once

#include <stdexcept>
#include <string>

namespace core {

enum class ErrorKind {
    Validation,     // 读数非法（在进入缓存/连接池之前拒绝）
    PoolExhausted,  // 超时仍拿不到连接
    PoolClosed,     // 连接池已关闭
    Storage,        // 底层数据库读写失败
    HandleMisuse    // 重复归还、归还未借出的连接（编程错误）
};

// 协议里使用的错误码
inline const char* errorCode(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Validation: return "validation";
    case ErrorKind::PoolExhausted: return "pool_exhausted";
    case ErrorKind::PoolClosed: return "pool_closed";
    case ErrorKind::Storage: return "storage";
    case ErrorKind::HandleMisuse: return "handle_misuse";
    default: return "unknown";
    }
}

class StationError : public std::runtime_error {
public:
    StationError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

    // 失败发生在哪条路径上（"cache" / "storage"），聚合时打标签后原样重新抛出
    const std::string& source() const { return source_; }
    void setSource(std::string source) { source_ = std::move(source); }

private:
    ErrorKind kind_;
    std::string source_;
};

class ValidationError : public StationError {
public:
    explicit ValidationError(const std::string& message)
        : StationError(ErrorKind::Validation, message) {}
};

class PoolExhausted : public StationError {
public:
    explicit PoolExhausted(const std::string& message)
        : StationError(ErrorKind::PoolExhausted, message) {}
};

class PoolClosed : public StationError {
public:
    explicit PoolClosed(const std::string& message)
        : StationError(ErrorKind::PoolClosed, message) {}
};

class StorageError : public StationError {
public:
    explicit StorageError(const std::string& message)
        : StationError(ErrorKind::Storage, message) {}
};

class HandleMisuseError : public StationError {
public:
    explicit HandleMisuseError(const std::string& message)
        : StationError(ErrorKind::HandleMisuse, message) {}
};

} // namespace core
