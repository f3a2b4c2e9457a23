// 一条到持久化存储的逻辑连接（连接池中的一个句柄）
// 存储被当作“按时间有序、可按时间范围查询、可逐行追加”的读数表

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "domain/reading.hpp"

namespace infrastructure::database {

class StorageConnection {
public:
    virtual ~StorageConnection() = default;

    // 建表、建索引（幂等）
    virtual void ensureSchema() = 0;

    // 追加一行，返回行 id
    virtual uint64_t insert(const domain::Reading& reading) = 0;

    // [start, end] 两端包含，按 timestamp 升序
    virtual std::vector<domain::Reading> loadRange(domain::Timestamp start, domain::Timestamp end) = 0;

    virtual uint64_t countAll() = 0;
    virtual uint64_t countSince(domain::Timestamp cutoff) = 0;

    // 连接是否仍然可用（归还前/借出前检查）
    virtual bool ping() = 0;

    // 使用过程中出过错的连接会被标记为 broken，连接池不会再把它放回空闲队列
    virtual bool broken() const = 0;

    virtual void close() = 0;
};

// 连接池创建连接的唯一入口；失败时抛 core::StorageError
using ConnectionFactory = std::function<std::unique_ptr<StorageConnection>()>;

} // namespace infrastructure::database
