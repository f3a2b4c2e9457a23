// 最近读数缓存：按“写入的先后”保留最近 capacity 条读数，满了淘汰最早写入的一条
// 注意：淘汰顺序与读数自身的 timestamp 无关，也不按传感器/时间去重
// 读操作（mostRecent / snapshotSince）不算访问，不改变淘汰顺序

#pragma once

#include <algorithm>
#include <list>
#include <mutex>
#include <vector>

#include "domain/reading.hpp"

namespace infrastructure::cache {

class RecencyCache {
public:
    explicit RecencyCache(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    RecencyCache(const RecencyCache&) = delete;
    RecencyCache& operator=(const RecencyCache&) = delete;

    // 插入为最新一条；超过容量时先淘汰最早的一条。插入 + 淘汰在同一把锁内完成
    void record(const domain::Reading& reading) {
        std::lock_guard<std::mutex> lk(mutex_);

        if (entries_.size() >= capacity_) {
            evictLeastRecentLocked();
        }

        // 链表头部 = 最近，尾部 = 最久
        entries_.push_front(reading);
    }

    // 从最新到最旧，最多 limit 条；limit <= 0 返回空
    std::vector<domain::Reading> mostRecent(long limit) const {
        std::vector<domain::Reading> result;
        if (limit <= 0) {
            return result;
        }

        std::lock_guard<std::mutex> lk(mutex_);
        auto count = std::min<std::size_t>(static_cast<std::size_t>(limit), entries_.size());
        result.reserve(count);
        for (auto it = entries_.begin(); it != entries_.end() && result.size() < count; ++it) {
            result.push_back(*it);
        }
        return result;
    }

    // 所有 timestamp >= cutoff 的读数（顺序不保证）
    // 缓存按写入时间保留，较早的数据可能只在数据库里，所以这里返回空不代表窗口内没有数据
    std::vector<domain::Reading> snapshotSince(domain::Timestamp cutoff) const {
        std::lock_guard<std::mutex> lk(mutex_);
        std::vector<domain::Reading> result;
        for (const auto& reading : entries_) {
            if (reading.timestamp >= cutoff) {
                result.push_back(reading);
            }
        }
        return result;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return entries_.size();
    }

    std::size_t capacity() const { return capacity_; }

    // 关闭时清空
    void clear() {
        std::lock_guard<std::mutex> lk(mutex_);
        entries_.clear();
    }

private:
    // O(1)：尾部就是最早写入的条目
    void evictLeastRecentLocked() {
        if (!entries_.empty()) {
            entries_.pop_back();
        }
    }

    const std::size_t capacity_;
    mutable std::mutex mutex_;

    // 头部 = 最近，尾部 = 最早；读不调整顺序，所以不需要按 key 查找的索引
    // 同一读数重复写入是不同的条目
    std::list<domain::Reading> entries_;
};

} // namespace infrastructure::cache

// 数据结构说明
//
// entries_ (list)
//   front -> [reading D]
//            [reading C]
//   back  -> [reading B]
//
// capacity = 3 时再写入 E：
//   1. 删除 back（B）
//   2. E 插入 front
