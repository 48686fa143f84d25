/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter_id.hpp>
#include <querygate/adapter/query_options.hpp>
#include <querygate/complexity/complexity_analysis.hpp>
#include <querygate/util/clock.hpp>
#include <querygate/util/hash.hpp>

#include <folly/concurrency/ConcurrentHashMap.h>

#include <atomic>
#include <memory>
#include <optional>
#include <string_view>

namespace querygate::admission {

struct CacheEntry {
    complexity::ComplexityAnalysis analysis_;
    timestamp created_at_ = 0;
};

struct CacheStats {
    size_t size_ = 0;
    size_t expired_ = 0;
    size_t valid_ = 0;
    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    size_t capacity_ = 0;
    timestamp oldest_entry_age_ = 0;
    timestamp ttl_ = 0;

    [[nodiscard]] Value to_dynamic() const;
};

/// Identity of an analysis: adapter, compiled query signature (text and bound values) and result window
HashedValue cache_key(adapter::AdapterId adapter, std::string_view signature, const adapter::QueryOptions& opts);

/**
 * Shared cache of complexity analyses with a fixed TTL and a bounded number of entries. Concurrent readers never
 * block each other. Expired entries are evicted lazily by the read that observes them, with erase_if_equal so that a
 * concurrent fresh insert survives. A put that finds the cache full first drops every expired entry, then the oldest
 * ones until there is room.
 */
class ComplexityCache {
public:
    static constexpr size_t DEFAULT_MAX_ENTRIES = 10000;

    explicit ComplexityCache(
        timestamp ttl,
        util::NowFunction now = &util::SysClock::coarse_nanos_since_epoch,
        size_t max_entries = DEFAULT_MAX_ENTRIES);

    std::optional<complexity::ComplexityAnalysis> get(HashedValue key);

    /// Failed-open analyses are not stored
    void put(HashedValue key, complexity::ComplexityAnalysis analysis);

    void clear();

    [[nodiscard]] CacheStats stats() const;

    [[nodiscard]] size_t size() const { return entries_.size(); }

    [[nodiscard]] timestamp ttl() const { return ttl_; }

    [[nodiscard]] size_t max_entries() const { return max_entries_; }

private:
    [[nodiscard]] bool expired(const CacheEntry& entry, timestamp now) const { return now - entry.created_at_ > ttl_; }

    void make_room(timestamp now);

    const timestamp ttl_;
    const util::NowFunction now_;
    const size_t max_entries_;
    folly::ConcurrentHashMap<HashedValue, std::shared_ptr<const CacheEntry>> entries_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace querygate::admission
