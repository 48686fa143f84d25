/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/admission/complexity_cache.hpp>
#include <querygate/log/log.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace querygate::admission {

Value CacheStats::to_dynamic() const {
    return Value::object
        ("size", static_cast<int64_t>(size_))
        ("expired_count", static_cast<int64_t>(expired_))
        ("valid_count", static_cast<int64_t>(valid_))
        ("hits", static_cast<int64_t>(hits_))
        ("misses", static_cast<int64_t>(misses_))
        ("evictions", static_cast<int64_t>(evictions_))
        ("max_entries", static_cast<int64_t>(capacity_))
        ("oldest_entry_age_seconds", oldest_entry_age_ / (1000 * ONE_MILLISECOND))
        ("cache_ttl_seconds", ttl_ / (1000 * ONE_MILLISECOND));
}

HashedValue cache_key(adapter::AdapterId adapter, std::string_view signature, const adapter::QueryOptions& opts) {
    HashAccum accum;
    const auto id = static_cast<uint8_t>(adapter);
    accum(&id);
    accum(signature);
    accum(std::string_view{opts.source_});
    const uint64_t limit = opts.limit_.value_or(0);
    const uint8_t has_limit = opts.limit_.has_value();
    accum(&has_limit);
    accum(&limit);
    accum(&opts.offset_);
    for (const auto& order : opts.order_by_) {
        accum(std::string_view{order.column_});
        const auto direction = static_cast<uint8_t>(order.direction_);
        accum(&direction);
    }
    return accum.digest();
}

ComplexityCache::ComplexityCache(timestamp ttl, util::NowFunction now, size_t max_entries) :
    ttl_(ttl),
    now_(now),
    max_entries_(max_entries) {
    util::check_arg(ttl_ > 0, "Cache TTL must be positive, got {}ns", ttl_);
    util::check_arg(max_entries_ > 0, "Cache must hold at least one entry");
}

std::optional<complexity::ComplexityAnalysis> ComplexityCache::get(HashedValue key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        ++misses_;
        return std::nullopt;
    }

    auto entry = it->second;
    if (expired(*entry, now_())) {
        entries_.erase_if_equal(key, entry);
        ++misses_;
        QUERYGATE_DEBUG(log::admission(), "Evicted expired analysis {}", key);
        return std::nullopt;
    }
    ++hits_;
    return entry->analysis_;
}

void ComplexityCache::put(HashedValue key, complexity::ComplexityAnalysis analysis) {
    if (analysis.failed_open_)
        return;

    const auto now = now_();
    if (entries_.size() >= max_entries_ && entries_.find(key) == entries_.end())
        make_room(now);

    entries_.insert_or_assign(key, std::make_shared<const CacheEntry>(CacheEntry{std::move(analysis), now}));
}

void ComplexityCache::make_room(timestamp now) {
    std::vector<std::pair<HashedValue, std::shared_ptr<const CacheEntry>>> live;
    live.reserve(entries_.size());
    size_t evicted = 0;
    for (const auto& [key, entry] : entries_) {
        if (expired(*entry, now)) {
            if (entries_.erase_if_equal(key, entry) > 0)
                ++evicted;
        } else {
            live.emplace_back(key, entry);
        }
    }

    if (live.size() >= max_entries_) {
        const auto excess = live.size() - max_entries_ + 1;
        std::nth_element(live.begin(), live.begin() + static_cast<std::ptrdiff_t>(excess - 1), live.end(),
            [](const auto& left, const auto& right) { return left.second->created_at_ < right.second->created_at_; });
        for (size_t i = 0; i < excess; ++i) {
            if (entries_.erase_if_equal(live[i].first, live[i].second) > 0)
                ++evicted;
        }
    }

    evictions_ += evicted;
    QUERYGATE_DEBUG(log::admission(), "Evicted {} analyses to keep the cache within {} entries", evicted, max_entries_);
}

void ComplexityCache::clear() {
    entries_.clear();
    hits_ = 0;
    misses_ = 0;
    evictions_ = 0;
    log::admission().debug("Complexity cache cleared");
}

CacheStats ComplexityCache::stats() const {
    CacheStats stats;
    stats.hits_ = hits_.load();
    stats.misses_ = misses_.load();
    stats.evictions_ = evictions_.load();
    stats.capacity_ = max_entries_;
    stats.ttl_ = ttl_;
    const auto now = now_();
    for (const auto& [key, entry] : entries_) {
        ++stats.size_;
        if (expired(*entry, now))
            ++stats.expired_;
        stats.oldest_entry_age_ = std::max(stats.oldest_entry_age_, now - entry->created_at_);
    }
    stats.valid_ = stats.size_ - stats.expired_;
    return stats;
}

} // namespace querygate::admission
