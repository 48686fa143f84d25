/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <querygate/admission/complexity_cache.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace querygate;
using namespace querygate::admission;
using namespace querygate::complexity;

namespace {

constexpr timestamp TTL = 60 * 1000 * ONE_MILLISECOND;

ComplexityAnalysis explained(double score) {
    ComplexityAnalysis analysis;
    analysis.method_ = AnalysisMethod::EXPLAIN;
    analysis.cost_ = score * 10;
    analysis.normalized_score_ = score;
    return analysis;
}

adapter::QueryOptions window(uint64_t limit, uint64_t offset = 0) {
    adapter::QueryOptions opts;
    opts.source_ = "users";
    opts.limit_ = limit;
    opts.offset_ = offset;
    return opts;
}

class ComplexityCacheTest : public testing::Test {
protected:
    void SetUp() override { util::ManualClock::time_ = 1'000 * ONE_MILLISECOND; }

    static void advance(timestamp by) { util::ManualClock::time_ += by; }

    ComplexityCache cache_{TTL, &util::ManualClock::coarse_nanos_since_epoch};
};

} // namespace

TEST(CacheKey, DistinguishesEveryComponent) {
    const auto base = cache_key(adapter::AdapterId::POSTGRES, R"("age" >= $1|[18])", window(10));
    EXPECT_EQ(base, cache_key(adapter::AdapterId::POSTGRES, R"("age" >= $1|[18])", window(10)));

    EXPECT_NE(base, cache_key(adapter::AdapterId::MYSQL, R"("age" >= $1|[18])", window(10)));
    EXPECT_NE(base, cache_key(adapter::AdapterId::POSTGRES, R"("age" >= $1|[21])", window(10)));
    EXPECT_NE(base, cache_key(adapter::AdapterId::POSTGRES, R"("age" >= $1|[18])", window(20)));
    EXPECT_NE(base, cache_key(adapter::AdapterId::POSTGRES, R"("age" >= $1|[18])", window(10, 5)));

    auto other_source = window(10);
    other_source.source_ = "orders";
    EXPECT_NE(base, cache_key(adapter::AdapterId::POSTGRES, R"("age" >= $1|[18])", other_source));

    adapter::QueryOptions unbounded;
    unbounded.source_ = "users";
    EXPECT_NE(cache_key(adapter::AdapterId::POSTGRES, "q", unbounded), cache_key(adapter::AdapterId::POSTGRES, "q", window(0)));
}

TEST_F(ComplexityCacheTest, HitWithinTtl) {
    EXPECT_FALSE(cache_.get(7).has_value());
    cache_.put(7, explained(42.0));

    advance(TTL);
    auto hit = cache_.get(7);
    ASSERT_TRUE(hit.has_value());
    EXPECT_DOUBLE_EQ(hit->normalized_score_, 42.0);
    EXPECT_EQ(hit->method_, AnalysisMethod::EXPLAIN);

    const auto stats = cache_.stats();
    EXPECT_EQ(stats.hits_, 1u);
    EXPECT_EQ(stats.misses_, 1u);
    EXPECT_EQ(stats.size_, 1u);
    EXPECT_EQ(stats.valid_, 1u);
}

TEST_F(ComplexityCacheTest, ExpiredEntryIsEvictedOnRead) {
    cache_.put(7, explained(42.0));
    advance(TTL + 1);

    auto stats = cache_.stats();
    EXPECT_EQ(stats.size_, 1u);
    EXPECT_EQ(stats.expired_, 1u);
    EXPECT_EQ(stats.valid_, 0u);

    EXPECT_FALSE(cache_.get(7).has_value());
    EXPECT_EQ(cache_.size(), 0u);
    EXPECT_EQ(cache_.stats().misses_, 1u);
}

TEST_F(ComplexityCacheTest, PutReplacesAndRestartsTtl) {
    cache_.put(7, explained(42.0));
    advance(TTL / 2);
    cache_.put(7, explained(55.0));
    advance(TTL / 2 + TTL / 4);

    auto hit = cache_.get(7);
    ASSERT_TRUE(hit.has_value());
    EXPECT_DOUBLE_EQ(hit->normalized_score_, 55.0);
}

TEST_F(ComplexityCacheTest, FailedOpenAnalysesAreNotStored) {
    auto analysis = explained(10.0);
    analysis.method_ = AnalysisMethod::HEURISTIC_FALLBACK;
    analysis.failed_open_ = true;
    cache_.put(7, analysis);

    EXPECT_EQ(cache_.size(), 0u);
    EXPECT_FALSE(cache_.get(7).has_value());
}

TEST_F(ComplexityCacheTest, ClearResetsEntriesAndCounters) {
    cache_.put(1, explained(1.0));
    cache_.put(2, explained(2.0));
    static_cast<void>(cache_.get(1));
    static_cast<void>(cache_.get(3));

    cache_.clear();
    const auto stats = cache_.stats();
    EXPECT_EQ(stats.size_, 0u);
    EXPECT_EQ(stats.hits_, 0u);
    EXPECT_EQ(stats.misses_, 0u);
}

TEST_F(ComplexityCacheTest, StatsDocument) {
    cache_.put(1, explained(1.0));
    advance(3'000 * ONE_MILLISECOND);
    cache_.put(2, explained(2.0));
    static_cast<void>(cache_.get(1));

    const auto doc = cache_.stats().to_dynamic();
    EXPECT_EQ(doc["size"].asInt(), 2);
    EXPECT_EQ(doc["valid_count"].asInt(), 2);
    EXPECT_EQ(doc["expired_count"].asInt(), 0);
    EXPECT_EQ(doc["hits"].asInt(), 1);
    EXPECT_EQ(doc["misses"].asInt(), 0);
    EXPECT_EQ(doc["evictions"].asInt(), 0);
    EXPECT_EQ(doc["max_entries"].asInt(), 10000);
    EXPECT_EQ(doc["oldest_entry_age_seconds"].asInt(), 3);
    EXPECT_EQ(doc["cache_ttl_seconds"].asInt(), 60);
}

TEST_F(ComplexityCacheTest, FullCacheEvictsTheOldestEntry) {
    ComplexityCache bounded{TTL, &util::ManualClock::coarse_nanos_since_epoch, 3};
    for (HashedValue key = 1; key <= 10; ++key) {
        bounded.put(key, explained(static_cast<double>(key)));
        advance(ONE_MILLISECOND);
        ASSERT_LE(bounded.size(), 3u);
    }

    EXPECT_EQ(bounded.size(), 3u);
    for (HashedValue key = 8; key <= 10; ++key)
        EXPECT_TRUE(bounded.get(key).has_value()) << key;
    EXPECT_FALSE(bounded.get(1).has_value());

    const auto stats = bounded.stats();
    EXPECT_EQ(stats.evictions_, 7u);
    EXPECT_EQ(stats.capacity_, 3u);
}

TEST_F(ComplexityCacheTest, FullCacheDropsExpiredEntriesFirst) {
    ComplexityCache bounded{TTL, &util::ManualClock::coarse_nanos_since_epoch, 3};
    bounded.put(1, explained(1.0));
    advance(TTL / 2);
    bounded.put(2, explained(2.0));
    bounded.put(3, explained(3.0));
    advance(TTL / 2 + 1);

    bounded.put(4, explained(4.0));
    EXPECT_EQ(bounded.size(), 3u);
    EXPECT_EQ(bounded.stats().evictions_, 1u);
    for (HashedValue key = 2; key <= 4; ++key)
        EXPECT_TRUE(bounded.get(key).has_value()) << key;

    // Replacing a cached key needs no room
    bounded.put(2, explained(20.0));
    EXPECT_EQ(bounded.stats().evictions_, 1u);
    EXPECT_DOUBLE_EQ(bounded.get(2)->normalized_score_, 20.0);
}

TEST_F(ComplexityCacheTest, ConcurrentReadersAndWritersSeeWholeEntries) {
    constexpr size_t num_threads = 8;
    constexpr size_t iterations = 2000;
    constexpr HashedValue num_keys = 16;
    ComplexityCache cache{TTL, &util::ManualClock::coarse_nanos_since_epoch, 8};
    std::atomic<size_t> reads{0};
    std::atomic<size_t> mismatched{0};

    std::vector<std::thread> workers;
    workers.reserve(num_threads);
    for (size_t t = 0; t < num_threads; ++t) {
        workers.emplace_back([&cache, &reads, &mismatched, t] {
            for (size_t i = 0; i < iterations; ++i) {
                const HashedValue key = (t + i) % num_keys;
                const auto hit = cache.get(key);
                ++reads;
                if (!hit) {
                    cache.put(key, explained(static_cast<double>(key)));
                } else if (hit->method_ != AnalysisMethod::EXPLAIN
                           || hit->normalized_score_ != static_cast<double>(key)
                           || hit->cost_ != static_cast<double>(key) * 10) {
                    ++mismatched;
                }
                if (t == 0 && i % 100 == 0)
                    advance(TTL / 4);
            }
        });
    }
    for (auto& worker : workers)
        worker.join();

    EXPECT_EQ(mismatched.load(), 0u);
    const auto stats = cache.stats();
    EXPECT_EQ(stats.hits_ + stats.misses_, reads.load());
    EXPECT_EQ(reads.load(), num_threads * iterations);
    EXPECT_LE(cache.size(), num_keys);
}

TEST_F(ComplexityCacheTest, ExpiryEvictionSparesAFreshConcurrentInsert) {
    constexpr HashedValue key = 99;
    for (int round = 0; round < 200; ++round) {
        cache_.put(key, explained(1.0));
        advance(TTL + 1);

        std::thread reader([this] { static_cast<void>(cache_.get(key)); });
        cache_.put(key, explained(2.0));
        reader.join();

        const auto hit = cache_.get(key);
        ASSERT_TRUE(hit.has_value()) << "round " << round;
        EXPECT_DOUBLE_EQ(hit->normalized_score_, 2.0);
    }
}

TEST(ComplexityCache, RejectsNonPositiveTtl) {
    EXPECT_THROW(ComplexityCache(0), InternalException);
}

TEST(ComplexityCache, RejectsZeroCapacity) {
    EXPECT_THROW(ComplexityCache(TTL, &util::SysClock::coarse_nanos_since_epoch, 0), InternalException);
}
