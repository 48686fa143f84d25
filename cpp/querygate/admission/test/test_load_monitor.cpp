/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <querygate/adapter/mock/fake_connector.hpp>
#include <querygate/admission/load_monitor.hpp>

#include <limits>
#include <thread>

using namespace querygate;
using namespace querygate::admission;

TEST(LoadFactor, MeanOfSaturationAndCacheMisses) {
    EXPECT_DOUBLE_EQ(compute_load_factor({0, 100, 1.0}), 0.0);
    EXPECT_DOUBLE_EQ(compute_load_factor({50, 100, 1.0}), 0.25);
    EXPECT_DOUBLE_EQ(compute_load_factor({50, 100, 0.5}), 0.5);
    EXPECT_DOUBLE_EQ(compute_load_factor({100, 100, 0.0}), 1.0);
}

TEST(LoadFactor, InputsAreClamped) {
    EXPECT_DOUBLE_EQ(compute_load_factor({500, 100, 1.0}), 0.5);
    EXPECT_DOUBLE_EQ(compute_load_factor({0, 100, 1.7}), 0.0);
    EXPECT_DOUBLE_EQ(compute_load_factor({0, 100, -0.5}), 0.5);
    // No connection headroom is reported as saturated
    EXPECT_DOUBLE_EQ(compute_load_factor({0, 0, 1.0}), 0.5);
}

TEST(LoadFactor, UnreportedHitRatioCountsAsFullyCached) {
    constexpr auto nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_DOUBLE_EQ(compute_load_factor({95, 100, nan}), 0.475);
    EXPECT_DOUBLE_EQ(compute_load_factor({95, 100, std::numeric_limits<double>::infinity()}), 0.475);
    EXPECT_DOUBLE_EQ(compute_load_factor({0, 0, nan}), 0.5);
}

TEST(LoadMonitor, PublishesInitialSnapshotUntilSampled) {
    auto source = std::make_shared<StaticLoadMetricsSource>(0.9);
    LoadSnapshot initial;
    initial.load_factor_ = 0.5;
    LoadMonitor monitor{source, std::chrono::milliseconds{1000}, initial};

    EXPECT_DOUBLE_EQ(monitor.load_factor(), 0.5);
    ASSERT_TRUE(monitor.refresh());
    EXPECT_DOUBLE_EQ(monitor.load_factor(), 0.9);
}

TEST(LoadMonitor, StaticSourceIsClamped) {
    auto source = std::make_shared<StaticLoadMetricsSource>(3.0);
    LoadMonitor monitor{source, std::chrono::milliseconds{1000}};
    ASSERT_TRUE(monitor.refresh());
    EXPECT_DOUBLE_EQ(monitor.load_factor(), 1.0);
}

TEST(LoadMonitor, NonFiniteStaticLoadIsIdle) {
    auto source = std::make_shared<StaticLoadMetricsSource>(std::numeric_limits<double>::quiet_NaN());
    LoadMonitor monitor{source, std::chrono::milliseconds{1000}};
    ASSERT_TRUE(monitor.refresh());
    EXPECT_DOUBLE_EQ(monitor.load_factor(), 0.0);
}

TEST(LoadMonitor, SamplesTheConnector) {
    util::ManualClock::time_ = 42;
    auto connector = std::make_shared<adapter::FakeConnector>("postgres", "14.5");
    connector->set_load_metrics({80, 100, 0.6});
    auto source = std::make_shared<ConnectorLoadMetricsSource>(connector, &util::ManualClock::coarse_nanos_since_epoch);
    LoadMonitor monitor{source, std::chrono::milliseconds{1000}};

    ASSERT_TRUE(monitor.refresh());
    const auto snapshot = monitor.current();
    EXPECT_EQ(snapshot->active_connections_, 80u);
    EXPECT_DOUBLE_EQ(snapshot->cache_hit_ratio_, 0.6);
    EXPECT_DOUBLE_EQ(snapshot->load_factor_, 0.6);
    EXPECT_EQ(snapshot->sampled_at_, 42);
    EXPECT_EQ(connector->calls(adapter::ConnectorOperation::LOAD_METRICS), 1u);
}

TEST(LoadMonitor, FailedSampleKeepsPreviousSnapshot) {
    auto connector = std::make_shared<adapter::FakeConnector>("postgres", "14.5");
    connector->set_load_metrics({100, 100, 0.0});
    LoadMonitor monitor{std::make_shared<ConnectorLoadMetricsSource>(connector), std::chrono::milliseconds{1000}};
    ASSERT_TRUE(monitor.refresh());

    connector->fail(adapter::ConnectorOperation::LOAD_METRICS);
    EXPECT_FALSE(monitor.refresh());
    EXPECT_DOUBLE_EQ(monitor.load_factor(), 1.0);
}

TEST(LoadMonitor, BackgroundSampling) {
    auto connector = std::make_shared<adapter::FakeConnector>("postgres", "14.5");
    connector->set_load_metrics({100, 100, 1.0});
    LoadMonitor monitor{std::make_shared<ConnectorLoadMetricsSource>(connector), std::chrono::milliseconds{10}};

    monitor.start();
    monitor.start();
    for (int i = 0; i < 200 && connector->calls(adapter::ConnectorOperation::LOAD_METRICS) < 2; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    monitor.stop();

    EXPECT_GE(connector->calls(adapter::ConnectorOperation::LOAD_METRICS), 2u);
    EXPECT_DOUBLE_EQ(monitor.load_factor(), 0.5);

    const auto sampled = connector->calls(adapter::ConnectorOperation::LOAD_METRICS);
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    EXPECT_EQ(connector->calls(adapter::ConnectorOperation::LOAD_METRICS), sampled);
}

TEST(LoadMonitor, RejectsBadArguments) {
    EXPECT_THROW(LoadMonitor(nullptr, std::chrono::milliseconds{10}), InternalException);
    EXPECT_THROW(LoadMonitor(std::make_shared<StaticLoadMetricsSource>(), std::chrono::milliseconds{0}), InternalException);
    EXPECT_THROW(ConnectorLoadMetricsSource(nullptr), InternalException);
}
