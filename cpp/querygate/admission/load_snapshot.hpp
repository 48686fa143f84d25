/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/backend_connector.hpp>
#include <querygate/util/clock.hpp>

#include <atomic>
#include <memory>

namespace querygate::admission {

struct LoadSnapshot {
    uint64_t active_connections_ = 0;
    double cache_hit_ratio_ = 1.0;
    /// 0..1
    double load_factor_ = 0.0;
    timestamp sampled_at_ = 0;

    [[nodiscard]] Value to_dynamic() const;
};

/// Mean of connection saturation and buffer cache miss ratio, each clamped to 0..1
double compute_load_factor(const adapter::LoadMetrics& metrics);

class LoadMetricsSource {
public:
    virtual ~LoadMetricsSource() = default;

    /// May block and may throw
    virtual LoadSnapshot sample() = 0;
};

class ConnectorLoadMetricsSource final : public LoadMetricsSource {
public:
    explicit ConnectorLoadMetricsSource(
        std::shared_ptr<adapter::BackendConnector> connector,
        util::NowFunction now = &util::SysClock::coarse_nanos_since_epoch);

    LoadSnapshot sample() override;

private:
    std::shared_ptr<adapter::BackendConnector> connector_;
    util::NowFunction now_;
};

/// Fixed load, settable from tests or by an external monitoring loop
class StaticLoadMetricsSource final : public LoadMetricsSource {
public:
    explicit StaticLoadMetricsSource(double load_factor = 0.0) :
        load_factor_(load_factor) {
    }

    void set_load_factor(double load_factor) { load_factor_ = load_factor; }

    LoadSnapshot sample() override;

private:
    std::atomic<double> load_factor_;
};

} // namespace querygate::admission
