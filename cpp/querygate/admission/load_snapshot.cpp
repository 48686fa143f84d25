/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/admission/load_snapshot.hpp>
#include <querygate/util/preconditions.hpp>

#include <algorithm>
#include <cmath>

namespace querygate::admission {

Value LoadSnapshot::to_dynamic() const {
    return Value::object
        ("active_connections", static_cast<int64_t>(active_connections_))
        ("cache_hit_ratio", cache_hit_ratio_)
        ("load_factor", load_factor_)
        ("sampled_at", sampled_at_);
}

double compute_load_factor(const adapter::LoadMetrics& metrics) {
    const auto connection_load = metrics.max_connections_ == 0
        ? 1.0
        : std::min(static_cast<double>(metrics.active_connections_) / static_cast<double>(metrics.max_connections_), 1.0);
    // A backend with no buffer reads reports no ratio, which counts as fully cached
    const auto hit_ratio = std::isfinite(metrics.cache_hit_ratio_) ? metrics.cache_hit_ratio_ : 1.0;
    const auto cache_load = 1.0 - std::clamp(hit_ratio, 0.0, 1.0);
    return (connection_load + cache_load) / 2.0;
}

ConnectorLoadMetricsSource::ConnectorLoadMetricsSource(std::shared_ptr<adapter::BackendConnector> connector, util::NowFunction now) :
    connector_(std::move(connector)),
    now_(now) {
    util::check_arg(static_cast<bool>(connector_), "A connector is required to sample load");
}

LoadSnapshot ConnectorLoadMetricsSource::sample() {
    const auto metrics = connector_->load_metrics();
    return LoadSnapshot{
        metrics.active_connections_,
        metrics.cache_hit_ratio_,
        compute_load_factor(metrics),
        now_()};
}

LoadSnapshot StaticLoadMetricsSource::sample() {
    LoadSnapshot snapshot;
    const auto load = load_factor_.load();
    snapshot.load_factor_ = std::isfinite(load) ? std::clamp(load, 0.0, 1.0) : 0.0;
    snapshot.sampled_at_ = util::SysClock::coarse_nanos_since_epoch();
    return snapshot;
}

} // namespace querygate::admission
