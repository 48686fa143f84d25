/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/complexity/complexity_analyzer.hpp>
#include <querygate/engine_config.pb.h>
#include <querygate/util/clock.hpp>

#include <chrono>

namespace querygate::proto {
    namespace config = querygate::pb::config;
}

namespace querygate::admission {

struct AdmissionSettings {
    double base_limit_ = 80.0;
    bool adaptive_limits_ = true;
    /// Fraction of the effective limit above which admitted queries are reported
    double warn_threshold_ = 0.7;
    bool cache_enabled_ = true;
    timestamp cache_ttl_ = 5 * 60 * 1000 * ONE_MILLISECOND;
    size_t cache_max_entries_ = 10000;
    /// Share of the limit removed at full load
    double max_reduction_fraction_ = 0.7;
    double limit_floor_ = 0.0;
    std::chrono::milliseconds load_sample_interval_{5000};
    complexity::AnalyzerSettings analyzer_;

    /**
     * Unset (zero) proto fields keep their defaults. Runtime overrides in ConfigsMap take precedence over both:
     * Admission.BaseLimit, Admission.AdaptiveLimits, Admission.WarnThreshold, Admission.CacheEnabled,
     * Admission.CacheTtlMs, Admission.CacheMaxEntries, Admission.MaxReductionFraction, Admission.LimitFloor, Admission.LoadSampleIntervalMs,
     * Analyzer.ExplainTimeoutMs and Analyzer.Threads.
     */
    static AdmissionSettings from_proto(const proto::config::AdmissionConfig& config);
};

/// base_limit reduced in proportion to load, never below the floor and never above base_limit. A non-finite load
/// factor counts as idle.
double effective_limit(const AdmissionSettings& settings, double base_limit, double load_factor);

} // namespace querygate::admission
