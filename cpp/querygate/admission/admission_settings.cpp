/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/admission/admission_settings.hpp>
#include <querygate/util/configs_map.hpp>
#include <querygate/util/pb_util.hpp>
#include <querygate/util/preconditions.hpp>

#include <algorithm>
#include <cmath>

namespace querygate::admission {

AdmissionSettings AdmissionSettings::from_proto(const proto::config::AdmissionConfig& config) {
    AdmissionSettings settings;
    const auto& configs = *ConfigsMap::instance();

    settings.base_limit_ = static_cast<double>(configs.get_int("Admission.BaseLimit",
        util::as_opt(config.base_limit()).value_or(static_cast<uint32_t>(settings.base_limit_))));
    settings.adaptive_limits_ = configs.get_int("Admission.AdaptiveLimits", config.disable_adaptive_limits() ? 0 : 1) != 0;
    settings.warn_threshold_ = configs.get_double("Admission.WarnThreshold",
        util::as_opt(config.warn_threshold()).value_or(settings.warn_threshold_));
    settings.cache_enabled_ = configs.get_int("Admission.CacheEnabled", config.disable_cache() ? 0 : 1) != 0;

    const auto default_ttl_ms = settings.cache_ttl_ / ONE_MILLISECOND;
    settings.cache_ttl_ = configs.get_int("Admission.CacheTtlMs",
        static_cast<int64_t>(util::as_opt(config.cache_ttl_ms()).value_or(default_ttl_ms))) * ONE_MILLISECOND;

    const auto cache_max_entries = configs.get_int("Admission.CacheMaxEntries",
        static_cast<int64_t>(util::as_opt(config.cache_max_entries()).value_or(settings.cache_max_entries_)));
    user_input::check<ErrorCode::E_INVALID_CONFIG>(cache_max_entries > 0, "Cache must hold at least one entry, got {}", cache_max_entries);
    settings.cache_max_entries_ = static_cast<size_t>(cache_max_entries);

    settings.max_reduction_fraction_ = configs.get_double("Admission.MaxReductionFraction",
        util::as_opt(config.max_reduction_fraction()).value_or(settings.max_reduction_fraction_));
    settings.limit_floor_ = configs.get_double("Admission.LimitFloor", config.limit_floor());
    settings.load_sample_interval_ = std::chrono::milliseconds{configs.get_int("Admission.LoadSampleIntervalMs",
        static_cast<int64_t>(util::as_opt(config.load_sample_interval_ms()).value_or(settings.load_sample_interval_.count())))};

    settings.analyzer_.explain_timeout_ = std::chrono::milliseconds{configs.get_int("Analyzer.ExplainTimeoutMs",
        static_cast<int64_t>(util::as_opt(config.explain_timeout_ms()).value_or(settings.analyzer_.explain_timeout_.count())))};
    settings.analyzer_.threads_ = static_cast<size_t>(configs.get_int("Analyzer.Threads",
        util::as_opt(config.analyzer_threads()).value_or(static_cast<uint32_t>(settings.analyzer_.threads_))));

    user_input::check<ErrorCode::E_INVALID_CONFIG>(settings.base_limit_ > 0, "Base limit must be positive, got {}", settings.base_limit_);
    user_input::check<ErrorCode::E_INVALID_CONFIG>(settings.warn_threshold_ > 0 && settings.warn_threshold_ <= 1.0,
        "Warn threshold must be a fraction in (0, 1], got {}", settings.warn_threshold_);
    user_input::check<ErrorCode::E_INVALID_CONFIG>(settings.max_reduction_fraction_ >= 0 && settings.max_reduction_fraction_ <= 1.0,
        "Max reduction fraction must be in [0, 1], got {}", settings.max_reduction_fraction_);
    user_input::check<ErrorCode::E_INVALID_CONFIG>(settings.limit_floor_ >= 0, "Limit floor must not be negative, got {}", settings.limit_floor_);
    user_input::check<ErrorCode::E_INVALID_CONFIG>(settings.cache_ttl_ > 0, "Cache TTL must be positive, got {}ns", settings.cache_ttl_);
    user_input::check<ErrorCode::E_INVALID_CONFIG>(settings.load_sample_interval_.count() > 0,
        "Load sample interval must be positive, got {}ms", settings.load_sample_interval_.count());
    user_input::check<ErrorCode::E_INVALID_CONFIG>(settings.analyzer_.explain_timeout_.count() > 0,
        "Explain timeout must be positive, got {}ms", settings.analyzer_.explain_timeout_.count());
    return settings;
}

double effective_limit(const AdmissionSettings& settings, double base_limit, double load_factor) {
    if (!settings.adaptive_limits_)
        return base_limit;

    const auto load = std::isfinite(load_factor) ? std::clamp(load_factor, 0.0, 1.0) : 0.0;
    const auto reduced = base_limit * (1.0 - load * settings.max_reduction_fraction_);
    return std::clamp(reduced, std::min(settings.limit_floor_, base_limit), base_limit);
}

} // namespace querygate::admission
