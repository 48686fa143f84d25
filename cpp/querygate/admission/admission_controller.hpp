/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter.hpp>
#include <querygate/admission/admission_decision.hpp>
#include <querygate/admission/admission_settings.hpp>
#include <querygate/admission/complexity_cache.hpp>
#include <querygate/admission/load_monitor.hpp>
#include <querygate/admission/telemetry.hpp>
#include <querygate/complexity/complexity_analyzer.hpp>

#include <memory>
#include <optional>

namespace querygate::admission {

struct AdmissionOptions {
    /// Replaces the base limit for this query only
    std::optional<double> override_limit_;
    /// Overrides AdmissionSettings::cache_enabled_ for this call
    std::optional<bool> cache_enabled_;
    adapter::QueryOptions query_;
};

/**
 * Decides whether a compiled query may run. The analysis is looked up in the cache by adapter, query signature and
 * result window, computed on a miss, and compared against a limit that shrinks as the backend load grows.
 *
 * Every call emits exactly one telemetry event. An analysis that failed open is always accepted. A rejection always
 * carries at least one suggestion.
 *
 * The load monitor may be null, in which case the load factor is taken as zero.
 */
class AdmissionController {
public:
    AdmissionController(
        AdmissionSettings settings,
        std::shared_ptr<complexity::ComplexityAnalyzer> analyzer,
        std::shared_ptr<ComplexityCache> cache,
        std::shared_ptr<const LoadMonitor> load_monitor,
        std::shared_ptr<TelemetrySink> sink);

    Decision decide(
        const adapter::CompiledQuery& query,
        const adapter::Adapter& adapter,
        double base_limit,
        const AdmissionOptions& opts = {}) const;

    /// Uses the configured base limit
    Decision decide(const adapter::CompiledQuery& query, const adapter::Adapter& adapter, const AdmissionOptions& opts = {}) const;

    [[nodiscard]] double effective_limit(double base_limit) const;

    void clear_cache();

    [[nodiscard]] CacheStats cache_stats() const;

    [[nodiscard]] const AdmissionSettings& settings() const { return settings_; }

private:
    complexity::ComplexityAnalysis analysis_for(
        const adapter::CompiledQuery& query,
        const adapter::Adapter& adapter,
        const AdmissionOptions& opts) const;

    [[nodiscard]] LoadSnapshot load() const;

    AdmissionSettings settings_;
    std::shared_ptr<complexity::ComplexityAnalyzer> analyzer_;
    std::shared_ptr<ComplexityCache> cache_;
    std::shared_ptr<const LoadMonitor> load_monitor_;
    std::shared_ptr<TelemetrySink> sink_;
};

} // namespace querygate::admission
