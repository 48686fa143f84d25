/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/admission/admission_controller.hpp>
#include <querygate/log/log.hpp>
#include <querygate/util/preconditions.hpp>

#include <fmt/format.h>

namespace querygate::admission {

namespace {

constexpr auto fallback_suggestion =
    "Query complexity exceeds the current limit. Narrow the filter, add a LIMIT clause or retry when the backend is less loaded";

} // namespace

AdmissionController::AdmissionController(
    AdmissionSettings settings,
    std::shared_ptr<complexity::ComplexityAnalyzer> analyzer,
    std::shared_ptr<ComplexityCache> cache,
    std::shared_ptr<const LoadMonitor> load_monitor,
    std::shared_ptr<TelemetrySink> sink) :
    settings_(std::move(settings)),
    analyzer_(std::move(analyzer)),
    cache_(std::move(cache)),
    load_monitor_(std::move(load_monitor)),
    sink_(std::move(sink)) {
    util::check_arg(static_cast<bool>(analyzer_), "Admission controller requires an analyzer");
    util::check_arg(static_cast<bool>(cache_), "Admission controller requires a cache");
    util::check_arg(static_cast<bool>(sink_), "Admission controller requires a telemetry sink");
}

LoadSnapshot AdmissionController::load() const {
    return load_monitor_ ? *load_monitor_->current() : LoadSnapshot{};
}

double AdmissionController::effective_limit(double base_limit) const {
    return admission::effective_limit(settings_, base_limit, load().load_factor_);
}

complexity::ComplexityAnalysis AdmissionController::analysis_for(
    const adapter::CompiledQuery& query,
    const adapter::Adapter& adapter,
    const AdmissionOptions& opts) const {
    const auto use_cache = opts.cache_enabled_.value_or(settings_.cache_enabled_);
    if (!use_cache)
        return analyzer_->analyze(query, adapter, opts.query_);

    const auto key = cache_key(adapter.id(), adapter.signature(query), opts.query_);
    if (auto cached = cache_->get(key); cached) {
        QUERYGATE_DEBUG(log::admission(), "Cache hit for key {}", key);
        return std::move(*cached);
    }

    auto analysis = analyzer_->analyze(query, adapter, opts.query_);
    cache_->put(key, analysis);
    return analysis;
}

Decision AdmissionController::decide(
    const adapter::CompiledQuery& query,
    const adapter::Adapter& adapter,
    const AdmissionOptions& opts) const {
    return decide(query, adapter, settings_.base_limit_, opts);
}

Decision AdmissionController::decide(
    const adapter::CompiledQuery& query,
    const adapter::Adapter& adapter,
    double base_limit,
    const AdmissionOptions& opts) const {
    const auto base = opts.override_limit_.value_or(base_limit);
    util::check_arg(base > 0, "Base limit must be positive, got {}", base);

    auto analysis = analysis_for(query, adapter, opts);
    const auto snapshot = load();
    const auto limit = admission::effective_limit(settings_, base, snapshot.load_factor_);
    const auto score = analysis.normalized_score_;

    Decision decision = [&]() -> Decision {
        if (analysis.failed_open_) {
            log::admission().info("Accepting query on {} after failed analysis (method {})", adapter.name(), analysis.method_);
            return Accept{std::move(analysis), limit};
        }

        if (score > limit) {
            if (analysis.suggestions_.empty())
                analysis.suggestions_.emplace_back(fallback_suggestion);

            log::admission().info("Rejecting query on {}: score {:.2f} exceeds limit {:.2f}", adapter.name(), score, limit);
            return Reject{std::move(analysis), limit};
        }

        if (score > settings_.warn_threshold_ * limit) {
            log::admission().debug("Admitting query on {} with warning: score {:.2f} near limit {:.2f}", adapter.name(), score, limit);
            return Warn{std::move(analysis), limit};
        }

        return Accept{std::move(analysis), limit};
    }();

    sink_->emit(TelemetryEvent{decision_kind(decision), adapter.id(), limit, decision_analysis(decision), snapshot});
    return decision;
}

void AdmissionController::clear_cache() {
    cache_->clear();
}

CacheStats AdmissionController::cache_stats() const {
    return cache_->stats();
}

} // namespace querygate::admission
