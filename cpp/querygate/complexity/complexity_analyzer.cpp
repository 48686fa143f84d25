/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/complexity/complexity_analyzer.hpp>
#include <querygate/complexity/plan_parser.hpp>
#include <querygate/adapter/sql/sql_adapter.hpp>
#include <querygate/log/log.hpp>

#include <folly/OperationCancelled.h>
#include <folly/executors/thread_factory/NamedThreadFactory.h>
#include <folly/futures/Future.h>

#include <algorithm>

namespace querygate::complexity {

namespace {

void throw_if_cancelled(const adapter::QueryOptions& opts) {
    if (opts.cancellation_token_.isCancellationRequested())
        throw folly::OperationCancelled{};
}

} // namespace

ComplexityAnalyzer::ComplexityAnalyzer(AnalyzerSettings settings) :
    settings_(std::move(settings)),
    executor_(std::make_unique<folly::CPUThreadPoolExecutor>(
        std::max<size_t>(settings_.threads_, 1),
        std::make_shared<folly::NamedThreadFactory>("ExplainPool"))) {
}

ComplexityAnalyzer::~ComplexityAnalyzer() {
    executor_->join();
}

ComplexityAnalysis ComplexityAnalyzer::introspect(
        const adapter::CompiledQuery& query,
        const adapter::Adapter& adapter,
        const adapter::QueryOptions& opts) const {
    auto connector = adapter.connector();
    analysis::check<ErrorCode::E_CONNECTOR_UNAVAILABLE>(static_cast<bool>(connector),
        "The {} adapter has no connection to explain against", adapter.name());

    const auto* sql_adapter = dynamic_cast<const adapter::sql::SqlAdapter*>(&adapter);
    analysis::check<ErrorCode::E_EXPLAIN_FAILED>(sql_adapter != nullptr,
        "The {} adapter cannot build plan-only statements", adapter.name());

    auto statement = sql_adapter->explain_statement(query.as<adapter::sql::SqlFragment>(), opts);
    QUERYGATE_DEBUG(log::analyzer(), "Explaining {}", statement.sql_);
    auto plan = folly::via(executor_.get(), [connector, statement = std::move(statement)] {
        return connector->explain(statement.sql_, statement.params_);
    }).get(settings_.explain_timeout_);

    return analyze_plan(parse_plan(adapter.id(), plan), adapter.id(), opts);
}

ComplexityAnalysis ComplexityAnalyzer::fall_back(
        const adapter::CompiledQuery& query,
        const adapter::QueryOptions& opts,
        std::string_view reason) const {
    try {
        auto result = score_heuristic(query.shape_, opts, settings_.weights_);
        result.method_ = AnalysisMethod::HEURISTIC_FALLBACK;
        result.failed_open_ = true;
        result.raw_details_["fallback_reason"] = std::string{reason};
        return result;
    } catch (const std::exception& e) {
        log::analyzer().error("Heuristic scoring failed after '{}': {}", reason, e.what());
        ComplexityAnalysis unknown;
        unknown.method_ = AnalysisMethod::UNKNOWN;
        unknown.failed_open_ = true;
        unknown.raw_details_["fallback_reason"] = fmt::format("{}; {}", reason, e.what());
        return unknown;
    }
}

ComplexityAnalysis ComplexityAnalyzer::analyze(
        const adapter::CompiledQuery& query,
        const adapter::Adapter& adapter,
        const adapter::QueryOptions& opts) const {
    throw_if_cancelled(opts);

    ComplexityAnalysis result;
    if (adapter.capabilities().has(adapter::Feature::EXPLAIN)) {
        try {
            result = introspect(query, adapter, opts);
        } catch (const folly::FutureTimeout&) {
            log::analyzer().warn("Explain on the {} adapter timed out after {}ms, falling back to heuristic scoring",
                                 adapter.name(), settings_.explain_timeout_.count());
            result = fall_back(query, opts, "explain timed out");
        } catch (const std::exception& e) {
            log::analyzer().warn("Explain on the {} adapter failed, falling back to heuristic scoring: {}", adapter.name(), e.what());
            result = fall_back(query, opts, e.what());
        }
    } else {
        try {
            result = score_heuristic(query.shape_, opts, settings_.weights_);
        } catch (const std::exception& e) {
            log::analyzer().error("Heuristic scoring on the {} adapter failed: {}", adapter.name(), e.what());
            result = ComplexityAnalysis{};
            result.failed_open_ = true;
        }
    }

    throw_if_cancelled(opts);
    QUERYGATE_DEBUG(log::analyzer(), "{}", format_analysis(result));
    return result;
}

} // namespace querygate::complexity
