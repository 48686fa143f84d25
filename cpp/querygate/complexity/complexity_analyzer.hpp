/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter.hpp>
#include <querygate/complexity/complexity_analysis.hpp>
#include <querygate/complexity/heuristic_scorer.hpp>
#include <querygate/util/constructors.hpp>

#include <folly/executors/CPUThreadPoolExecutor.h>

#include <chrono>
#include <memory>

namespace querygate::complexity {

struct AnalyzerSettings {
    size_t threads_ = 2;
    std::chrono::milliseconds explain_timeout_{2000};
    HeuristicWeights weights_;
};

/**
 * Estimates how expensive a compiled query is. Adapters with the EXPLAIN feature are asked for a plan through their
 * connector on a dedicated thread pool, bounded by the explain timeout. Everything else is scored heuristically.
 *
 * Fails open: a planner error, timeout or unparseable plan yields a HEURISTIC_FALLBACK analysis, or UNKNOWN with a
 * zero score if the heuristic fails too, with failed_open_ set. Only cancellation propagates, as
 * folly::OperationCancelled.
 */
class ComplexityAnalyzer {
public:
    explicit ComplexityAnalyzer(AnalyzerSettings settings = {});
    ~ComplexityAnalyzer();

    QUERYGATE_NO_MOVE_OR_COPY(ComplexityAnalyzer)

    [[nodiscard]] ComplexityAnalysis analyze(
        const adapter::CompiledQuery& query,
        const adapter::Adapter& adapter,
        const adapter::QueryOptions& opts) const;

    [[nodiscard]] const AnalyzerSettings& settings() const { return settings_; }

private:
    ComplexityAnalysis introspect(const adapter::CompiledQuery& query, const adapter::Adapter& adapter, const adapter::QueryOptions& opts) const;
    ComplexityAnalysis fall_back(const adapter::CompiledQuery& query, const adapter::QueryOptions& opts, std::string_view reason) const;

    AnalyzerSettings settings_;
    std::unique_ptr<folly::CPUThreadPoolExecutor> executor_;
};

} // namespace querygate::complexity
