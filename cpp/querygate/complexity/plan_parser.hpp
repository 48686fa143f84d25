/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter_id.hpp>
#include <querygate/adapter/query_options.hpp>
#include <querygate/complexity/complexity_analysis.hpp>

#include <string>
#include <vector>

namespace querygate::complexity {

/// Backend independent digest of a planner's estimate
struct PlanSummary {
    double total_cost_ = 0.0;
    double plan_rows_ = 0.0;
    size_t node_count_ = 0;
    size_t seq_scans_ = 0;
    /// Relations read by full scans, unique, in plan order
    std::vector<std::string> seq_scan_relations_;
    std::vector<std::string> indexes_used_;
    size_t join_nodes_ = 0;
    bool using_filesort_ = false;
    bool using_temporary_ = false;
};

/// Parses EXPLAIN (FORMAT JSON) output. Raises E_UNPARSEABLE_PLAN.
PlanSummary parse_postgres_plan(const Value& plan);

/// Parses EXPLAIN FORMAT=JSON output. Raises E_UNPARSEABLE_PLAN.
PlanSummary parse_mysql_plan(const Value& plan);

PlanSummary parse_plan(adapter::AdapterId id, const Value& plan);

/**
 * Scores a planner estimate and derives suggestions from its signals. MySQL cost units are an order of magnitude
 * smaller than PostgreSQL's and are scaled up before normalization.
 */
ComplexityAnalysis analyze_plan(const PlanSummary& summary, adapter::AdapterId id, const adapter::QueryOptions& opts);

} // namespace querygate::complexity
