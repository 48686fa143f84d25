/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/complexity/heuristic_scorer.hpp>

#include <algorithm>

namespace querygate::complexity {

namespace {

constexpr size_t MANY_JOINS = 2;
constexpr size_t MANY_CONDITIONS = 5;

double where_score(const adapter::QueryShape& shape, const HeuristicWeights& weights) {
    return shape.conditions_ * weights.condition_
        + shape.or_branches_ * weights.or_branch_
        + shape.and_groups_ * weights.and_group_
        + shape.membership_lists_ * weights.membership_list_
        + shape.pattern_matches_ * weights.pattern_match_
        + shape.custom_fragments_ * weights.custom_fragment_;
}

double order_score(const adapter::QueryOptions& opts, const HeuristicWeights& weights) {
    if (opts.order_by_.empty())
        return 0.0;

    auto score = static_cast<double>(opts.order_by_.size()) * weights.order_field_;
    if (!opts.limit_)
        score += weights.unbounded_sort_;
    return score;
}

double pagination_score(const adapter::QueryOptions& opts, const HeuristicWeights& weights) {
    const bool large_offset = opts.offset_ > weights.large_offset_threshold_;
    if (large_offset && !opts.limit_)
        return weights.large_offset_unbounded_;
    if (large_offset)
        return weights.large_offset_;
    if (!opts.limit_)
        return weights.no_limit_;
    return 0.0;
}

} // namespace

ComplexityAnalysis score_heuristic(const adapter::QueryShape& shape, const adapter::QueryOptions& opts, const HeuristicWeights& weights) {
    const auto where = where_score(shape, weights);
    const auto joins = static_cast<double>(shape.associations_.size()) * weights.association_;
    const auto order = order_score(opts, weights);
    const auto pagination = pagination_score(opts, weights);
    const auto total = where + joins + order + pagination;

    ComplexityAnalysis result;
    result.method_ = AnalysisMethod::HEURISTIC;
    result.cost_ = total * 100.0;
    result.normalized_score_ = std::min(total, 100.0);

    if (!opts.limit_)
        result.suggestions_.emplace_back("Add a LIMIT clause to restrict the number of rows returned");
    if (shape.associations_.size() > MANY_JOINS)
        result.suggestions_.emplace_back("Consider adding indexes on JOIN columns for better performance");
    if (!opts.order_by_.empty() && !opts.limit_)
        result.suggestions_.emplace_back("Add a LIMIT clause when using ORDER BY, or add indexes on sort columns");
    if (shape.conditions_ > MANY_CONDITIONS)
        result.suggestions_.emplace_back("Complex WHERE conditions detected. Consider simplifying or adding indexes");

    result.raw_details_ = Value::object
        ("conditions", static_cast<int64_t>(shape.conditions_))
        ("where_score", where)
        ("join_score", joins)
        ("order_score", order)
        ("pagination_score", pagination);
    return result;
}

} // namespace querygate::complexity
