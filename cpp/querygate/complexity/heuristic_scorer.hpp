/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/query_options.hpp>
#include <querygate/adapter/query_shape.hpp>
#include <querygate/complexity/complexity_analysis.hpp>

namespace querygate::complexity {

/// Fixed weight per construct of the query shape and the result window
struct HeuristicWeights {
    double condition_ = 5.0;
    double or_branch_ = 5.0;
    double and_group_ = 2.0;
    double membership_list_ = 3.0;
    double pattern_match_ = 3.0;
    /// Opaque fragments cannot be estimated, weighted as the most expensive single construct
    double custom_fragment_ = 10.0;
    double association_ = 10.0;
    double order_field_ = 5.0;
    double unbounded_sort_ = 20.0;
    double large_offset_unbounded_ = 30.0;
    double large_offset_ = 15.0;
    double no_limit_ = 20.0;
    uint64_t large_offset_threshold_ = 1000;
};

/// Scores the query statically. The score is clamped to 100, the cost is 100 times the unclamped score.
ComplexityAnalysis score_heuristic(
    const adapter::QueryShape& shape,
    const adapter::QueryOptions& opts,
    const HeuristicWeights& weights = {});

} // namespace querygate::complexity
