/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/entity/value.hpp>

#include <fmt/format.h>

#include <string>
#include <string_view>
#include <vector>

namespace querygate::complexity {

enum class AnalysisMethod : uint8_t {
    /// Estimated by the backend's query planner
    EXPLAIN,
    /// Scored statically from the query shape
    HEURISTIC,
    /// Planner estimation failed, scored statically instead
    HEURISTIC_FALLBACK,
    /// Every strategy failed
    UNKNOWN
};

std::string_view analysis_method_name(AnalysisMethod method);

struct ComplexityAnalysis {
    double cost_ = 0.0;
    /// 0..100
    double normalized_score_ = 0.0;
    AnalysisMethod method_ = AnalysisMethod::UNKNOWN;
    std::vector<std::string> suggestions_;
    /// Strategy specific measurements, e.g. rows, seq_scans, where_score
    Value raw_details_ = Value::object;
    /// Set when analysis failed and the query must be admitted regardless of its score
    bool failed_open_ = false;

    [[nodiscard]] Value to_dynamic() const;
};

/// The fixed scaling from planner cost to score: logarithmic in cost, 100 at 1e5 cost units, plus 10 per
/// sequential scan, clamped to 0..100
double normalize_cost(double cost, size_t seq_scans);

/// Multi-line rendering for logs
std::string format_analysis(const ComplexityAnalysis& analysis);

} // namespace querygate::complexity

namespace fmt {
template<>
struct formatter<querygate::complexity::AnalysisMethod> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(querygate::complexity::AnalysisMethod method, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", querygate::complexity::analysis_method_name(method));
    }
};
}
