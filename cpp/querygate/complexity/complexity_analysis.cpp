/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/complexity/complexity_analysis.hpp>

#include <fmt/ranges.h>

#include <algorithm>
#include <cmath>

namespace querygate::complexity {

namespace {

constexpr double FULL_SCALE_COST = 1e5;
constexpr double SEQ_SCAN_PENALTY = 10.0;

} // namespace

std::string_view analysis_method_name(AnalysisMethod method) {
    switch (method) {
    case AnalysisMethod::EXPLAIN: return "explain";
    case AnalysisMethod::HEURISTIC: return "heuristic";
    case AnalysisMethod::HEURISTIC_FALLBACK: return "heuristic_fallback";
    case AnalysisMethod::UNKNOWN: return "unknown";
    }
    return "unknown";
}

double normalize_cost(double cost, size_t seq_scans) {
    const auto scaled = 100.0 * std::log10(1.0 + std::max(cost, 0.0)) / std::log10(1.0 + FULL_SCALE_COST);
    return std::clamp(scaled + SEQ_SCAN_PENALTY * static_cast<double>(seq_scans), 0.0, 100.0);
}

Value ComplexityAnalysis::to_dynamic() const {
    Value suggestions = Value::array;
    for (const auto& suggestion : suggestions_)
        suggestions.push_back(suggestion);

    return Value::object
        ("cost", cost_)
        ("normalized_score", normalized_score_)
        ("method", std::string{analysis_method_name(method_)})
        ("suggestions", std::move(suggestions))
        ("raw_details", raw_details_)
        ("failed_open", failed_open_);
}

std::string format_analysis(const ComplexityAnalysis& analysis) {
    auto detail = [&analysis](std::string_view key) -> std::string {
        const auto* value = analysis.raw_details_.get_ptr(folly::StringPiece(key.data(), key.size()));
        if (value == nullptr)
            return "n/a";
        return value->isString() ? value->getString() : entity::to_json(*value);
    };

    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "Query Complexity Analysis:\n");
    fmt::format_to(std::back_inserter(out), "  Cost: {:.2f}\n", analysis.cost_);
    fmt::format_to(std::back_inserter(out), "  Estimated rows: {}\n", detail("rows"));
    fmt::format_to(std::back_inserter(out), "  Complexity score: {:.2f}/100\n", analysis.normalized_score_);
    fmt::format_to(std::back_inserter(out), "  Sequential scans: {}\n", detail("seq_scans"));
    fmt::format_to(std::back_inserter(out), "  Indexes used: {}\n", detail("index_usage"));
    fmt::format_to(std::back_inserter(out), "  Analysis method: {}{}\n", analysis.method_, analysis.failed_open_ ? " (failed open)" : "");
    fmt::format_to(std::back_inserter(out), "\nSuggestions:\n");
    for (const auto& suggestion : analysis.suggestions_)
        fmt::format_to(std::back_inserter(out), "  - {}\n", suggestion);

    return fmt::to_string(out);
}

} // namespace querygate::complexity
