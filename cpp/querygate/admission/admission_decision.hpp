/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/complexity/complexity_analysis.hpp>

#include <fmt/format.h>

#include <string>
#include <variant>
#include <vector>

namespace querygate::admission {

enum class DecisionKind : uint8_t {
    ACCEPTED,
    WARNED,
    REJECTED
};

std::string_view decision_kind_name(DecisionKind kind);

struct Accept {
    complexity::ComplexityAnalysis analysis_;
    double effective_limit_ = 0.0;
};

/// Admitted, but close enough to the limit to be reported
struct Warn {
    complexity::ComplexityAnalysis analysis_;
    double effective_limit_ = 0.0;
};

/// Structured refusal sent back to the caller instead of executing the query
struct RejectionPayload {
    std::string code_ = "QUERY_TOO_COMPLEX";
    double score_ = 0.0;
    double cost_ = 0.0;
    double limit_ = 0.0;
    std::vector<std::string> suggestions_;

    [[nodiscard]] Value to_dynamic() const;
};

struct Reject {
    complexity::ComplexityAnalysis analysis_;
    double effective_limit_ = 0.0;

    [[nodiscard]] RejectionPayload payload() const;
};

using Decision = std::variant<Accept, Warn, Reject>;

DecisionKind decision_kind(const Decision& decision);

const complexity::ComplexityAnalysis& decision_analysis(const Decision& decision);

double decision_limit(const Decision& decision);

} // namespace querygate::admission

namespace fmt {
template<>
struct formatter<querygate::admission::DecisionKind> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(querygate::admission::DecisionKind kind, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", querygate::admission::decision_kind_name(kind));
    }
};
}
