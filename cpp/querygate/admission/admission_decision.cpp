/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/admission/admission_decision.hpp>
#include <querygate/util/variant.hpp>

namespace querygate::admission {

std::string_view decision_kind_name(DecisionKind kind) {
    switch (kind) {
    case DecisionKind::ACCEPTED: return "accepted";
    case DecisionKind::WARNED: return "warned";
    case DecisionKind::REJECTED: return "rejected";
    }
    return "unknown";
}

Value RejectionPayload::to_dynamic() const {
    Value suggestions = Value::array;
    for (const auto& suggestion : suggestions_)
        suggestions.push_back(suggestion);

    return Value::object
        ("code", code_)
        ("score", score_)
        ("cost", cost_)
        ("limit", limit_)
        ("suggestions", std::move(suggestions));
}

RejectionPayload Reject::payload() const {
    RejectionPayload payload;
    payload.score_ = analysis_.normalized_score_;
    payload.cost_ = analysis_.cost_;
    payload.limit_ = effective_limit_;
    payload.suggestions_ = analysis_.suggestions_;
    return payload;
}

DecisionKind decision_kind(const Decision& decision) {
    return util::variant_match(decision,
        [](const Accept&) { return DecisionKind::ACCEPTED; },
        [](const Warn&) { return DecisionKind::WARNED; },
        [](const Reject&) { return DecisionKind::REJECTED; }
    );
}

const complexity::ComplexityAnalysis& decision_analysis(const Decision& decision) {
    return std::visit([](const auto& d) -> const complexity::ComplexityAnalysis& { return d.analysis_; }, decision);
}

double decision_limit(const Decision& decision) {
    return std::visit([](const auto& d) { return d.effective_limit_; }, decision);
}

} // namespace querygate::admission
