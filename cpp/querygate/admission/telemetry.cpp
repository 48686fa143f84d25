/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/admission/telemetry.hpp>
#include <querygate/log/log.hpp>

#include <folly/json.h>

namespace querygate::admission {

Value TelemetryEvent::measurements() const {
    return Value::object
        ("cost", analysis_.cost_)
        ("normalized_score", analysis_.normalized_score_)
        ("load_factor", load_.load_factor_);
}

Value TelemetryEvent::metadata() const {
    return Value::object
        ("adapter", std::string{adapter::adapter_id_name(adapter_)})
        ("effective_limit", effective_limit_)
        ("analysis", analysis_.to_dynamic())
        ("load", load_.to_dynamic());
}

void LoggingTelemetrySink::emit(const TelemetryEvent& event) {
    const auto level = event.kind_ == DecisionKind::REJECTED ? spdlog::level::warn
        : event.kind_ == DecisionKind::WARNED ? spdlog::level::info
        : spdlog::level::debug;
    log::telemetry().log(level, "Query {} on {}: score {:.2f} against limit {:.2f}, method {}, load {:.2f}",
                         event.kind_, event.adapter_, event.analysis_.normalized_score_, event.effective_limit_,
                         event.analysis_.method_, event.load_.load_factor_);
    QUERYGATE_TRACE(log::telemetry(), "Telemetry metadata {}", folly::toJson(event.metadata()));
}

} // namespace querygate::admission
