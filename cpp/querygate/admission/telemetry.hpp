/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter_id.hpp>
#include <querygate/admission/admission_decision.hpp>
#include <querygate/admission/load_snapshot.hpp>

namespace querygate::admission {

struct TelemetryEvent {
    DecisionKind kind_;
    adapter::AdapterId adapter_;
    double effective_limit_ = 0.0;
    complexity::ComplexityAnalysis analysis_;
    LoadSnapshot load_;

    /// cost, normalized_score and load_factor
    [[nodiscard]] Value measurements() const;

    /// The full analysis and load snapshot
    [[nodiscard]] Value metadata() const;
};

/// One-way notification of admission decisions, one event per decision
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    virtual void emit(const TelemetryEvent& event) = 0;
};

/// Writes events through the telemetry logger, rejections at warn level and warnings at info
class LoggingTelemetrySink final : public TelemetrySink {
public:
    void emit(const TelemetryEvent& event) override;
};

} // namespace querygate::admission
