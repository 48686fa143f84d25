/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/admission/telemetry.hpp>

#include <mutex>
#include <vector>

namespace querygate::admission {

/// Keeps every emitted event for inspection
class RecordingTelemetrySink final : public TelemetrySink {
public:
    void emit(const TelemetryEvent& event) override {
        std::lock_guard lock{mutex_};
        events_.push_back(event);
    }

    [[nodiscard]] std::vector<TelemetryEvent> events() const {
        std::lock_guard lock{mutex_};
        return events_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock{mutex_};
        return events_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<TelemetryEvent> events_;
};

} // namespace querygate::admission
