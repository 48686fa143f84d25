/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/admission/load_snapshot.hpp>
#include <querygate/util/constructors.hpp>

#include <folly/Synchronized.h>
#include <folly/experimental/FunctionScheduler.h>

#include <chrono>
#include <memory>

namespace querygate::admission {

/**
 * Samples load out of band and publishes the latest snapshot. Readers never trigger a measurement and never wait
 * on one. A failed sample keeps the previously published snapshot.
 */
class LoadMonitor {
public:
    LoadMonitor(std::shared_ptr<LoadMetricsSource> source, std::chrono::milliseconds interval, LoadSnapshot initial = {});
    ~LoadMonitor();

    QUERYGATE_NO_MOVE_OR_COPY(LoadMonitor)

    void start();
    void stop();

    /// Samples once on the calling thread, returns false if the sample failed
    bool refresh();

    [[nodiscard]] std::shared_ptr<const LoadSnapshot> current() const;

    [[nodiscard]] double load_factor() const { return current()->load_factor_; }

private:
    std::shared_ptr<LoadMetricsSource> source_;
    std::chrono::milliseconds interval_;
    folly::Synchronized<std::shared_ptr<const LoadSnapshot>> snapshot_;
    folly::FunctionScheduler scheduler_;
    bool started_ = false;
};

} // namespace querygate::admission
