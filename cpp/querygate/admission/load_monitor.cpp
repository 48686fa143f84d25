/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/admission/load_monitor.hpp>
#include <querygate/log/log.hpp>

namespace querygate::admission {

LoadMonitor::LoadMonitor(std::shared_ptr<LoadMetricsSource> source, std::chrono::milliseconds interval, LoadSnapshot initial) :
    source_(std::move(source)),
    interval_(interval),
    snapshot_(std::make_shared<const LoadSnapshot>(initial)) {
    util::check_arg(static_cast<bool>(source_), "LoadMonitor needs a metrics source");
    util::check_arg(interval_.count() > 0, "Load sample interval must be positive, got {}ms", interval_.count());
}

LoadMonitor::~LoadMonitor() {
    stop();
}

void LoadMonitor::start() {
    if (started_)
        return;

    scheduler_.setThreadName("LoadMonitor");
    scheduler_.addFunction([this]() { refresh(); }, interval_, "Sample load");
    scheduler_.start();
    started_ = true;
    log::load().debug("Load sampling started every {}ms", interval_.count());
}

void LoadMonitor::stop() {
    if (!started_)
        return;

    scheduler_.shutdown();
    started_ = false;
    log::load().debug("Load sampling stopped");
}

bool LoadMonitor::refresh() {
    try {
        auto sampled = std::make_shared<const LoadSnapshot>(source_->sample());
        QUERYGATE_DEBUG(log::load(), "Sampled load factor {:.3f}", sampled->load_factor_);
        *snapshot_.wlock() = std::move(sampled);
        return true;
    } catch (const std::exception& e) {
        log::load().warn("Load sample failed, keeping the previous snapshot: {}", e.what());
        return false;
    }
}

std::shared_ptr<const LoadSnapshot> LoadMonitor::current() const {
    return *snapshot_.rlock();
}

} // namespace querygate::admission
