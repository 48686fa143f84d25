/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/entity/value.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace querygate::adapter {

struct LoadMetrics {
    uint64_t active_connections_ = 0;
    uint64_t max_connections_ = 100;
    /// 0..1, fraction of reads served from the backend's buffer cache
    double cache_hit_ratio_ = 1.0;
};

/**
 * The live connection to a backing store, as provided by the execution layer. Every call may block on a round
 * trip and may throw, callers must not hold locks across them.
 */
class BackendConnector {
public:
    virtual ~BackendConnector() = default;

    /// Driver identifier the registry maps to an adapter, e.g. "postgrex" or "myxql"
    [[nodiscard]] virtual std::string connector_type() const = 0;

    virtual std::string server_version() = 0;

    virtual std::vector<std::string> installed_extensions() = 0;

    /// Runs a plan-only statement and returns the plan document
    virtual Value explain(const std::string& statement, const std::vector<Value>& params) = 0;

    virtual LoadMetrics load_metrics() = 0;
};

struct ConnectionDescriptor {
    std::string connection_id_;
    std::shared_ptr<BackendConnector> connector_;

    [[nodiscard]] bool has_connector() const { return static_cast<bool>(connector_); }
};

} // namespace querygate::adapter
