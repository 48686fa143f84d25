/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/backend_connector.hpp>

#include <array>
#include <chrono>
#include <mutex>

namespace querygate::adapter {

enum class ConnectorOperation {
    SERVER_VERSION,
    EXTENSIONS,
    EXPLAIN,
    LOAD_METRICS,
    COUNT
};

std::string_view operation_to_string(ConnectorOperation operation);

/**
 * In-process connector for tests. Plans, load metrics and failures are scripted, calls are counted and explained
 * statements recorded. A failing operation raises E_CONNECTOR_UNAVAILABLE.
 */
class FakeConnector : public BackendConnector {
public:
    explicit FakeConnector(std::string connector_type, std::string server_version = {}, std::vector<std::string> extensions = {});

    [[nodiscard]] std::string connector_type() const override;
    std::string server_version() override;
    std::vector<std::string> installed_extensions() override;
    Value explain(const std::string& statement, const std::vector<Value>& params) override;
    LoadMetrics load_metrics() override;

    void set_plan(Value plan);
    void set_load_metrics(LoadMetrics metrics);
    void set_explain_delay(std::chrono::milliseconds delay);
    void fail(ConnectorOperation operation, bool failing = true);

    [[nodiscard]] size_t calls(ConnectorOperation operation) const;
    [[nodiscard]] std::vector<std::string> statements() const;

private:
    void record(ConnectorOperation operation);

    const std::string connector_type_;
    mutable std::mutex mutex_;
    std::string server_version_;
    std::vector<std::string> extensions_;
    Value plan_;
    LoadMetrics load_metrics_;
    std::chrono::milliseconds explain_delay_{0};
    std::array<bool, static_cast<size_t>(ConnectorOperation::COUNT)> failing_{};
    std::array<size_t, static_cast<size_t>(ConnectorOperation::COUNT)> calls_{};
    std::vector<std::string> statements_;
};

} // namespace querygate::adapter
