/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/mock/fake_connector.hpp>
#include <querygate/util/preconditions.hpp>

#include <thread>

namespace querygate::adapter {

std::string_view operation_to_string(ConnectorOperation operation) {
    switch (operation) {
    case ConnectorOperation::SERVER_VERSION: return "ServerVersion";
    case ConnectorOperation::EXTENSIONS: return "Extensions";
    case ConnectorOperation::EXPLAIN: return "Explain";
    case ConnectorOperation::LOAD_METRICS: return "LoadMetrics";
    default: util::raise_rte("Invalid connector operation provided for fake connector");
    }
}

FakeConnector::FakeConnector(std::string connector_type, std::string server_version, std::vector<std::string> extensions) :
    connector_type_(std::move(connector_type)),
    server_version_(std::move(server_version)),
    extensions_(std::move(extensions)),
    plan_(Value::array) {
}

void FakeConnector::record(ConnectorOperation operation) {
    const auto index = static_cast<size_t>(operation);
    ++calls_[index];
    if (failing_[index]) {
        analysis::raise<ErrorCode::E_CONNECTOR_UNAVAILABLE>("Simulated {} failure on {} connector",
                                                            operation_to_string(operation), connector_type_);
    }
}

std::string FakeConnector::connector_type() const {
    return connector_type_;
}

std::string FakeConnector::server_version() {
    std::lock_guard lock(mutex_);
    record(ConnectorOperation::SERVER_VERSION);
    return server_version_;
}

std::vector<std::string> FakeConnector::installed_extensions() {
    std::lock_guard lock(mutex_);
    record(ConnectorOperation::EXTENSIONS);
    return extensions_;
}

Value FakeConnector::explain(const std::string& statement, const std::vector<Value>&) {
    std::chrono::milliseconds delay;
    {
        std::lock_guard lock(mutex_);
        statements_.push_back(statement);
        record(ConnectorOperation::EXPLAIN);
        delay = explain_delay_;
    }
    if (delay.count() > 0)
        std::this_thread::sleep_for(delay);

    std::lock_guard lock(mutex_);
    return plan_;
}

LoadMetrics FakeConnector::load_metrics() {
    std::lock_guard lock(mutex_);
    record(ConnectorOperation::LOAD_METRICS);
    return load_metrics_;
}

void FakeConnector::set_plan(Value plan) {
    std::lock_guard lock(mutex_);
    plan_ = std::move(plan);
}

void FakeConnector::set_load_metrics(LoadMetrics metrics) {
    std::lock_guard lock(mutex_);
    load_metrics_ = metrics;
}

void FakeConnector::set_explain_delay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    explain_delay_ = delay;
}

void FakeConnector::fail(ConnectorOperation operation, bool failing) {
    std::lock_guard lock(mutex_);
    failing_[static_cast<size_t>(operation)] = failing;
}

size_t FakeConnector::calls(ConnectorOperation operation) const {
    std::lock_guard lock(mutex_);
    return calls_[static_cast<size_t>(operation)];
}

std::vector<std::string> FakeConnector::statements() const {
    std::lock_guard lock(mutex_);
    return statements_;
}

} // namespace querygate::adapter
