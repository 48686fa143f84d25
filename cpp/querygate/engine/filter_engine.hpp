/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/capability_registry.hpp>
#include <querygate/admission/admission_controller.hpp>
#include <querygate/compiler/custom_filter.hpp>
#include <querygate/entity/field_descriptor.hpp>
#include <querygate/engine/engine_config.hpp>
#include <querygate/util/constructors.hpp>

#include <memory>
#include <optional>

namespace querygate::engine {

/// A compiled query together with the adapter that produced it and must execute it
struct CompiledFilter {
    std::shared_ptr<adapter::Adapter> adapter_;
    adapter::CompiledQuery query_;
};

struct AdmittedFilter {
    CompiledFilter compiled_;
    admission::Decision decision_;
};

struct CompileRequest {
    adapter::ConnectionDescriptor connection_;
    std::optional<adapter::AdapterId> adapter_override_;
    const entity::FieldDescriptorTable* fields_ = nullptr;
    entity::AuthorizedFieldSet authorized_ = entity::AuthorizedFieldSet::all();
    const compiler::CustomFilterRegistry* custom_filters_ = nullptr;
};

/**
 * Owns the long-lived shared state: the capability registry, the complexity analyzer and its cache, the load
 * monitor and the admission controller. Compilation itself is stateless, only admission reads the shared state.
 *
 * The telemetry sink defaults to logging. Without a load source the load factor stays at zero.
 */
class FilterEngine {
public:
    explicit FilterEngine(
        const proto::config::EngineConfig& config,
        std::shared_ptr<admission::TelemetrySink> sink = nullptr,
        std::shared_ptr<admission::LoadMetricsSource> load_source = nullptr);

    ~FilterEngine();

    QUERYGATE_NO_MOVE_OR_COPY(FilterEngine)

    /// Starts periodic load sampling, taking a first sample synchronously
    void start();
    void stop();

    [[nodiscard]] CompiledFilter compile(const filter::FilterExpression& expression, const CompileRequest& request);

    /// Parses the raw filter document against the request's field table, then compiles it
    [[nodiscard]] CompiledFilter compile(const Value& raw_filter, const CompileRequest& request);

    [[nodiscard]] admission::Decision admit(const CompiledFilter& compiled, const admission::AdmissionOptions& opts = {}) const;

    [[nodiscard]] AdmittedFilter compile_and_admit(
        const Value& raw_filter,
        const CompileRequest& request,
        const admission::AdmissionOptions& opts = {});

    adapter::CapabilityRegistry& registry() { return *registry_; }

    admission::AdmissionController& controller() { return *controller_; }

    [[nodiscard]] const admission::AdmissionSettings& settings() const { return controller_->settings(); }

    [[nodiscard]] std::shared_ptr<const admission::LoadSnapshot> load() const { return load_monitor_->current(); }

private:
    std::unique_ptr<adapter::CapabilityRegistry> registry_;
    std::shared_ptr<complexity::ComplexityAnalyzer> analyzer_;
    std::shared_ptr<admission::ComplexityCache> cache_;
    std::shared_ptr<admission::LoadMonitor> load_monitor_;
    std::unique_ptr<admission::AdmissionController> controller_;
};

} // namespace querygate::engine
