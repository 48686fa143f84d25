/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/engine/filter_engine.hpp>
#include <querygate/compiler/query_builder.hpp>
#include <querygate/filter/filter_parser.hpp>
#include <querygate/log/log.hpp>
#include <querygate/util/preconditions.hpp>

namespace querygate::engine {

namespace {

// Until the first sample lands, a live backend is assumed half loaded
constexpr double unsampled_load_factor = 0.5;

const compiler::CustomFilterRegistry& no_custom_filters() {
    static const compiler::CustomFilterRegistry registry;
    return registry;
}

} // namespace

FilterEngine::FilterEngine(
    const proto::config::EngineConfig& config,
    std::shared_ptr<admission::TelemetrySink> sink,
    std::shared_ptr<admission::LoadMetricsSource> load_source) {
    if (config.has_loggers() && !log::Loggers::instance().configure(config.loggers()))
        log::root().info("Loggers already configured, keeping the existing configuration");

    auto settings = admission::AdmissionSettings::from_proto(config.admission());
    registry_ = std::make_unique<adapter::CapabilityRegistry>(config.registry());
    analyzer_ = std::make_shared<complexity::ComplexityAnalyzer>(settings.analyzer_);
    cache_ = std::make_shared<admission::ComplexityCache>(
        settings.cache_ttl_, &util::SysClock::coarse_nanos_since_epoch, settings.cache_max_entries_);

    admission::LoadSnapshot initial;
    if (load_source) {
        initial.load_factor_ = unsampled_load_factor;
    } else {
        load_source = std::make_shared<admission::StaticLoadMetricsSource>();
    }
    load_monitor_ = std::make_shared<admission::LoadMonitor>(std::move(load_source), settings.load_sample_interval_, initial);

    if (!sink)
        sink = std::make_shared<admission::LoggingTelemetrySink>();

    controller_ = std::make_unique<admission::AdmissionController>(
        std::move(settings), analyzer_, cache_, load_monitor_, std::move(sink));

    log::root().info("Filter engine created: base limit {}, adaptive limits {}, cache {}",
                     controller_->settings().base_limit_,
                     controller_->settings().adaptive_limits_,
                     controller_->settings().cache_enabled_ ? "on" : "off");
}

FilterEngine::~FilterEngine() {
    stop();
}

void FilterEngine::start() {
    load_monitor_->refresh();
    load_monitor_->start();
}

void FilterEngine::stop() {
    load_monitor_->stop();
}

CompiledFilter FilterEngine::compile(const filter::FilterExpression& expression, const CompileRequest& request) {
    util::check_arg(request.fields_ != nullptr, "Compile request for connection {} has no field table",
                    request.connection_.connection_id_);

    auto adapter = registry_->resolve(request.connection_, request.adapter_override_);
    const auto& custom_filters = request.custom_filters_ ? *request.custom_filters_ : no_custom_filters();
    auto query = compiler::compile(expression, *request.fields_, request.authorized_, *adapter, custom_filters);
    return CompiledFilter{std::move(adapter), std::move(query)};
}

CompiledFilter FilterEngine::compile(const Value& raw_filter, const CompileRequest& request) {
    util::check_arg(request.fields_ != nullptr, "Compile request for connection {} has no field table",
                    request.connection_.connection_id_);
    return compile(filter::parse(raw_filter, *request.fields_), request);
}

admission::Decision FilterEngine::admit(const CompiledFilter& compiled, const admission::AdmissionOptions& opts) const {
    util::check_arg(static_cast<bool>(compiled.adapter_), "Compiled filter has no adapter");
    return controller_->decide(compiled.query_, *compiled.adapter_, opts);
}

AdmittedFilter FilterEngine::compile_and_admit(
    const Value& raw_filter,
    const CompileRequest& request,
    const admission::AdmissionOptions& opts) {
    auto compiled = compile(raw_filter, request);
    auto decision = admit(compiled, opts);
    return AdmittedFilter{std::move(compiled), std::move(decision)};
}

} // namespace querygate::engine
