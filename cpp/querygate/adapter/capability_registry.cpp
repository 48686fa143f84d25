/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/capability_registry.hpp>
#include <querygate/adapter/adapter_factory.hpp>
#include <querygate/adapter/capability_detection.hpp>
#include <querygate/log/log.hpp>
#include <querygate/util/pb_util.hpp>

namespace querygate::adapter {

namespace {

std::string cache_key(const std::string& connection_id, AdapterId id) {
    return fmt::format("{}/{}", connection_id, id);
}

} // namespace

AdapterId adapter_id_from_proto(proto::config::AdapterKind kind) {
    switch (kind) {
    case proto::config::POSTGRES: return AdapterId::POSTGRES;
    case proto::config::MYSQL: return AdapterId::MYSQL;
    case proto::config::SQLITE: return AdapterId::SQLITE;
    case proto::config::ELASTICSEARCH: return AdapterId::ELASTICSEARCH;
    case proto::config::MEMORY: return AdapterId::MEMORY;
    default:
        break;
    }
    adapter_selection::raise<ErrorCode::E_UNKNOWN_ADAPTER>("Adapter kind {} does not name an adapter", static_cast<int>(kind));
}

CapabilityRegistry::CapabilityRegistry(const proto::config::AdapterRegistryConfig& config) :
    fallback_unknown_to_memory_(config.fallback_unknown_to_memory()) {
    // Every adapter answers to its own name, configured mappings add driver names on top
    for (auto id : all_adapter_ids)
        mappings_.emplace(std::string{adapter_id_name(id)}, id);

    for (const auto& mapping : config.connector_mapping()) {
        user_input::check<ErrorCode::E_INVALID_CONFIG>(!mapping.connector_type().empty(),
            "Connector mappings need a connector type, got {}", util::format(mapping));
        mappings_[mapping.connector_type()] = adapter_id_from_proto(mapping.adapter());
    }
}

AdapterId CapabilityRegistry::select(const ConnectionDescriptor& connection, std::optional<AdapterId> override_id) const {
    if (override_id)
        return *override_id;

    if (!connection.has_connector())
        return AdapterId::MEMORY;

    const auto type = connection.connector_->connector_type();
    if (auto it = mappings_.find(type); it != mappings_.end())
        return it->second;

    if (fallback_unknown_to_memory_) {
        log::adapter().info("No adapter is mapped to connector type '{}', falling back to the in-memory adapter", type);
        return AdapterId::MEMORY;
    }
    adapter_selection::raise<ErrorCode::E_NO_ADAPTER_MAPPING>(
        "No adapter is mapped to connector type '{}' of connection '{}'", type, connection.connection_id_);
}

std::shared_ptr<const CapabilityRegistry::Entry> CapabilityRegistry::entry(
        const ConnectionDescriptor& connection,
        std::optional<AdapterId> override_id) {
    const auto id = select(connection, override_id);
    const auto key = cache_key(connection.connection_id_, id);
    if (auto it = cache_.find(key); it != cache_.end())
        return it->second;

    auto capabilities = detect_capabilities(id, connection.connector_.get());
    auto adapter = create_adapter(capabilities, connection.connector_);
    auto fresh = std::make_shared<const Entry>(Entry{std::move(capabilities), std::move(adapter)});
    // A concurrent detection for the same key may have won, keep whichever was inserted first
    auto [it, inserted] = cache_.insert(key, fresh);
    if (inserted)
        QUERYGATE_RUNTIME_DEBUG(log::adapter(), "Registered {} adapter for connection '{}'", id, connection.connection_id_);

    return it->second;
}

AdapterCapabilities CapabilityRegistry::detect(const ConnectionDescriptor& connection, std::optional<AdapterId> override_id) {
    return entry(connection, override_id)->capabilities_;
}

std::shared_ptr<Adapter> CapabilityRegistry::resolve(const ConnectionDescriptor& connection, std::optional<AdapterId> override_id) {
    return entry(connection, override_id)->adapter_;
}

void CapabilityRegistry::invalidate(const std::string& connection_id) {
    for (auto id : all_adapter_ids)
        cache_.erase(cache_key(connection_id, id));

    log::adapter().debug("Invalidated capabilities of connection '{}'", connection_id);
}

void CapabilityRegistry::log_report(const ConnectionDescriptor& connection, std::optional<AdapterId> override_id) {
    log::capability().info("Capabilities of connection '{}':\n{}", connection.connection_id_,
                           entry(connection, override_id)->capabilities_.report());
}

} // namespace querygate::adapter
