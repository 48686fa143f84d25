/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter.hpp>
#include <querygate/adapter/backend_connector.hpp>
#include <querygate/adapter/capabilities.hpp>
#include <querygate/engine_config.pb.h>

#include <folly/concurrency/ConcurrentHashMap.h>
#include <ankerl/unordered_dense.h>

#include <memory>
#include <optional>
#include <string>

namespace querygate::proto {
    namespace config = querygate::pb::config;
}

namespace querygate::adapter {

/// Adapter id for a configured adapter kind, raises E_UNKNOWN_ADAPTER for ADAPTER_UNSPECIFIED
AdapterId adapter_id_from_proto(proto::config::AdapterKind kind);

/**
 * Selects the adapter for a connection and caches its detected capabilities, and the adapter instance built on
 * them, per connection. Entries live until invalidated.
 *
 * Selection, first match wins: the explicit override, the connector-type mapping, the in-memory adapter for
 * connections without a connector. A connector of an unmapped type is an error unless fallback_unknown_to_memory
 * is configured.
 */
class CapabilityRegistry {
public:
    explicit CapabilityRegistry(const proto::config::AdapterRegistryConfig& config = {});

    QUERYGATE_NO_MOVE_OR_COPY(CapabilityRegistry)

    [[nodiscard]] AdapterId select(const ConnectionDescriptor& connection, std::optional<AdapterId> override_id = std::nullopt) const;

    /// Capabilities of the adapter selected for the connection, probing the connector on first use
    AdapterCapabilities detect(const ConnectionDescriptor& connection, std::optional<AdapterId> override_id = std::nullopt);

    std::shared_ptr<Adapter> resolve(const ConnectionDescriptor& connection, std::optional<AdapterId> override_id = std::nullopt);

    /// Drops every cached entry of the connection, the next resolve probes again
    void invalidate(const std::string& connection_id);

    void log_report(const ConnectionDescriptor& connection, std::optional<AdapterId> override_id = std::nullopt);

    [[nodiscard]] size_t size() const { return cache_.size(); }

private:
    struct Entry {
        AdapterCapabilities capabilities_;
        std::shared_ptr<Adapter> adapter_;
    };

    std::shared_ptr<const Entry> entry(const ConnectionDescriptor& connection, std::optional<AdapterId> override_id);

    ankerl::unordered_dense::map<std::string, AdapterId> mappings_;
    bool fallback_unknown_to_memory_;
    folly::ConcurrentHashMap<std::string, std::shared_ptr<const Entry>> cache_;
};

} // namespace querygate::adapter
