/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/backend_connector.hpp>
#include <querygate/adapter/capabilities.hpp>

#include <string>
#include <vector>

namespace querygate::adapter {

/// Capabilities of an adapter given what its server reported. No I/O.
AdapterCapabilities build_capabilities(AdapterId id, const std::string& server_version, const std::vector<std::string>& extensions);

/**
 * Probes the connector for its server version and installed extensions and builds the capabilities from them.
 * A failing probe is logged and treated as reporting nothing, which leaves the base feature set of the adapter.
 * connector may be null, in which case no probe is made.
 */
AdapterCapabilities detect_capabilities(AdapterId id, BackendConnector* connector);

} // namespace querygate::adapter
