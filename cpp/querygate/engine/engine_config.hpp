/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/engine_config.pb.h>

#include <string>
#include <string_view>

namespace querygate::proto {
    namespace config = querygate::pb::config;
}

namespace querygate::engine {

/// Parses an EngineConfig in protobuf text format, raises E_INVALID_CONFIG with the parser's diagnostics
proto::config::EngineConfig load_engine_config_from_text(std::string_view text);

proto::config::EngineConfig load_engine_config_file(const std::string& path);

} // namespace querygate::engine
