/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter.hpp>

#include <memory>

namespace querygate::adapter {

/// Builds the adapter named by the capabilities' adapter id
std::shared_ptr<Adapter> create_adapter(AdapterCapabilities capabilities, std::shared_ptr<BackendConnector> connector = nullptr);

} // namespace querygate::adapter
