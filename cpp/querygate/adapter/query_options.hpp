/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <folly/CancellationToken.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace querygate::adapter {

enum class SortDirection : uint8_t {
    ASC,
    DESC
};

struct OrderBy {
    std::string column_;
    SortDirection direction_ = SortDirection::ASC;
};

/**
 * How the compiled predicate will be executed: the relation it runs against and the result window.
 */
struct QueryOptions {
    /// Table or index name, used to build plan-only statements
    std::string source_;
    std::optional<uint64_t> limit_;
    uint64_t offset_ = 0;
    std::vector<OrderBy> order_by_;
    folly::CancellationToken cancellation_token_;
};

} // namespace querygate::adapter
