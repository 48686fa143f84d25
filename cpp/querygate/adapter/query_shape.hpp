/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <cstdint>
#include <set>
#include <string>

namespace querygate::adapter {

/**
 * Backend-independent structural statistics of a compiled query. Maintained by the Adapter base class as queries
 * are composed, read by the heuristic complexity scorer.
 */
struct QueryShape {
    uint32_t conditions_ = 0;
    uint32_t and_groups_ = 0;
    uint32_t or_branches_ = 0;
    uint32_t negations_ = 0;
    uint32_t membership_lists_ = 0;
    uint64_t membership_items_ = 0;
    uint32_t pattern_matches_ = 0;
    uint32_t custom_fragments_ = 0;
    /// Distinct associations traversed, each costs a join on relational backends
    std::set<std::string> associations_;

    QueryShape& merge(const QueryShape& other) {
        conditions_ += other.conditions_;
        and_groups_ += other.and_groups_;
        or_branches_ += other.or_branches_;
        negations_ += other.negations_;
        membership_lists_ += other.membership_lists_;
        membership_items_ += other.membership_items_;
        pattern_matches_ += other.pattern_matches_;
        custom_fragments_ += other.custom_fragments_;
        associations_.insert(other.associations_.begin(), other.associations_.end());
        return *this;
    }

    bool operator==(const QueryShape&) const = default;
};

} // namespace querygate::adapter
