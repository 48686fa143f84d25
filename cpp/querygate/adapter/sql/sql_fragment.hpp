/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/entity/value.hpp>

#include <string>
#include <vector>

namespace querygate::adapter::sql {

/**
 * A parameterised SQL predicate. Placeholders are written as '?' and bound positionally to params_, dialects that
 * number their placeholders rewrite them on render.
 */
struct SqlFragment {
    std::string sql_;
    std::vector<Value> params_;

    static SqlFragment literal(std::string sql) {
        return SqlFragment{std::move(sql), {}};
    }

    static SqlFragment always_true() { return literal("1 = 1"); }
    static SqlFragment always_false() { return literal("1 = 0"); }

    bool operator==(const SqlFragment& other) const {
        return sql_ == other.sql_ && params_ == other.params_;
    }
};

/// Appends "?, ?, ?" for each item of a list value and binds the items
void append_placeholders(SqlFragment& fragment, const Value& items);

/// Escapes the LIKE wildcards % and _ and the escape character itself
std::string escape_like(std::string_view input);

} // namespace querygate::adapter::sql
