/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/sql/sql_fragment.hpp>

namespace querygate::adapter::sql {

void append_placeholders(SqlFragment& fragment, const Value& items) {
    bool first = true;
    for (const auto& item : items) {
        if (!first)
            fragment.sql_.append(", ");
        fragment.sql_.push_back('?');
        fragment.params_.push_back(item);
        first = false;
    }
}

std::string escape_like(std::string_view input) {
    std::string output;
    output.reserve(input.size());
    for (auto c : input) {
        if (c == '%' || c == '_' || c == '\\')
            output.push_back('\\');
        output.push_back(c);
    }
    return output;
}

} // namespace querygate::adapter::sql
