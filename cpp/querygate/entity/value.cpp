/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/entity/value.hpp>

namespace querygate::entity {

namespace {
template<typename T>
int three_way(const T& left, const T& right) {
    if (left < right)
        return -1;
    return right < left ? 1 : 0;
}
}

std::optional<int> compare_values(const Value& left, const Value& right) {
    if (left.isNumber() && right.isNumber()) {
        if (left.isInt() && right.isInt())
            return three_way(left.getInt(), right.getInt());

        return three_way(left.asDouble(), right.asDouble());
    }
    if (left.isString() && right.isString())
        return three_way(left.getString(), right.getString());

    if (left.isBool() && right.isBool())
        return three_way(left.getBool(), right.getBool());

    return std::nullopt;
}

bool values_equal(const Value& left, const Value& right) {
    if (left.isNumber() && right.isNumber())
        return compare_values(left, right) == 0;

    return left == right;
}

const Value* lookup_path(const Value& record, std::string_view path) {
    const Value* current = &record;
    while (current != nullptr) {
        if (!current->isObject())
            return nullptr;

        const auto dot = path.find('.');
        const auto segment = path.substr(0, dot);
        current = current->get_ptr(folly::StringPiece(segment.data(), segment.size()));
        if (dot == std::string_view::npos)
            return current;

        path.remove_prefix(dot + 1);
    }
    return nullptr;
}

} // namespace querygate::entity
