/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/compiled_query.hpp>
#include <querygate/entity/operators.hpp>

#include <ankerl/unordered_dense.h>

#include <functional>
#include <string>

namespace querygate::compiler {

/**
 * Compiles one operator of a custom field. Receives the adapter's match_all() query and must return a query of
 * the same alternative, which the builder treats as opaque.
 */
using CustomFilter = std::function<adapter::CompiledQuery(adapter::CompiledQuery query, const entity::Operator& op, const Value& value)>;

class CustomFilterRegistry {
public:
    CustomFilterRegistry& register_filter(std::string field, CustomFilter filter) {
        filters_.insert_or_assign(std::move(field), std::move(filter));
        return *this;
    }

    [[nodiscard]] const CustomFilter* find(std::string_view field) const {
        auto it = filters_.find(std::string{field});
        return it == filters_.end() ? nullptr : &it->second;
    }

    [[nodiscard]] size_t size() const { return filters_.size(); }

private:
    ankerl::unordered_dense::map<std::string, CustomFilter> filters_;
};

} // namespace querygate::compiler
