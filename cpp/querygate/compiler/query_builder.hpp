/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter.hpp>
#include <querygate/compiler/custom_filter.hpp>
#include <querygate/entity/field_descriptor.hpp>
#include <querygate/filter/filter_expression.hpp>

#include <vector>

namespace querygate::compiler {

/**
 * Compiles filter expressions for one adapter, field table and authorization scope.
 *
 * The whole tree is validated before the first adapter call: every field outside the authorized set is collected
 * into a single UnauthorizedFieldException, then operator support, list sizes and custom filter registration are
 * checked. Only then are leaves dispatched, each operator map folded into a conjunction of single-operator
 * adapter calls.
 *
 * Compilation is pure. The same expression compiles to structurally identical queries.
 */
class QueryBuilder {
public:
    QueryBuilder(
        const adapter::Adapter& adapter,
        const entity::FieldDescriptorTable& fields,
        const entity::AuthorizedFieldSet& authorized,
        const CustomFilterRegistry& custom_filters);

    [[nodiscard]] adapter::CompiledQuery compile(const filter::FilterExpression& expression) const;

private:
    struct PreparedCondition {
        entity::Operator op_;
        Value value_;
    };

    struct PreparedLeaf {
        const entity::FieldDescriptor* field_;
        std::vector<PreparedCondition> conditions_;
    };

    void check_authorized(const filter::FilterExpression& expression) const;
    void prepare(const filter::FilterExpression& expression, std::vector<PreparedLeaf>& leaves) const;
    PreparedLeaf prepare_leaf(const filter::LeafNode& leaf) const;

    adapter::CompiledQuery dispatch(const filter::FilterExpression& expression, const std::vector<PreparedLeaf>& leaves, size_t& cursor) const;
    adapter::CompiledQuery dispatch_leaf(const PreparedLeaf& leaf) const;

    const adapter::Adapter& adapter_;
    const entity::FieldDescriptorTable& fields_;
    const entity::AuthorizedFieldSet& authorized_;
    const CustomFilterRegistry& custom_filters_;
};

adapter::CompiledQuery compile(
    const filter::FilterExpression& expression,
    const entity::FieldDescriptorTable& fields,
    const entity::AuthorizedFieldSet& authorized,
    const adapter::Adapter& adapter,
    const CustomFilterRegistry& custom_filters = {});

} // namespace querygate::compiler
