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
#include <querygate/adapter/compiled_query.hpp>
#include <querygate/adapter/query_options.hpp>
#include <querygate/entity/field_descriptor.hpp>
#include <querygate/util/constructors.hpp>

#include <memory>
#include <string>
#include <vector>

namespace querygate::adapter {

/**
 * Compiles single-operator predicates for one backend connection and composes them.
 *
 * The public interface is non-virtual: it validates arguments and maintains the QueryShape, then defers to the
 * backend specific do_* implementations which only ever see bodies of their own alternative.
 */
class Adapter {
public:
    explicit Adapter(AdapterCapabilities capabilities, std::shared_ptr<BackendConnector> connector = nullptr);

    virtual ~Adapter() = default;

    QUERYGATE_NO_MOVE_OR_COPY(Adapter)

    /// Compiles `field op value`. The value must already be in internal representation (enums coerced).
    [[nodiscard]] CompiledQuery apply_operator(const entity::FieldDescriptor& field, const entity::Operator& op, const Value& value) const;

    [[nodiscard]] CompiledQuery combine_and(std::vector<CompiledQuery> queries) const;

    [[nodiscard]] CompiledQuery combine_or(std::vector<CompiledQuery> queries) const;

    [[nodiscard]] CompiledQuery negate(CompiledQuery query) const;

    /// Neutral element of combine_and, also the starting point handed to custom filters
    [[nodiscard]] CompiledQuery match_all() const;

    [[nodiscard]] const AdapterCapabilities& capabilities() const { return capabilities_; }

    [[nodiscard]] const entity::OperatorSet& supported_operators(entity::FieldCategory category, entity::FieldKind kind) const {
        return capabilities_.supported_operators(category, kind);
    }

    [[nodiscard]] AdapterId id() const { return capabilities_.adapter_id(); }

    [[nodiscard]] std::string_view name() const { return adapter_id_name(id()); }

    /// Whether the body is of the alternative this adapter produces
    [[nodiscard]] bool accepts(const CompiledQuery& query) const { return query.body_.index() == body_index(); }

    /// Canonical text of the compiled query including bound values, used as the complexity cache identity
    [[nodiscard]] std::string signature(const CompiledQuery& query) const;

    /// The connection the adapter was built for, nullptr for connection-less adapters
    [[nodiscard]] const std::shared_ptr<BackendConnector>& connector() const { return connector_; }

private:
    virtual QueryBody do_apply_operator(const entity::FieldDescriptor& field, const entity::Operator& op, const Value& value) const = 0;
    virtual QueryBody do_combine_and(std::vector<QueryBody> bodies) const = 0;
    virtual QueryBody do_combine_or(std::vector<QueryBody> bodies) const = 0;
    virtual QueryBody do_negate(QueryBody body) const = 0;
    virtual QueryBody do_match_all() const = 0;
    virtual std::string do_signature(const QueryBody& body) const = 0;
    [[nodiscard]] virtual size_t body_index() const = 0;

    std::vector<QueryBody> take_bodies(std::vector<CompiledQuery>& queries, QueryShape& shape) const;

    AdapterCapabilities capabilities_;
    std::shared_ptr<BackendConnector> connector_;
};

/// Index of T within QueryBody, for body_index() implementations
template<typename T, size_t I = 0>
constexpr size_t body_index_of() {
    if constexpr (std::is_same_v<T, std::variant_alternative_t<I, QueryBody>>)
        return I;
    else
        return body_index_of<T, I + 1>();
}

} // namespace querygate::adapter
