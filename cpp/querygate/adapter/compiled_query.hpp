/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/memory/memory_predicate.hpp>
#include <querygate/adapter/query_shape.hpp>
#include <querygate/adapter/search/search_query.hpp>
#include <querygate/adapter/sql/sql_fragment.hpp>
#include <querygate/util/preconditions.hpp>

#include <variant>

namespace querygate::adapter {

/// Backend-specific accumulator, each alternative is only ever produced and consumed by its own adapter family
using QueryBody = std::variant<sql::SqlFragment, search::SearchQuery, memory::MemoryPredicate>;

/**
 * The output of compilation. The body is opaque to everything but the adapter that produced it, the shape is
 * backend independent.
 */
struct CompiledQuery {
    QueryBody body_;
    QueryShape shape_;

    template<typename T>
    [[nodiscard]] bool holds() const {
        return std::holds_alternative<T>(body_);
    }

    template<typename T>
    [[nodiscard]] const T& as() const {
        internal::check<ErrorCode::E_ADAPTER_MISMATCH>(holds<T>(),
            "Compiled query holds alternative {}, not the requested one", body_.index());
        return std::get<T>(body_);
    }

    bool operator==(const CompiledQuery& other) const {
        return body_ == other.body_ && shape_ == other.shape_;
    }
};

} // namespace querygate::adapter
