/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/entity/value.hpp>

namespace querygate::adapter::search {

/**
 * An Elasticsearch query clause (the value of the "query" key of a search request).
 */
struct SearchQuery {
    Value clause_;

    static SearchQuery match_all() {
        return SearchQuery{Value::object("match_all", Value::object())};
    }

    static SearchQuery match_none() {
        return SearchQuery{Value::object("bool", Value::object("must_not", Value::array(Value::object("match_all", Value::object()))))};
    }

    bool operator==(const SearchQuery& other) const {
        return clause_ == other.clause_;
    }
};

} // namespace querygate::adapter::search
