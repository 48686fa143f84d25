/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/search/elasticsearch_adapter.hpp>
#include <querygate/util/variant.hpp>

#include <fmt/format.h>

namespace querygate::adapter::search {

using namespace entity;

namespace {

Value exists(const std::string& field) {
    return Value::object("exists", Value::object("field", field));
}

Value term(const std::string& field, const Value& value) {
    return Value::object("term", Value::object(field, value));
}

Value terms(const std::string& field, const Value& values) {
    return Value::object("terms", Value::object(field, values));
}

Value missing(const std::string& field) {
    return Value::object("bool", Value::object("must_not", Value::array(exists(field))));
}

/// Present and not matching, the complement of clause within rows that have the field
Value present_and_not(const std::string& field, Value clause) {
    return Value::object("bool", Value::object
        ("filter", Value::array(exists(field)))
        ("must_not", Value::array(std::move(clause))));
}

Value wildcard(const std::string& field, std::string pattern, bool case_insensitive) {
    return Value::object("wildcard", Value::object(field, Value::object
        ("value", std::move(pattern))
        ("case_insensitive", case_insensitive)));
}

Value prefix(const std::string& field, const Value& value, bool case_insensitive) {
    return Value::object("prefix", Value::object(field, Value::object
        ("value", value)
        ("case_insensitive", case_insensitive)));
}

Value range(const std::string& field, std::string_view bound, const Value& value) {
    return Value::object("range", Value::object(field, Value::object(std::string(bound), value)));
}

std::string escape_wildcard(std::string_view input) {
    std::string output;
    output.reserve(input.size());
    for (auto c : input) {
        if (c == '*' || c == '?' || c == '\\')
            output.push_back('\\');
        output.push_back(c);
    }
    return output;
}

Value bool_clause(std::string_view occurrence, std::vector<QueryBody> bodies) {
    Value clauses = Value::array;
    for (auto& body : bodies)
        clauses.push_back(std::move(std::get<SearchQuery>(body).clause_));

    return Value::object("bool", Value::object(std::string(occurrence), std::move(clauses)));
}

} // namespace

std::string like_to_wildcard(std::string_view pattern) {
    std::string output;
    output.reserve(pattern.size());
    for (size_t i = 0; i < pattern.size(); ++i) {
        const auto c = pattern[i];
        if (c == '\\' && i + 1 < pattern.size()) {
            output.append(escape_wildcard(pattern.substr(++i, 1)));
        } else if (c == '%') {
            output.push_back('*');
        } else if (c == '_') {
            output.push_back('?');
        } else {
            output.append(escape_wildcard(pattern.substr(i, 1)));
        }
    }
    return output;
}

std::string json_path_to_field(std::string_view field, std::string_view json_path) {
    std::string path{field};
    if (!json_path.empty() && json_path.front() == '$')
        json_path.remove_prefix(1);

    bool in_index = false;
    for (auto c : json_path) {
        if (c == '[') {
            in_index = true;
        } else if (c == ']') {
            in_index = false;
        } else if (!in_index && c != '"') {
            path.push_back(c);
        }
    }
    return path;
}

void ElasticsearchAdapter::raise_unsupported(const Operator& op) const {
    capability::raise<ErrorCode::E_UNSUPPORTED_OPERATOR>("Operator {} cannot be expressed by the {} adapter", op, name());
}

Value ElasticsearchAdapter::scalar_clause(const std::string& field, ScalarOperator op, const Value& value) const {
    switch (op) {
    case ScalarOperator::EQ: return term(field, value);
    case ScalarOperator::NEQ: return present_and_not(field, term(field, value));
    case ScalarOperator::GT: return range(field, "gt", value);
    case ScalarOperator::GTE: return range(field, "gte", value);
    case ScalarOperator::LT: return range(field, "lt", value);
    case ScalarOperator::LTE: return range(field, "lte", value);
    case ScalarOperator::IN:
        return value.empty() ? SearchQuery::match_none().clause_ : terms(field, value);
    case ScalarOperator::NIN:
        return value.empty() ? exists(field) : present_and_not(field, terms(field, value));
    case ScalarOperator::IS_NULL:
        return value.getBool() ? missing(field) : exists(field);
    case ScalarOperator::LIKE: return wildcard(field, like_to_wildcard(value.getString()), false);
    case ScalarOperator::ILIKE: return wildcard(field, like_to_wildcard(value.getString()), true);
    case ScalarOperator::NLIKE:
        return present_and_not(field, wildcard(field, like_to_wildcard(value.getString()), false));
    case ScalarOperator::NILIKE:
        return present_and_not(field, wildcard(field, like_to_wildcard(value.getString()), true));
    case ScalarOperator::STARTS_WITH: return prefix(field, value, false);
    case ScalarOperator::ISTARTS_WITH: return prefix(field, value, true);
    case ScalarOperator::ENDS_WITH: return wildcard(field, "*" + escape_wildcard(value.getString()), false);
    case ScalarOperator::IENDS_WITH: return wildcard(field, "*" + escape_wildcard(value.getString()), true);
    case ScalarOperator::CONTAINS: return wildcard(field, "*" + escape_wildcard(value.getString()) + "*", false);
    case ScalarOperator::ICONTAINS: return wildcard(field, "*" + escape_wildcard(value.getString()) + "*", true);
    case ScalarOperator::MATCHES:
        return Value::object("match", Value::object(field, Value::object("query", value)));
    case ScalarOperator::FUZZY:
        return Value::object("fuzzy", Value::object(field, Value::object("value", value)("fuzziness", "AUTO")));
    case ScalarOperator::WITHIN_DISTANCE:
        return Value::object("geo_distance", Value::object
            ("distance", fmt::format("{}m", value["distance"].asDouble()))
            (field, Value::object("lat", value["lat"])("lon", value["lon"])));
    case ScalarOperator::SIMILAR:
        break;
    }
    raise_unsupported(op);
}

Value ElasticsearchAdapter::array_clause(const std::string& field, ArrayOperator op, const Value& value) const {
    switch (op) {
    case ArrayOperator::INCLUDES: return term(field, value);
    case ArrayOperator::EXCLUDES: return present_and_not(field, term(field, value));
    case ArrayOperator::INCLUDES_ANY:
        return value.empty() ? SearchQuery::match_none().clause_ : terms(field, value);
    case ArrayOperator::EXCLUDES_ALL:
        return value.empty() ? exists(field) : present_and_not(field, terms(field, value));
    case ArrayOperator::INCLUDES_ALL:
    case ArrayOperator::EXCLUDES_ANY: {
        if (value.empty())
            return op == ArrayOperator::INCLUDES_ALL ? exists(field) : SearchQuery::match_none().clause_;

        Value each = Value::array;
        for (const auto& item : value)
            each.push_back(term(field, item));
        Value all = Value::object("bool", Value::object("filter", std::move(each)));
        return op == ArrayOperator::INCLUDES_ALL ? all : present_and_not(field, std::move(all));
    }
    case ArrayOperator::IS_EMPTY:
        return value.getBool() ? missing(field) : exists(field);
    case ArrayOperator::IS_NULL:
        return value.getBool() ? missing(field) : exists(field);
    }
    raise_unsupported(op);
}

Value ElasticsearchAdapter::json_clause(const std::string& field, JsonOperator op, const Value& value) const {
    switch (op) {
    case JsonOperator::HAS_KEY:
        return exists(fmt::format("{}.{}", field, value.getString()));
    case JsonOperator::HAS_ANY_KEYS: {
        if (value.empty())
            return SearchQuery::match_none().clause_;

        Value should = Value::array;
        for (const auto& key : value)
            should.push_back(exists(fmt::format("{}.{}", field, key.getString())));
        return Value::object("bool", Value::object("should", std::move(should))("minimum_should_match", 1));
    }
    case JsonOperator::PATH_EXISTS:
        return exists(json_path_to_field(field, value.getString()));
    case JsonOperator::IS_NULL:
        return value.getBool() ? missing(field) : exists(field);
    }
    raise_unsupported(op);
}

QueryBody ElasticsearchAdapter::do_apply_operator(const FieldDescriptor& field, const Operator& op, const Value& value) const {
    const auto path = field.qualified_column();
    return SearchQuery{util::variant_match(op,
        [&](ScalarOperator o) { return scalar_clause(path, o, value); },
        [&](ArrayOperator o) { return array_clause(path, o, value); },
        [&](JsonOperator o) { return json_clause(path, o, value); }
    )};
}

QueryBody ElasticsearchAdapter::do_combine_and(std::vector<QueryBody> bodies) const {
    if (bodies.empty())
        return SearchQuery::match_all();

    return SearchQuery{bool_clause("filter", std::move(bodies))};
}

QueryBody ElasticsearchAdapter::do_combine_or(std::vector<QueryBody> bodies) const {
    if (bodies.empty())
        return SearchQuery::match_none();

    auto clause = bool_clause("should", std::move(bodies));
    clause["bool"]["minimum_should_match"] = 1;
    return SearchQuery{std::move(clause)};
}

QueryBody ElasticsearchAdapter::do_negate(QueryBody body) const {
    auto clause = std::move(std::get<SearchQuery>(body).clause_);
    return SearchQuery{Value::object("bool", Value::object("must_not", Value::array(std::move(clause))))};
}

QueryBody ElasticsearchAdapter::do_match_all() const {
    return SearchQuery::match_all();
}

std::string ElasticsearchAdapter::do_signature(const QueryBody& body) const {
    return to_json(std::get<SearchQuery>(body).clause_);
}

Value ElasticsearchAdapter::to_search_request(const SearchQuery& query, const QueryOptions& opts) const {
    Value request = Value::object("query", query.clause_);
    if (opts.limit_)
        request["size"] = static_cast<int64_t>(*opts.limit_);
    if (opts.offset_ > 0)
        request["from"] = static_cast<int64_t>(opts.offset_);
    if (!opts.order_by_.empty()) {
        Value sort = Value::array;
        for (const auto& order : opts.order_by_) {
            sort.push_back(Value::object(order.column_,
                Value::object("order", order.direction_ == SortDirection::DESC ? "desc" : "asc")("missing", "_last")));
        }
        request["sort"] = std::move(sort);
    }
    return request;
}

} // namespace querygate::adapter::search
