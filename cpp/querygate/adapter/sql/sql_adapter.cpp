/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/sql/sql_adapter.hpp>
#include <querygate/util/variant.hpp>

#include <fmt/format.h>

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

namespace querygate::adapter::sql {

using namespace entity;

namespace {

SqlFragment binary(const std::string& column, std::string_view op, const Value& value) {
    return SqlFragment{fmt::format("{} {} ?", column, op), {value}};
}

SqlFragment membership(const std::string& column, std::string_view keyword, const Value& items) {
    SqlFragment fragment{fmt::format("{} {} (", column, keyword), {}};
    append_placeholders(fragment, items);
    fragment.sql_.push_back(')');
    return fragment;
}

SqlFragment is_null(const std::string& column, bool null) {
    return SqlFragment::literal(fmt::format("{} IS {}NULL", column, null ? "" : "NOT "));
}

} // namespace

std::string json_key_path(std::string_view key) {
    std::string escaped;
    escaped.reserve(key.size());
    for (auto c : key) {
        if (c == '"' || c == '\\')
            escaped.push_back('\\');
        escaped.push_back(c);
    }
    return fmt::format("$.\"{}\"", escaped);
}

SqlFragment join_fragments(std::vector<SqlFragment> fragments, std::string_view separator) {
    SqlFragment output;
    bool first = true;
    for (auto& fragment : fragments) {
        if (!first)
            output.sql_.append(separator);
        output.sql_.append(fragment.sql_);
        std::move(fragment.params_.begin(), fragment.params_.end(), std::back_inserter(output.params_));
        first = false;
    }
    return output;
}

std::string SqlAdapter::column_reference(const FieldDescriptor& field) const {
    if (field.association_)
        return fmt::format("{}.{}", quote_identifier(*field.association_), quote_identifier(field.column_));

    return quote_identifier(field.column_);
}

SqlFragment SqlAdapter::quoted_path(std::string_view path) const {
    std::vector<std::string> parts;
    boost::split(parts, path, boost::is_any_of("."));
    std::vector<std::string> quoted;
    quoted.reserve(parts.size());
    for (const auto& part : parts)
        quoted.push_back(quote_identifier(part));

    return SqlFragment::literal(fmt::format("{}", fmt::join(quoted, ".")));
}

std::string SqlAdapter::limit_clause(std::optional<uint64_t> limit, uint64_t offset) const {
    std::string clause;
    if (limit)
        clause = fmt::format(" LIMIT {}", *limit);
    if (offset > 0)
        clause.append(fmt::format(" OFFSET {}", offset));

    return clause;
}

SqlFragment SqlAdapter::select_statement(const SqlFragment& where, const QueryOptions& opts) const {
    util::check_arg(!opts.source_.empty(), "A source relation is required to build a statement for the {} adapter", name());
    SqlFragment statement{fmt::format("SELECT * FROM {} WHERE {}", quoted_path(opts.source_).sql_, where.sql_), where.params_};
    if (!opts.order_by_.empty()) {
        std::vector<std::string> terms;
        terms.reserve(opts.order_by_.size());
        for (const auto& order : opts.order_by_) {
            terms.push_back(fmt::format("{} {}", quoted_path(order.column_).sql_,
                                        order.direction_ == SortDirection::DESC ? "DESC" : "ASC"));
        }
        statement.sql_.append(fmt::format(" ORDER BY {}", fmt::join(terms, ", ")));
    }
    statement.sql_.append(limit_clause(opts.limit_, opts.offset_));
    return statement;
}

SqlFragment SqlAdapter::explain_statement(const SqlFragment& where, const QueryOptions& opts) const {
    auto statement = select_statement(where, opts);
    statement.sql_ = render_placeholders(fmt::format("{}{}", explain_prefix(), statement.sql_));
    return statement;
}

void SqlAdapter::raise_unsupported(const Operator& op) const {
    capability::raise<ErrorCode::E_UNSUPPORTED_OPERATOR>("Operator {} cannot be expressed by the {} adapter", op, name());
}

SqlFragment SqlAdapter::scalar_condition(const std::string& column, ScalarOperator op, const Value& value) const {
    switch (op) {
    case ScalarOperator::EQ: return binary(column, "=", value);
    case ScalarOperator::NEQ: return binary(column, "<>", value);
    case ScalarOperator::GT: return binary(column, ">", value);
    case ScalarOperator::GTE: return binary(column, ">=", value);
    case ScalarOperator::LT: return binary(column, "<", value);
    case ScalarOperator::LTE: return binary(column, "<=", value);
    case ScalarOperator::IN:
        return value.empty() ? SqlFragment::always_false() : membership(column, "IN", value);
    case ScalarOperator::NIN:
        return value.empty() ? is_null(column, false) : membership(column, "NOT IN", value);
    case ScalarOperator::IS_NULL: return is_null(column, value.getBool());
    case ScalarOperator::LIKE: return pattern_match(column, value.getString(), false, false);
    case ScalarOperator::NLIKE: return pattern_match(column, value.getString(), false, true);
    case ScalarOperator::ILIKE: return pattern_match(column, value.getString(), true, false);
    case ScalarOperator::NILIKE: return pattern_match(column, value.getString(), true, true);
    case ScalarOperator::STARTS_WITH: return pattern_match(column, escape_like(value.getString()) + "%", false, false);
    case ScalarOperator::ISTARTS_WITH: return pattern_match(column, escape_like(value.getString()) + "%", true, false);
    case ScalarOperator::ENDS_WITH: return pattern_match(column, "%" + escape_like(value.getString()), false, false);
    case ScalarOperator::IENDS_WITH: return pattern_match(column, "%" + escape_like(value.getString()), true, false);
    case ScalarOperator::CONTAINS: return pattern_match(column, "%" + escape_like(value.getString()) + "%", false, false);
    case ScalarOperator::ICONTAINS: return pattern_match(column, "%" + escape_like(value.getString()) + "%", true, false);
    case ScalarOperator::MATCHES:
    case ScalarOperator::SIMILAR:
    case ScalarOperator::FUZZY:
    case ScalarOperator::WITHIN_DISTANCE:
        return advanced_condition(column, op, value);
    }
    util::raise_rte("Unknown scalar operator {}", static_cast<int>(op));
}

QueryBody SqlAdapter::do_apply_operator(const FieldDescriptor& field, const Operator& op, const Value& value) const {
    const auto column = column_reference(field);
    return util::variant_match(op,
        [&](ScalarOperator o) { return scalar_condition(column, o, value); },
        [&](ArrayOperator o) {
            switch (o) {
            case ArrayOperator::IS_NULL:
                return is_null(column, value.getBool());
            case ArrayOperator::INCLUDES_ALL:
            case ArrayOperator::EXCLUDES_ALL:
                // Vacuously true for every present array
                if (value.empty())
                    return is_null(column, false);
                break;
            case ArrayOperator::INCLUDES_ANY:
            case ArrayOperator::EXCLUDES_ANY:
                if (value.empty())
                    return SqlFragment::always_false();
                break;
            default:
                break;
            }
            return array_condition(column, o, value);
        },
        [&](JsonOperator o) {
            if (o == JsonOperator::IS_NULL)
                return is_null(column, value.getBool());
            if (o == JsonOperator::HAS_ANY_KEYS && value.empty())
                return SqlFragment::always_false();
            return json_condition(column, o, value);
        }
    );
}

QueryBody SqlAdapter::do_combine_and(std::vector<QueryBody> bodies) const {
    if (bodies.empty())
        return SqlFragment::always_true();

    std::vector<SqlFragment> fragments;
    fragments.reserve(bodies.size());
    for (auto& body : bodies)
        fragments.push_back(std::get<SqlFragment>(std::move(body)));

    auto joined = join_fragments(std::move(fragments), " AND ");
    joined.sql_ = fmt::format("({})", joined.sql_);
    return joined;
}

QueryBody SqlAdapter::do_combine_or(std::vector<QueryBody> bodies) const {
    if (bodies.empty())
        return SqlFragment::always_false();

    std::vector<SqlFragment> fragments;
    fragments.reserve(bodies.size());
    for (auto& body : bodies)
        fragments.push_back(std::get<SqlFragment>(std::move(body)));

    auto joined = join_fragments(std::move(fragments), " OR ");
    joined.sql_ = fmt::format("({})", joined.sql_);
    return joined;
}

QueryBody SqlAdapter::do_negate(QueryBody body) const {
    auto fragment = std::get<SqlFragment>(std::move(body));
    fragment.sql_ = fmt::format("NOT COALESCE({}, FALSE)", fragment.sql_);
    return fragment;
}

QueryBody SqlAdapter::do_match_all() const {
    return SqlFragment::always_true();
}

std::string SqlAdapter::do_signature(const QueryBody& body) const {
    const auto& fragment = std::get<SqlFragment>(body);
    Value params = Value::array;
    for (const auto& param : fragment.params_)
        params.push_back(param);

    return fmt::format("{}|{}", render(fragment), to_json(params));
}

} // namespace querygate::adapter::sql
