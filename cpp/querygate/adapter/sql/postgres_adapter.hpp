/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/sql/sql_adapter.hpp>

namespace querygate::adapter::sql {

class PostgresAdapter final : public SqlAdapter {
public:
    using SqlAdapter::SqlAdapter;

protected:
    [[nodiscard]] std::string quote_identifier(std::string_view identifier) const override;
    [[nodiscard]] std::string_view explain_prefix() const override;
    /// ? becomes $1, $2, ...
    [[nodiscard]] std::string render_placeholders(const std::string& sql) const override;
    [[nodiscard]] SqlFragment pattern_match(const std::string& column, std::string like_pattern, bool case_insensitive, bool negated) const override;
    [[nodiscard]] SqlFragment array_condition(const std::string& column, entity::ArrayOperator op, const Value& value) const override;
    [[nodiscard]] SqlFragment json_condition(const std::string& column, entity::JsonOperator op, const Value& value) const override;
    [[nodiscard]] SqlFragment advanced_condition(const std::string& column, entity::ScalarOperator op, const Value& value) const override;
};

} // namespace querygate::adapter::sql
