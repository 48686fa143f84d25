/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/entity/field_descriptor.hpp>
#include <querygate/filter/filter_expression.hpp>

#include <string_view>

namespace querygate::filter {

/**
 * Builds a FilterExpression from the structured input document:
 *
 *   { "_and": [ <filter>, ... ], "_or": [ <filter>, ... ], "_not": <filter>,
 *     "<field>": { "<operator>": <value>, ... }, ... }
 *
 * Sibling keys are implicitly ANDed. Only structural validity is established here, authorization and backend
 * capabilities are checked by the QueryBuilder. Raises a StructuralException on malformed input.
 */
FilterExpression parse(const Value& raw, const entity::FieldDescriptorTable& fields);

FilterExpression parse_json(std::string_view text, const entity::FieldDescriptorTable& fields);

} // namespace querygate::filter
