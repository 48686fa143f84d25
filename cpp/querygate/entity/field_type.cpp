/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/entity/field_type.hpp>
#include <querygate/util/preconditions.hpp>

namespace querygate::entity {

std::string_view field_category_name(FieldCategory category) {
    switch (category) {
    case FieldCategory::SCALAR: return "SCALAR";
    case FieldCategory::ARRAY: return "ARRAY";
    case FieldCategory::JSON: return "JSON";
    }
    util::raise_rte("Unknown field category {}", static_cast<int>(category));
}

std::string_view field_kind_name(FieldKind kind) {
    switch (kind) {
    case FieldKind::STRING: return "STRING";
    case FieldKind::INTEGER: return "INTEGER";
    case FieldKind::FLOAT: return "FLOAT";
    case FieldKind::BOOLEAN: return "BOOLEAN";
    case FieldKind::DATE: return "DATE";
    case FieldKind::DATETIME: return "DATETIME";
    case FieldKind::ID: return "ID";
    case FieldKind::ENUM: return "ENUM";
    case FieldKind::COORDINATES: return "COORDINATES";
    case FieldKind::JSON: return "JSON";
    }
    util::raise_rte("Unknown field kind {}", static_cast<int>(kind));
}

} // namespace querygate::entity
