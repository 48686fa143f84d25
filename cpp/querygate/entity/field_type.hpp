/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <fmt/format.h>

#include <cstdint>
#include <string_view>

namespace querygate::entity {

/// Decides which operator vocabulary applies to a field
enum class FieldCategory : uint8_t {
    SCALAR,
    ARRAY,
    JSON
};

enum class FieldKind : uint8_t {
    STRING,
    INTEGER,
    FLOAT,
    BOOLEAN,
    DATE,
    DATETIME,
    ID,
    ENUM,
    COORDINATES,
    JSON
};

std::string_view field_category_name(FieldCategory category);
std::string_view field_kind_name(FieldKind kind);

/**
 * Semantic type of a filterable field. Array fields carry the kind of their elements.
 */
struct FieldType {
    FieldCategory category_ = FieldCategory::SCALAR;
    FieldKind kind_ = FieldKind::STRING;

    static constexpr FieldType scalar(FieldKind kind) {
        return {FieldCategory::SCALAR, kind};
    }

    static constexpr FieldType array(FieldKind inner) {
        return {FieldCategory::ARRAY, inner};
    }

    static constexpr FieldType json() {
        return {FieldCategory::JSON, FieldKind::JSON};
    }

    [[nodiscard]] constexpr bool is_array() const { return category_ == FieldCategory::ARRAY; }

    bool operator==(const FieldType&) const = default;
};

} // namespace querygate::entity

namespace fmt {
template<>
struct formatter<querygate::entity::FieldCategory> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(querygate::entity::FieldCategory category, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", querygate::entity::field_category_name(category));
    }
};

template<>
struct formatter<querygate::entity::FieldKind> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(querygate::entity::FieldKind kind, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", querygate::entity::field_kind_name(kind));
    }
};

template<>
struct formatter<querygate::entity::FieldType> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const querygate::entity::FieldType& type, FormatContext &ctx) const {
        using querygate::entity::FieldCategory;
        switch (type.category_) {
        case FieldCategory::ARRAY:
            return fmt::format_to(ctx.out(), "Array({})", type.kind_);
        case FieldCategory::JSON:
            return fmt::format_to(ctx.out(), "Json");
        default:
            return fmt::format_to(ctx.out(), "{}", type.kind_);
        }
    }
};
}
