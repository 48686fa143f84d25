/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace querygate::adapter {

enum class AdapterId : uint8_t {
    POSTGRES,
    MYSQL,
    SQLITE,
    ELASTICSEARCH,
    MEMORY
};

inline constexpr std::array<AdapterId, 5> all_adapter_ids{
    AdapterId::POSTGRES, AdapterId::MYSQL, AdapterId::SQLITE, AdapterId::ELASTICSEARCH, AdapterId::MEMORY
};

constexpr std::string_view adapter_id_name(AdapterId id) {
    switch (id) {
    case AdapterId::POSTGRES: return "postgres";
    case AdapterId::MYSQL: return "mysql";
    case AdapterId::SQLITE: return "sqlite";
    case AdapterId::ELASTICSEARCH: return "elasticsearch";
    case AdapterId::MEMORY: return "memory";
    }
    return "unknown";
}

} // namespace querygate::adapter

namespace fmt {
template<>
struct formatter<querygate::adapter::AdapterId> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(querygate::adapter::AdapterId id, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", querygate::adapter::adapter_id_name(id));
    }
};
}
