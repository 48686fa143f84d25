/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter_id.hpp>
#include <querygate/entity/field_type.hpp>
#include <querygate/entity/operators.hpp>

#include <bitset>
#include <compare>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace querygate::adapter {

enum class Feature : uint8_t {
    NATIVE_ARRAYS,
    JSON_ARRAYS,
    /// Set overlap on arrays, needed for _includes_any and _excludes_all on JSON-array backends
    ARRAY_OVERLAP,
    FULL_TEXT_SEARCH,
    TRIGRAM_SIMILARITY,
    FUZZY_TEXT,
    GEO_DISTANCE,
    JSON_OPERATORS,
    JSON_PATH,
    /// Plan-only introspection, enables cost estimation from the query planner
    EXPLAIN,
    CASE_INSENSITIVE_LIKE,
    COUNT
};

std::string_view feature_name(Feature feature);

struct ServerVersion {
    int major_ = 0;
    int minor_ = 0;
    int patch_ = 0;

    /// Lenient, "PostgreSQL 14.5 on x86_64" and "8.0.17-log" both parse. Unparseable input gives 0.0.0.
    static ServerVersion parse(std::string_view text);

    auto operator<=>(const ServerVersion&) const = default;
};

struct CapabilityLimits {
    /// Longest list accepted by membership operators, unbounded when unset
    std::optional<size_t> max_in_clause_items_;
};

/**
 * What one backend connection can express. Computed once per connection and cached by the CapabilityRegistry.
 */
class AdapterCapabilities {
public:
    explicit AdapterCapabilities(AdapterId adapter_id, std::string server_version = {});

    [[nodiscard]] AdapterId adapter_id() const { return adapter_id_; }
    [[nodiscard]] const std::string& server_version() const { return server_version_; }

    [[nodiscard]] bool has(Feature feature) const { return features_.test(static_cast<size_t>(feature)); }
    AdapterCapabilities& set_feature(Feature feature, bool enabled = true);

    [[nodiscard]] const std::vector<std::string>& extensions() const { return extensions_; }
    AdapterCapabilities& set_extensions(std::vector<std::string> extensions);

    AdapterCapabilities& add_operators(entity::FieldCategory category, entity::FieldKind kind, const std::vector<entity::Operator>& ops);

    [[nodiscard]] const entity::OperatorSet& supported_operators(entity::FieldCategory category, entity::FieldKind kind) const;

    [[nodiscard]] bool supports(const entity::FieldType& type, const entity::Operator& op) const;

    /// Backend-specific semantics that differ from the other adapters, listed by report()
    [[nodiscard]] const std::vector<std::string>& notes() const { return notes_; }
    AdapterCapabilities& add_note(std::string note);

    [[nodiscard]] const CapabilityLimits& limits() const { return limits_; }
    AdapterCapabilities& set_max_in_clause_items(std::optional<size_t> max_items);

    /// Raises E_FEATURE_UNAVAILABLE naming the feature if it is not available
    void require(Feature feature) const;

    /// Human readable summary, one line per feature and per operator table entry
    [[nodiscard]] std::string report() const;

private:
    AdapterId adapter_id_;
    std::string server_version_;
    std::vector<std::string> extensions_;
    std::bitset<static_cast<size_t>(Feature::COUNT)> features_;
    std::map<std::pair<entity::FieldCategory, entity::FieldKind>, entity::OperatorSet> operators_;
    std::vector<std::string> notes_;
    CapabilityLimits limits_;
};

} // namespace querygate::adapter

namespace fmt {
template<>
struct formatter<querygate::adapter::Feature> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(querygate::adapter::Feature feature, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}", querygate::adapter::feature_name(feature));
    }
};

template<>
struct formatter<querygate::adapter::ServerVersion> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const querygate::adapter::ServerVersion& version, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}.{}.{}", version.major_, version.minor_, version.patch_);
    }
};
}
