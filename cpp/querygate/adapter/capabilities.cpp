/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/capabilities.hpp>
#include <querygate/util/preconditions.hpp>

#include <fmt/ranges.h>

#include <cctype>

namespace querygate::adapter {

std::string_view feature_name(Feature feature) {
    switch (feature) {
    case Feature::NATIVE_ARRAYS: return "native_arrays";
    case Feature::JSON_ARRAYS: return "json_arrays";
    case Feature::ARRAY_OVERLAP: return "array_overlap";
    case Feature::FULL_TEXT_SEARCH: return "full_text_search";
    case Feature::TRIGRAM_SIMILARITY: return "trigram_similarity";
    case Feature::FUZZY_TEXT: return "fuzzy_text";
    case Feature::GEO_DISTANCE: return "geo_distance";
    case Feature::JSON_OPERATORS: return "json_operators";
    case Feature::JSON_PATH: return "json_path";
    case Feature::EXPLAIN: return "explain";
    case Feature::CASE_INSENSITIVE_LIKE: return "case_insensitive_like";
    case Feature::COUNT: break;
    }
    util::raise_rte("Unknown feature {}", static_cast<int>(feature));
}

ServerVersion ServerVersion::parse(std::string_view text) {
    ServerVersion version;
    auto pos = text.find_first_of("0123456789");
    if (pos == std::string_view::npos)
        return version;

    int* parts[] = {&version.major_, &version.minor_, &version.patch_};
    for (auto* part : parts) {
        if (pos >= text.size() || !std::isdigit(static_cast<unsigned char>(text[pos])))
            break;

        int value = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            value = value * 10 + (text[pos] - '0');
            ++pos;
        }
        *part = value;
        if (pos >= text.size() || text[pos] != '.')
            break;
        ++pos;
    }
    return version;
}

AdapterCapabilities::AdapterCapabilities(AdapterId adapter_id, std::string server_version) :
    adapter_id_(adapter_id),
    server_version_(std::move(server_version)) {
}

AdapterCapabilities& AdapterCapabilities::set_feature(Feature feature, bool enabled) {
    util::check_arg(feature != Feature::COUNT, "Feature::COUNT is not a feature");
    features_.set(static_cast<size_t>(feature), enabled);
    return *this;
}

AdapterCapabilities& AdapterCapabilities::set_extensions(std::vector<std::string> extensions) {
    extensions_ = std::move(extensions);
    return *this;
}

AdapterCapabilities& AdapterCapabilities::add_operators(
        entity::FieldCategory category,
        entity::FieldKind kind,
        const std::vector<entity::Operator>& ops) {
    auto& target = operators_[{category, kind}];
    for (const auto& op : ops) {
        util::check_arg(entity::operator_category(op) == category,
            "Operator {} does not belong to category {}", op, category);
        target.insert(op);
    }
    return *this;
}

const entity::OperatorSet& AdapterCapabilities::supported_operators(entity::FieldCategory category, entity::FieldKind kind) const {
    static const entity::OperatorSet empty;
    if (auto it = operators_.find({category, kind}); it != operators_.end())
        return it->second;

    return empty;
}

bool AdapterCapabilities::supports(const entity::FieldType& type, const entity::Operator& op) const {
    return supported_operators(type.category_, type.kind_).contains(op);
}

AdapterCapabilities& AdapterCapabilities::add_note(std::string note) {
    notes_.push_back(std::move(note));
    return *this;
}

AdapterCapabilities& AdapterCapabilities::set_max_in_clause_items(std::optional<size_t> max_items) {
    limits_.max_in_clause_items_ = max_items;
    return *this;
}

void AdapterCapabilities::require(Feature feature) const {
    capability::check<ErrorCode::E_FEATURE_UNAVAILABLE>(has(feature),
        "Feature {} is not available on {} (server version '{}')", feature, adapter_id_, server_version_);
}

std::string AdapterCapabilities::report() const {
    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "Adapter: {}\n", adapter_id_);
    fmt::format_to(std::back_inserter(out), "Server version: {}\n", server_version_.empty() ? "unknown" : server_version_);
    if (!extensions_.empty())
        fmt::format_to(std::back_inserter(out), "Extensions: {}\n", fmt::join(extensions_, ", "));

    fmt::format_to(std::back_inserter(out), "Features:\n");
    for (size_t i = 0; i < static_cast<size_t>(Feature::COUNT); ++i) {
        const auto feature = static_cast<Feature>(i);
        fmt::format_to(std::back_inserter(out), "  {} {}\n", has(feature) ? "[x]" : "[ ]", feature);
    }

    if (limits_.max_in_clause_items_)
        fmt::format_to(std::back_inserter(out), "Max list items: {}\n", *limits_.max_in_clause_items_);

    fmt::format_to(std::back_inserter(out), "Operators:\n");
    for (const auto& [key, ops] : operators_) {
        if (ops.empty())
            continue;

        std::vector<std::string_view> symbols;
        symbols.reserve(ops.size());
        for (const auto& op : ops)
            symbols.push_back(entity::operator_symbol(op));

        const auto& [category, kind] = key;
        fmt::format_to(std::back_inserter(out), "  {}/{}: {}\n", category, kind, fmt::join(symbols, " "));
    }

    if (!notes_.empty()) {
        fmt::format_to(std::back_inserter(out), "Notes:\n");
        for (const auto& note : notes_)
            fmt::format_to(std::back_inserter(out), "  {}\n", note);
    }
    return fmt::to_string(out);
}

} // namespace querygate::adapter
