/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/adapter/capability_detection.hpp>
#include <querygate/log/log.hpp>

#include <algorithm>

namespace querygate::adapter {

using namespace entity;

namespace {

constexpr FieldKind SCALAR_KINDS[] = {
    FieldKind::STRING, FieldKind::INTEGER, FieldKind::FLOAT, FieldKind::BOOLEAN, FieldKind::DATE,
    FieldKind::DATETIME, FieldKind::ID, FieldKind::ENUM, FieldKind::COORDINATES
};

bool has_extension(const std::vector<std::string>& extensions, std::string_view name) {
    return std::find(extensions.begin(), extensions.end(), name) != extensions.end();
}

void set_features(AdapterCapabilities& caps, const ServerVersion& version, const std::vector<std::string>& extensions) {
    switch (caps.adapter_id()) {
    case AdapterId::POSTGRES:
        caps.set_feature(Feature::NATIVE_ARRAYS)
            .set_feature(Feature::ARRAY_OVERLAP)
            .set_feature(Feature::EXPLAIN)
            .set_feature(Feature::CASE_INSENSITIVE_LIKE)
            .set_feature(Feature::FULL_TEXT_SEARCH, version >= ServerVersion{8, 3, 0})
            .set_feature(Feature::JSON_OPERATORS, version >= ServerVersion{9, 4, 0})
            .set_feature(Feature::JSON_PATH, version >= ServerVersion{12, 0, 0})
            .set_feature(Feature::TRIGRAM_SIMILARITY, has_extension(extensions, "pg_trgm"))
            .set_feature(Feature::GEO_DISTANCE, has_extension(extensions, "postgis"))
            .set_max_in_clause_items(10000);
        break;
    case AdapterId::MYSQL:
        caps.set_feature(Feature::JSON_ARRAYS)
            .set_feature(Feature::EXPLAIN)
            .set_feature(Feature::CASE_INSENSITIVE_LIKE)
            .set_feature(Feature::FULL_TEXT_SEARCH, version >= ServerVersion{5, 6, 0})
            .set_feature(Feature::JSON_OPERATORS, version >= ServerVersion{5, 7, 0})
            .set_feature(Feature::JSON_PATH, version >= ServerVersion{5, 7, 0})
            .set_feature(Feature::GEO_DISTANCE, version >= ServerVersion{5, 7, 0})
            .set_feature(Feature::ARRAY_OVERLAP, version >= ServerVersion{8, 0, 17})
            .set_max_in_clause_items(10000);
        break;
    case AdapterId::SQLITE: {
        const bool json = has_extension(extensions, "json1") || version >= ServerVersion{3, 38, 0};
        caps.set_feature(Feature::CASE_INSENSITIVE_LIKE)
            .set_feature(Feature::JSON_ARRAYS, json)
            .set_feature(Feature::ARRAY_OVERLAP, json)
            .set_feature(Feature::JSON_OPERATORS, json)
            .set_feature(Feature::JSON_PATH, json)
            .set_feature(Feature::FULL_TEXT_SEARCH, has_extension(extensions, "fts5"))
            .set_max_in_clause_items(999);
        break;
    }
    case AdapterId::ELASTICSEARCH:
        caps.set_feature(Feature::NATIVE_ARRAYS)
            .set_feature(Feature::ARRAY_OVERLAP)
            .set_feature(Feature::CASE_INSENSITIVE_LIKE)
            .set_feature(Feature::FULL_TEXT_SEARCH)
            .set_feature(Feature::FUZZY_TEXT)
            .set_feature(Feature::GEO_DISTANCE)
            .set_feature(Feature::JSON_OPERATORS)
            .set_feature(Feature::JSON_PATH)
            .set_max_in_clause_items(65536)
            .add_note("_is_empty: true matches documents with no indexed values, so null and missing arrays count as empty");
        break;
    case AdapterId::MEMORY:
        caps.set_feature(Feature::NATIVE_ARRAYS)
            .set_feature(Feature::ARRAY_OVERLAP)
            .set_feature(Feature::CASE_INSENSITIVE_LIKE)
            .set_feature(Feature::JSON_OPERATORS)
            .set_feature(Feature::JSON_PATH);
        break;
    }
}

std::vector<Operator> scalar_operators(const AdapterCapabilities& caps, FieldKind kind) {
    std::vector<Operator> ops{ScalarOperator::IS_NULL};
    switch (kind) {
    case FieldKind::STRING:
        ops.insert(ops.end(), {
            ScalarOperator::EQ, ScalarOperator::NEQ, ScalarOperator::IN, ScalarOperator::NIN,
            ScalarOperator::LIKE, ScalarOperator::NLIKE, ScalarOperator::STARTS_WITH, ScalarOperator::ENDS_WITH,
            ScalarOperator::CONTAINS});
        if (caps.has(Feature::CASE_INSENSITIVE_LIKE)) {
            ops.insert(ops.end(), {
                ScalarOperator::ILIKE, ScalarOperator::NILIKE, ScalarOperator::ISTARTS_WITH,
                ScalarOperator::IENDS_WITH, ScalarOperator::ICONTAINS});
        }
        if (caps.has(Feature::FULL_TEXT_SEARCH))
            ops.emplace_back(ScalarOperator::MATCHES);
        if (caps.has(Feature::TRIGRAM_SIMILARITY))
            ops.emplace_back(ScalarOperator::SIMILAR);
        if (caps.has(Feature::FUZZY_TEXT))
            ops.emplace_back(ScalarOperator::FUZZY);
        break;
    case FieldKind::INTEGER:
    case FieldKind::FLOAT:
    case FieldKind::DATE:
    case FieldKind::DATETIME:
        ops.insert(ops.end(), {
            ScalarOperator::EQ, ScalarOperator::NEQ, ScalarOperator::GT, ScalarOperator::GTE,
            ScalarOperator::LT, ScalarOperator::LTE, ScalarOperator::IN, ScalarOperator::NIN});
        break;
    case FieldKind::ID:
    case FieldKind::ENUM:
        ops.insert(ops.end(), {ScalarOperator::EQ, ScalarOperator::NEQ, ScalarOperator::IN, ScalarOperator::NIN});
        break;
    case FieldKind::BOOLEAN:
        ops.insert(ops.end(), {ScalarOperator::EQ, ScalarOperator::NEQ});
        break;
    case FieldKind::COORDINATES:
        if (caps.has(Feature::GEO_DISTANCE))
            ops.emplace_back(ScalarOperator::WITHIN_DISTANCE);
        break;
    case FieldKind::JSON:
        break;
    }
    return ops;
}

std::vector<Operator> array_operators(const AdapterCapabilities& caps) {
    if (caps.has(Feature::NATIVE_ARRAYS))
        return all_operators(FieldCategory::ARRAY);

    std::vector<Operator> ops{ArrayOperator::IS_NULL};
    if (caps.has(Feature::JSON_ARRAYS)) {
        ops.insert(ops.end(), {ArrayOperator::INCLUDES, ArrayOperator::EXCLUDES, ArrayOperator::IS_EMPTY});
        if (caps.has(Feature::ARRAY_OVERLAP))
            ops.insert(ops.end(), {ArrayOperator::INCLUDES_ANY, ArrayOperator::EXCLUDES_ALL});
    }
    return ops;
}

std::vector<Operator> json_operators(const AdapterCapabilities& caps) {
    std::vector<Operator> ops{JsonOperator::IS_NULL};
    if (caps.has(Feature::JSON_OPERATORS))
        ops.insert(ops.end(), {JsonOperator::HAS_KEY, JsonOperator::HAS_ANY_KEYS});
    if (caps.has(Feature::JSON_PATH))
        ops.emplace_back(JsonOperator::PATH_EXISTS);
    return ops;
}

} // namespace

AdapterCapabilities build_capabilities(AdapterId id, const std::string& server_version, const std::vector<std::string>& extensions) {
    AdapterCapabilities caps{id, server_version};
    caps.set_extensions(extensions);
    set_features(caps, ServerVersion::parse(server_version), extensions);

    for (auto kind : SCALAR_KINDS) {
        caps.add_operators(FieldCategory::SCALAR, kind, scalar_operators(caps, kind));
        caps.add_operators(FieldCategory::ARRAY, kind, array_operators(caps));
    }
    caps.add_operators(FieldCategory::JSON, FieldKind::JSON, json_operators(caps));
    return caps;
}

AdapterCapabilities detect_capabilities(AdapterId id, BackendConnector* connector) {
    std::string version;
    std::vector<std::string> extensions;
    if (connector != nullptr) {
        try {
            version = connector->server_version();
        } catch (const std::exception& e) {
            log::capability().warn("Failed to read the {} server version, assuming the base feature set: {}", id, e.what());
        }
        try {
            extensions = connector->installed_extensions();
        } catch (const std::exception& e) {
            log::capability().warn("Failed to list {} extensions, assuming none are installed: {}", id, e.what());
        }
    }

    auto caps = build_capabilities(id, version, extensions);
    log::capability().debug("Detected {} capabilities for server version '{}' with {} extensions",
                             id, version, extensions.size());
    return caps;
}

} // namespace querygate::adapter
