/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <querygate/adapter/capability_detection.hpp>
#include <querygate/adapter/capability_registry.hpp>
#include <querygate/adapter/mock/fake_connector.hpp>

using namespace querygate;
using namespace querygate::adapter;
using namespace querygate::entity;

namespace {

ConnectionDescriptor connection(std::string id, std::shared_ptr<BackendConnector> connector) {
    return ConnectionDescriptor{std::move(id), std::move(connector)};
}

proto::config::AdapterRegistryConfig registry_config(bool fallback) {
    proto::config::AdapterRegistryConfig config;
    auto* mapping = config.add_connector_mapping();
    mapping->set_connector_type("postgrex");
    mapping->set_adapter(proto::config::POSTGRES);
    mapping = config.add_connector_mapping();
    mapping->set_connector_type("myxql");
    mapping->set_adapter(proto::config::MYSQL);
    config.set_fallback_unknown_to_memory(fallback);
    return config;
}

} // namespace

TEST(ServerVersion, ParsesLeniently) {
    EXPECT_EQ(ServerVersion::parse("PostgreSQL 14.5 on x86_64-pc-linux-gnu"), (ServerVersion{14, 5, 0}));
    EXPECT_EQ(ServerVersion::parse("8.0.17-log"), (ServerVersion{8, 0, 17}));
    EXPECT_EQ(ServerVersion::parse("3.40.1"), (ServerVersion{3, 40, 1}));
    EXPECT_EQ(ServerVersion::parse("unknown"), (ServerVersion{}));
    EXPECT_LT(ServerVersion::parse("8.0.16"), (ServerVersion{8, 0, 17}));
    EXPECT_EQ(fmt::format("{}", ServerVersion::parse("12.1")), "12.1.0");
}

TEST(CapabilityDetection, PostgresFeaturesFollowVersionAndExtensions) {
    auto modern = build_capabilities(AdapterId::POSTGRES, "14.5", {"pg_trgm"});
    EXPECT_TRUE(modern.has(Feature::EXPLAIN));
    EXPECT_TRUE(modern.has(Feature::JSON_PATH));
    EXPECT_TRUE(modern.has(Feature::TRIGRAM_SIMILARITY));
    EXPECT_FALSE(modern.has(Feature::GEO_DISTANCE));
    EXPECT_TRUE(modern.supports(FieldType::scalar(FieldKind::STRING), ScalarOperator::SIMILAR));
    EXPECT_FALSE(modern.supports(FieldType::scalar(FieldKind::COORDINATES), ScalarOperator::WITHIN_DISTANCE));
    EXPECT_TRUE(modern.supports(FieldType::array(FieldKind::STRING), ArrayOperator::INCLUDES_ALL));

    auto old = build_capabilities(AdapterId::POSTGRES, "9.3.2", {});
    EXPECT_FALSE(old.has(Feature::JSON_OPERATORS));
    EXPECT_FALSE(old.supports(FieldType::json(), JsonOperator::HAS_KEY));
    EXPECT_TRUE(old.supports(FieldType::json(), JsonOperator::IS_NULL));
    EXPECT_THROW(old.require(Feature::JSON_PATH), QuerygateSpecificException<ErrorCode::E_FEATURE_UNAVAILABLE>);
    EXPECT_NO_THROW(old.require(Feature::EXPLAIN));
}

TEST(CapabilityDetection, RelationalJsonArrays) {
    auto mysql = build_capabilities(AdapterId::MYSQL, "8.0.32", {});
    const auto tags = FieldType::array(FieldKind::STRING);
    EXPECT_TRUE(mysql.supports(tags, ArrayOperator::INCLUDES));
    EXPECT_TRUE(mysql.supports(tags, ArrayOperator::INCLUDES_ANY));
    EXPECT_FALSE(mysql.supports(tags, ArrayOperator::INCLUDES_ALL));
    EXPECT_FALSE(mysql.supports(tags, ArrayOperator::EXCLUDES_ANY));
    EXPECT_FALSE(build_capabilities(AdapterId::MYSQL, "8.0.16", {}).supports(tags, ArrayOperator::INCLUDES_ANY));

    auto sqlite = build_capabilities(AdapterId::SQLITE, "3.40.0", {});
    EXPECT_FALSE(sqlite.has(Feature::EXPLAIN));
    EXPECT_TRUE(sqlite.supports(tags, ArrayOperator::INCLUDES));
    EXPECT_EQ(sqlite.limits().max_in_clause_items_, 999u);

    auto legacy_sqlite = build_capabilities(AdapterId::SQLITE, "3.30.0", {});
    EXPECT_FALSE(legacy_sqlite.supports(tags, ArrayOperator::INCLUDES));
    EXPECT_TRUE(legacy_sqlite.supports(tags, ArrayOperator::IS_NULL));
}

TEST(CapabilityDetection, MemoryHasNoAdvancedText) {
    auto memory = build_capabilities(AdapterId::MEMORY, "", {});
    EXPECT_FALSE(memory.supports(FieldType::scalar(FieldKind::STRING), ScalarOperator::MATCHES));
    EXPECT_TRUE(memory.supports(FieldType::scalar(FieldKind::STRING), ScalarOperator::ICONTAINS));
    EXPECT_FALSE(memory.limits().max_in_clause_items_.has_value());
    EXPECT_THAT(memory.report(), testing::HasSubstr("[ ] explain"));
}

TEST(CapabilityDetection, ElasticsearchReportsEmptyArraySemantics) {
    auto search = build_capabilities(AdapterId::ELASTICSEARCH, "8.11.0", {});
    ASSERT_EQ(search.notes().size(), 1u);
    EXPECT_THAT(search.report(), testing::HasSubstr("Notes:\n  _is_empty: true matches documents with no indexed values"));

    auto postgres = build_capabilities(AdapterId::POSTGRES, "14.5", {});
    EXPECT_TRUE(postgres.notes().empty());
    EXPECT_THAT(postgres.report(), testing::Not(testing::HasSubstr("Notes:")));
}

TEST(CapabilityRegistry, Selection) {
    CapabilityRegistry registry{registry_config(false)};
    auto postgrex = std::make_shared<FakeConnector>("postgrex", "14.5");
    auto sqlite = std::make_shared<FakeConnector>("sqlite", "3.40.0");
    auto odbc = std::make_shared<FakeConnector>("odbc");

    EXPECT_EQ(registry.select(connection("a", postgrex)), AdapterId::POSTGRES);
    EXPECT_EQ(registry.select(connection("b", sqlite)), AdapterId::SQLITE);
    EXPECT_EQ(registry.select(connection("c", nullptr)), AdapterId::MEMORY);
    EXPECT_EQ(registry.select(connection("d", odbc), AdapterId::ELASTICSEARCH), AdapterId::ELASTICSEARCH);
    EXPECT_THROW(registry.select(connection("d", odbc)), QuerygateSpecificException<ErrorCode::E_NO_ADAPTER_MAPPING>);
}

TEST(CapabilityRegistry, UnknownConnectorFallsBackWhenConfigured) {
    CapabilityRegistry registry{registry_config(true)};
    auto odbc = std::make_shared<FakeConnector>("odbc");
    EXPECT_EQ(registry.select(connection("d", odbc)), AdapterId::MEMORY);
    EXPECT_EQ(registry.resolve(connection("d", odbc))->id(), AdapterId::MEMORY);
}

TEST(CapabilityRegistry, InvalidMappings) {
    proto::config::AdapterRegistryConfig unnamed;
    unnamed.add_connector_mapping()->set_adapter(proto::config::MYSQL);
    EXPECT_THROW(CapabilityRegistry{unnamed}, UserInputException);

    proto::config::AdapterRegistryConfig unspecified;
    unspecified.add_connector_mapping()->set_connector_type("jdbc");
    EXPECT_THROW(CapabilityRegistry{unspecified}, AdapterSelectionException);
}

TEST(CapabilityRegistry, DetectsOncePerConnection) {
    CapabilityRegistry registry{registry_config(false)};
    auto connector = std::make_shared<FakeConnector>("postgrex", "PostgreSQL 15.2", std::vector<std::string>{"postgis"});
    auto conn = connection("primary", connector);

    auto first = registry.resolve(conn);
    auto second = registry.resolve(conn);
    EXPECT_EQ(first, second);
    EXPECT_EQ(connector->calls(ConnectorOperation::SERVER_VERSION), 1u);
    EXPECT_EQ(connector->calls(ConnectorOperation::EXTENSIONS), 1u);
    EXPECT_TRUE(registry.detect(conn).has(Feature::GEO_DISTANCE));
    EXPECT_EQ(first->connector(), connector);

    // A different connection id has its own entry
    registry.resolve(connection("replica", connector));
    EXPECT_EQ(connector->calls(ConnectorOperation::SERVER_VERSION), 2u);
    EXPECT_EQ(registry.size(), 2u);

    registry.invalidate("primary");
    EXPECT_EQ(registry.size(), 1u);
    auto third = registry.resolve(conn);
    EXPECT_NE(first, third);
    EXPECT_EQ(connector->calls(ConnectorOperation::SERVER_VERSION), 3u);
}

TEST(CapabilityRegistry, FailedProbeLeavesBaseFeatures) {
    CapabilityRegistry registry;
    auto connector = std::make_shared<FakeConnector>("postgres", "16.0", std::vector<std::string>{"pg_trgm"});
    connector->fail(ConnectorOperation::SERVER_VERSION);
    connector->fail(ConnectorOperation::EXTENSIONS);

    auto caps = registry.detect(connection("flaky", connector));
    EXPECT_EQ(caps.adapter_id(), AdapterId::POSTGRES);
    EXPECT_TRUE(caps.has(Feature::EXPLAIN));
    EXPECT_TRUE(caps.has(Feature::NATIVE_ARRAYS));
    EXPECT_FALSE(caps.has(Feature::JSON_OPERATORS));
    EXPECT_FALSE(caps.has(Feature::TRIGRAM_SIMILARITY));
    EXPECT_NO_THROW(registry.log_report(connection("flaky", connector)));
}
