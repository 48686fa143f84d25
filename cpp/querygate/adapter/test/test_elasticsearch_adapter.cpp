/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <querygate/adapter/adapter_factory.hpp>
#include <querygate/adapter/capability_detection.hpp>
#include <querygate/adapter/search/elasticsearch_adapter.hpp>

#include <folly/json.h>

using namespace querygate;
using namespace querygate::adapter;
using namespace querygate::adapter::search;
using namespace querygate::entity;

namespace {

class ElasticsearchAdapterTest : public testing::Test {
protected:
    ElasticsearchAdapterTest() :
        adapter_(std::dynamic_pointer_cast<ElasticsearchAdapter>(
            create_adapter(build_capabilities(AdapterId::ELASTICSEARCH, "8.11.0", {})))) {
    }

    Value clause(const CompiledQuery& query) const {
        return query.as<SearchQuery>().clause_;
    }

    static Value json(std::string_view text) {
        return folly::parseJson(folly::StringPiece{text.data(), text.size()});
    }

    std::shared_ptr<ElasticsearchAdapter> adapter_;
    const FieldDescriptor status_ = FieldDescriptor::storage("status", FieldType::scalar(FieldKind::STRING));
    const FieldDescriptor age_ = FieldDescriptor::storage("age", FieldType::scalar(FieldKind::INTEGER));
    const FieldDescriptor tags_ = FieldDescriptor::storage("tags", FieldType::array(FieldKind::STRING));
    const FieldDescriptor meta_ = FieldDescriptor::storage("meta", FieldType::json());
    const FieldDescriptor location_ = FieldDescriptor::storage("location", FieldType::scalar(FieldKind::COORDINATES));
    const FieldDescriptor author_ = FieldDescriptor::associated("author", FieldType::scalar(FieldKind::STRING), "author", "name");
};

} // namespace

TEST_F(ElasticsearchAdapterTest, TermLevelClauses) {
    ASSERT_TRUE(adapter_);
    EXPECT_EQ(clause(adapter_->apply_operator(status_, ScalarOperator::EQ, "active")),
              json(R"({"term": {"status": "active"}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(age_, ScalarOperator::GTE, 18)),
              json(R"({"range": {"age": {"gte": 18}}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(status_, ScalarOperator::IN, Value::array("a", "b"))),
              json(R"({"terms": {"status": ["a", "b"]}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(status_, ScalarOperator::IS_NULL, false)),
              json(R"({"exists": {"field": "status"}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(author_, ScalarOperator::EQ, "Knuth")),
              json(R"({"term": {"author.name": "Knuth"}})"));
}

TEST_F(ElasticsearchAdapterTest, NegativesRequirePresence) {
    EXPECT_EQ(clause(adapter_->apply_operator(status_, ScalarOperator::NEQ, "banned")),
              json(R"({"bool": {"filter": [{"exists": {"field": "status"}}],
                                "must_not": [{"term": {"status": "banned"}}]}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(status_, ScalarOperator::NIN, Value::array())),
              json(R"({"exists": {"field": "status"}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(status_, ScalarOperator::IN, Value::array())), SearchQuery::match_none().clause_);
}

TEST_F(ElasticsearchAdapterTest, Patterns) {
    EXPECT_EQ(clause(adapter_->apply_operator(status_, ScalarOperator::ILIKE, "Jo%")),
              json(R"({"wildcard": {"status": {"value": "Jo*", "case_insensitive": true}}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(status_, ScalarOperator::STARTS_WITH, "ab")),
              json(R"({"prefix": {"status": {"value": "ab", "case_insensitive": false}}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(status_, ScalarOperator::CONTAINS, "a*b")),
              json(R"({"wildcard": {"status": {"value": "*a\\*b*", "case_insensitive": false}}})"));
    EXPECT_EQ(like_to_wildcard(R"(a\%b_c*)"), R"(a%b?c\*)");
}

TEST_F(ElasticsearchAdapterTest, AdvancedClauses) {
    EXPECT_EQ(clause(adapter_->apply_operator(status_, ScalarOperator::FUZZY, "jonh")),
              json(R"({"fuzzy": {"status": {"value": "jonh", "fuzziness": "AUTO"}}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(status_, ScalarOperator::MATCHES, "quick fox")),
              json(R"({"match": {"status": {"query": "quick fox"}}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(location_, ScalarOperator::WITHIN_DISTANCE,
                                              json(R"({"lat": 51.5, "lon": -0.1, "distance": 500})"))),
              json(R"({"geo_distance": {"distance": "500m", "location": {"lat": 51.5, "lon": -0.1}}})"));
    EXPECT_FALSE(adapter_->capabilities().supports(status_.type_, ScalarOperator::SIMILAR));
}

TEST_F(ElasticsearchAdapterTest, ArraysAndDocuments) {
    EXPECT_EQ(clause(adapter_->apply_operator(tags_, ArrayOperator::INCLUDES_ALL, Value::array("a", "b"))),
              json(R"({"bool": {"filter": [{"term": {"tags": "a"}}, {"term": {"tags": "b"}}]}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(tags_, ArrayOperator::INCLUDES_ALL, Value::array())),
              json(R"({"exists": {"field": "tags"}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(tags_, ArrayOperator::EXCLUDES_ANY, Value::array())), SearchQuery::match_none().clause_);
    EXPECT_EQ(clause(adapter_->apply_operator(tags_, ArrayOperator::IS_EMPTY, true)),
              json(R"({"bool": {"must_not": [{"exists": {"field": "tags"}}]}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(meta_, JsonOperator::HAS_KEY, "owner")),
              json(R"({"exists": {"field": "meta.owner"}})"));
    EXPECT_EQ(clause(adapter_->apply_operator(meta_, JsonOperator::PATH_EXISTS, "$.a.b[0]")),
              json(R"({"exists": {"field": "meta.a.b"}})"));
    EXPECT_EQ(json_path_to_field("meta", R"($."x".y)"), "meta.x.y");
}

TEST_F(ElasticsearchAdapterTest, Combinators) {
    auto eq = adapter_->apply_operator(status_, ScalarOperator::EQ, "active");
    auto adult = adapter_->apply_operator(age_, ScalarOperator::GTE, 18);

    EXPECT_EQ(clause(adapter_->combine_and({eq, adult})),
              json(R"({"bool": {"filter": [{"term": {"status": "active"}}, {"range": {"age": {"gte": 18}}}]}})"));
    EXPECT_EQ(clause(adapter_->combine_or({eq, adult})),
              json(R"({"bool": {"should": [{"term": {"status": "active"}}, {"range": {"age": {"gte": 18}}}],
                                "minimum_should_match": 1}})"));
    EXPECT_EQ(clause(adapter_->negate(eq)), json(R"({"bool": {"must_not": [{"term": {"status": "active"}}]}})"));
    EXPECT_EQ(clause(adapter_->combine_and({})), json(R"({"match_all": {}})"));
    EXPECT_EQ(clause(adapter_->combine_or({})), SearchQuery::match_none().clause_);
    EXPECT_EQ(adapter_->signature(eq), R"({"term":{"status":"active"}})");
}

TEST_F(ElasticsearchAdapterTest, SearchRequest) {
    QueryOptions opts;
    opts.limit_ = 10;
    opts.offset_ = 5;
    opts.order_by_ = {OrderBy{"age", SortDirection::DESC}};
    auto request = adapter_->to_search_request(SearchQuery::match_all(), opts);
    EXPECT_EQ(request, json(R"({"query": {"match_all": {}}, "size": 10, "from": 5,
                                "sort": [{"age": {"order": "desc", "missing": "_last"}}]})"));

    auto bare = adapter_->to_search_request(SearchQuery::match_all(), QueryOptions{});
    EXPECT_EQ(bare, json(R"({"query": {"match_all": {}}})"));
}

TEST_F(ElasticsearchAdapterTest, RejectsForeignBodies) {
    auto sql = create_adapter(build_capabilities(AdapterId::POSTGRES, "14.5", {}));
    auto foreign = sql->apply_operator(status_, ScalarOperator::EQ, "x");
    EXPECT_FALSE(adapter_->accepts(foreign));
    EXPECT_THROW(static_cast<void>(adapter_->negate(foreign)), InternalException);
}
