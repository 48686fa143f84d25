/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <gtest/gtest.h>

#include <querygate/adapter/memory/memory_adapter.hpp>
#include <querygate/adapter/sql/sql_adapter.hpp>
#include <querygate/compiler/query_builder.hpp>
#include <querygate/compiler/test/users_fixture.hpp>
#include <querygate/filter/filter_parser.hpp>

#include <atomic>

using namespace querygate;
using namespace querygate::adapter;
using namespace querygate::compiler;
using namespace querygate::entity;
using querygate::filter::parse_json;

namespace {

/// In-memory adapter that counts every call reaching the backend specific layer
class RecordingAdapter final : public Adapter {
public:
    RecordingAdapter() :
        Adapter(build_capabilities(AdapterId::MEMORY, "", {})) {
    }

    [[nodiscard]] size_t calls() const { return calls_.load(); }

private:
    QueryBody do_apply_operator(const FieldDescriptor& field, const Operator& op, const Value& value) const override {
        ++calls_;
        return memory::MemoryPredicate::condition(field.qualified_column(), op, value);
    }

    QueryBody do_combine_and(std::vector<QueryBody> bodies) const override {
        ++calls_;
        return memory::MemoryPredicate::all_of(predicates(std::move(bodies)));
    }

    QueryBody do_combine_or(std::vector<QueryBody> bodies) const override {
        ++calls_;
        return memory::MemoryPredicate::any_of(predicates(std::move(bodies)));
    }

    QueryBody do_negate(QueryBody body) const override {
        ++calls_;
        return memory::MemoryPredicate::negation(std::get<memory::MemoryPredicate>(std::move(body)));
    }

    QueryBody do_match_all() const override {
        ++calls_;
        return memory::MemoryPredicate::always();
    }

    std::string do_signature(const QueryBody& body) const override {
        return std::get<memory::MemoryPredicate>(body).describe();
    }

    [[nodiscard]] size_t body_index() const override { return body_index_of<memory::MemoryPredicate>(); }

    static std::vector<memory::MemoryPredicate> predicates(std::vector<QueryBody> bodies) {
        std::vector<memory::MemoryPredicate> output;
        for (auto& body : bodies)
            output.push_back(std::get<memory::MemoryPredicate>(std::move(body)));
        return output;
    }

    mutable std::atomic<size_t> calls_{0};
};

CompiledQuery adult_filter(CompiledQuery query, const Operator&, const Value& value) {
    auto base = query.as<memory::MemoryPredicate>();
    const bool wanted = value.asBool();
    auto adult = memory::MemoryPredicate::custom(fmt::format("is_adult {}", wanted), [wanted](const Value& row) {
        const auto* age = lookup_path(row, "age");
        return age != nullptr && age->isNumber() && (age->asInt() >= 18) == wanted;
    });
    return CompiledQuery{memory::MemoryPredicate::all_of({base, adult}), query.shape_};
}

class QueryBuilderTest : public testing::Test {
protected:
    Value run(std::string_view filter, const AuthorizedFieldSet& authorized = AuthorizedFieldSet::all()) {
        auto memory = std::dynamic_pointer_cast<memory::MemoryAdapter>(memory_);
        auto compiled = compile(parse_json(filter, fields_), fields_, authorized, *memory, custom_filters_);
        return memory->execute(compiled.as<memory::MemoryPredicate>(), dataset_, QueryOptions{});
    }

    FieldDescriptorTable fields_ = test::users_fields();
    Value dataset_ = test::users_dataset();
    std::shared_ptr<Adapter> memory_ = test::make_adapter(AdapterId::MEMORY);
    CustomFilterRegistry custom_filters_ = CustomFilterRegistry{}.register_filter("is_adult", adult_filter);
};

} // namespace

TEST_F(QueryBuilderTest, EndToEndOnMemory) {
    auto rows = run(R"({"_and": [
        {"age": {"_gte": 18}},
        {"_or": [{"status": {"_eq": "active"}}, {"status": {"_eq": "trial"}}]}
    ]})");
    EXPECT_EQ(test::ids_of(rows), (std::vector<int64_t>{1}));
}

TEST_F(QueryBuilderTest, OperatorsOfOneFieldAreConjoined) {
    EXPECT_EQ(test::ids_of(run(R"({"age": {"_gte": 18, "_lt": 35}})")), (std::vector<int64_t>{1}));

    auto pg = test::make_adapter(AdapterId::POSTGRES, "14.5");
    auto compiled = compile(parse_json(R"({"age": {"_gte": 18, "_lt": 35}})", fields_), fields_, AuthorizedFieldSet::all(), *pg);
    EXPECT_EQ(compiled.as<sql::SqlFragment>().sql_, R"(("age" >= ? AND "age" < ?))");
    EXPECT_EQ(compiled.shape_.conditions_, 2u);
}

TEST_F(QueryBuilderTest, NegationAndEmptyCombinators) {
    EXPECT_EQ(test::ids_of(run(R"({"_not": {"status": {"_eq": "banned"}}})")), (std::vector<int64_t>{1, 2}));
    EXPECT_EQ(test::ids_of(run(R"({"_and": []})")), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_TRUE(run(R"({"_or": []})").empty());
    EXPECT_EQ(test::ids_of(run(R"({"profile": {"_has_key": "bio"}})")), (std::vector<int64_t>{2}));
    EXPECT_EQ(test::ids_of(run(R"({"company": {"_eq": "Acme"}})")), (std::vector<int64_t>{1}));
}

TEST_F(QueryBuilderTest, EmptyListsOnMemory) {
    EXPECT_TRUE(run(R"({"status": {"_in": []}})").empty());
    EXPECT_EQ(test::ids_of(run(R"({"status": {"_nin": []}})")), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_EQ(test::ids_of(run(R"({"tags": {"_includes_all": []}})")), (std::vector<int64_t>{1, 2, 3}));
    EXPECT_TRUE(run(R"({"tags": {"_includes_any": []}})").empty());
    EXPECT_EQ(test::ids_of(run(R"({"tags": {"_is_empty": true}})")), (std::vector<int64_t>{1}));
}

TEST_F(QueryBuilderTest, UnauthorizedFieldsAreCollectedBeforeDispatch) {
    RecordingAdapter recording;
    auto expression = parse_json(R"({
        "_or": [{"status": {"_eq": "active"}}, {"tags": {"_includes": "a"}}, {"status": {"_eq": "trial"}}],
        "age": {"_gt": 1}
    })", fields_);

    try {
        static_cast<void>(compile(expression, fields_, AuthorizedFieldSet::of({"age"}), recording));
        FAIL() << "Expected UnauthorizedFieldException";
    } catch (const UnauthorizedFieldException& e) {
        EXPECT_EQ(e.fields(), (std::vector<std::string>{"status", "tags"}));
        EXPECT_TRUE(std::string_view{e.what()}.starts_with("E_UNAUTHORIZED_FIELD"));
    }
    EXPECT_EQ(recording.calls(), 0u);

    auto compiled = compile(expression, fields_, AuthorizedFieldSet::of({"age", "status", "tags"}), recording);
    EXPECT_GT(recording.calls(), 0u);
    EXPECT_EQ(compiled.shape_.conditions_, 4u);
}

TEST_F(QueryBuilderTest, UnsupportedOperatorNamesFieldOperatorAndAdapter) {
    RecordingAdapter recording;
    auto expression = parse_json(R"({"age": {"_gt": 1}, "status": {"_matches": "quick fox"}})", fields_);
    try {
        static_cast<void>(compile(expression, fields_, AuthorizedFieldSet::all(), recording));
        FAIL() << "Expected UnsupportedOperatorException";
    } catch (const UnsupportedOperatorException& e) {
        EXPECT_EQ(e.field(), "status");
        EXPECT_EQ(e.operator_symbol(), "_matches");
        EXPECT_EQ(e.adapter(), "memory");
    }
    EXPECT_EQ(recording.calls(), 0u);

    auto mysql = test::make_adapter(AdapterId::MYSQL, "8.0.32");
    EXPECT_THROW(static_cast<void>(compile(parse_json(R"({"tags": {"_includes_all": ["a"]}})", fields_),
                                           fields_, AuthorizedFieldSet::all(), *mysql)),
                 CapabilityException);
}

TEST_F(QueryBuilderTest, ListSizeIsBoundedByTheAdapter) {
    auto sqlite = test::make_adapter(AdapterId::SQLITE, "3.40.0");
    Value items = Value::array;
    for (int i = 0; i < 1000; ++i)
        items.push_back(fmt::format("s{}", i));

    auto too_many = filter::parse(Value::object("status", Value::object("_in", items)), fields_);
    EXPECT_THROW(static_cast<void>(compile(too_many, fields_, AuthorizedFieldSet::all(), *sqlite)),
                 QuerygateSpecificException<ErrorCode::E_TOO_MANY_LIST_ITEMS>);

    items.resize(999);
    auto at_limit = filter::parse(Value::object("status", Value::object("_in", items)), fields_);
    auto compiled = compile(at_limit, fields_, AuthorizedFieldSet::all(), *sqlite);
    EXPECT_EQ(compiled.shape_.membership_items_, 999u);
}

TEST_F(QueryBuilderTest, EnumValuesAreCoerced) {
    auto pg = test::make_adapter(AdapterId::POSTGRES, "14.5");
    auto compiled = compile(parse_json(R"({"plan": {"_in": ["pro", "enterprise"]}})", fields_), fields_, AuthorizedFieldSet::all(), *pg);
    EXPECT_EQ(compiled.as<sql::SqlFragment>().params_, (std::vector<Value>{1, 2}));

    auto is_null = compile(parse_json(R"({"plan": {"_is_null": false}})", fields_), fields_, AuthorizedFieldSet::all(), *pg);
    EXPECT_EQ(is_null.as<sql::SqlFragment>().sql_, R"("plan" IS NOT NULL)");

    EXPECT_EQ(test::ids_of(run(R"({"plan": {"_eq": "free"}})")), (std::vector<int64_t>{2}));
    EXPECT_THROW(run(R"({"plan": {"_eq": "gold"}})"), UnmappedEnumValueException);
}

TEST_F(QueryBuilderTest, CustomFilters) {
    auto compiled = compile(parse_json(R"({"is_adult": {"_eq": true}})", fields_), fields_, AuthorizedFieldSet::all(), *memory_, custom_filters_);
    EXPECT_EQ(compiled.shape_.custom_fragments_, 1u);
    EXPECT_EQ(compiled.shape_.conditions_, 0u);
    EXPECT_EQ(test::ids_of(run(R"({"is_adult": {"_eq": false}})")), (std::vector<int64_t>{2}));
    EXPECT_EQ(test::ids_of(run(R"({"is_adult": {"_eq": true}, "status": {"_neq": "banned"}})")), (std::vector<int64_t>{1}));

    EXPECT_THROW(static_cast<void>(compile(parse_json(R"({"is_adult": {"_eq": true}})", fields_),
                                           fields_, AuthorizedFieldSet::all(), *memory_)),
                 StructuralException);

    CustomFilterRegistry foreign;
    foreign.register_filter("is_adult", [](CompiledQuery, const Operator&, const Value&) {
        return CompiledQuery{sql::SqlFragment::always_true(), QueryShape{}};
    });
    EXPECT_THROW(static_cast<void>(compile(parse_json(R"({"is_adult": {"_eq": true}})", fields_),
                                           fields_, AuthorizedFieldSet::all(), *memory_, foreign)),
                 InternalException);
}

TEST_F(QueryBuilderTest, CompilationIsDeterministic) {
    auto pg = test::make_adapter(AdapterId::POSTGRES, "14.5");
    const auto* filter = R"({"status": {"_in": ["a", "b"]}, "age": {"_gte": 18}, "_not": {"tags": {"_includes": "x"}}})";
    auto first = compile(parse_json(filter, fields_), fields_, AuthorizedFieldSet::all(), *pg);
    auto second = compile(parse_json(filter, fields_), fields_, AuthorizedFieldSet::all(), *pg);
    EXPECT_EQ(first, second);
    EXPECT_EQ(pg->signature(first), pg->signature(second));
    EXPECT_EQ(first.shape_.and_groups_, 1u);
    EXPECT_EQ(first.shape_.negations_, 1u);
    EXPECT_EQ(first.shape_.membership_lists_, 1u);
}
