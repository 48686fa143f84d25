/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/complexity/plan_parser.hpp>
#include <querygate/util/preconditions.hpp>

#include <fmt/ranges.h>

#include <folly/Conv.h>

#include <algorithm>

namespace querygate::complexity {

namespace {

constexpr double VERY_HIGH_COST = 10000.0;
constexpr size_t MAX_JOINS_BEFORE_VIEW = 3;
constexpr double MYSQL_COST_SCALE = 10.0;

const Value* member(const Value& object, std::string_view key) {
    if (!object.isObject())
        return nullptr;
    return object.get_ptr(folly::StringPiece(key.data(), key.size()));
}

double number(const Value* value) {
    if (value == nullptr || value->isNull())
        return 0.0;
    if (value->isNumber())
        return value->asDouble();
    if (value->isString()) {
        auto parsed = folly::tryTo<double>(value->getString());
        analysis::check<ErrorCode::E_UNPARSEABLE_PLAN>(parsed.hasValue(), "Plan cost '{}' is not a number", value->getString());
        return parsed.value();
    }
    analysis::raise<ErrorCode::E_UNPARSEABLE_PLAN>("Expected a number in the plan, got {}", value->typeName());
}

void add_unique(std::vector<std::string>& names, const Value* name) {
    if (name == nullptr || !name->isString())
        return;
    if (std::find(names.begin(), names.end(), name->getString()) == names.end())
        names.push_back(name->getString());
}

bool is_join_node(const std::string& node_type) {
    return node_type == "Nested Loop" || node_type == "Hash Join" || node_type == "Merge Join";
}

void collect_postgres_nodes(const Value& node, PlanSummary& summary) {
    analysis::check<ErrorCode::E_UNPARSEABLE_PLAN>(node.isObject(), "Plan node is not an object, got {}", node.typeName());
    ++summary.node_count_;
    if (const auto* type = member(node, "Node Type"); type != nullptr && type->isString()) {
        const auto& node_type = type->getString();
        if (node_type == "Seq Scan") {
            ++summary.seq_scans_;
            add_unique(summary.seq_scan_relations_, member(node, "Relation Name"));
        } else if (node_type == "Index Scan" || node_type == "Index Only Scan" || node_type == "Bitmap Index Scan") {
            add_unique(summary.indexes_used_, member(node, "Index Name"));
        } else if (is_join_node(node_type)) {
            ++summary.join_nodes_;
        } else if (node_type == "Sort") {
            summary.using_filesort_ = true;
        }
    }
    if (const auto* plans = member(node, "Plans"); plans != nullptr) {
        analysis::check<ErrorCode::E_UNPARSEABLE_PLAN>(plans->isArray(), "Plans must be an array");
        for (const auto& child : *plans)
            collect_postgres_nodes(child, summary);
    }
}

void collect_mysql_table(const Value& table, PlanSummary& summary) {
    ++summary.node_count_;
    if (const auto* access = member(table, "access_type"); access != nullptr && access->isString() && access->getString() == "ALL") {
        ++summary.seq_scans_;
        add_unique(summary.seq_scan_relations_, member(table, "table_name"));
    }
    add_unique(summary.indexes_used_, member(table, "key"));
    if (const auto* rows = member(table, "rows_examined_per_scan"); rows != nullptr)
        summary.plan_rows_ = std::max(summary.plan_rows_, number(rows));
    if (const auto* filesort = member(table, "using_filesort"); filesort != nullptr && filesort->isBool() && filesort->getBool())
        summary.using_filesort_ = true;
    if (const auto* temporary = member(table, "using_temporary_table"); temporary != nullptr && temporary->isBool() && temporary->getBool())
        summary.using_temporary_ = true;
}

void collect_mysql_block(const Value& block, PlanSummary& summary) {
    if (!block.isObject())
        return;

    if (const auto* table = member(block, "table"))
        collect_mysql_table(*table, summary);

    if (const auto* nested = member(block, "nested_loop"); nested != nullptr && nested->isArray()) {
        if (nested->size() > 1)
            summary.join_nodes_ += nested->size() - 1;
        for (const auto& step : *nested)
            collect_mysql_block(step, summary);
    }

    if (const auto* ordering = member(block, "ordering_operation")) {
        summary.using_filesort_ = true;
        collect_mysql_block(*ordering, summary);
    }
    if (const auto* grouping = member(block, "grouping_operation")) {
        summary.using_temporary_ = true;
        collect_mysql_block(*grouping, summary);
    }
    if (const auto* duplicates = member(block, "duplicates_removal"))
        collect_mysql_block(*duplicates, summary);
}

} // namespace

PlanSummary parse_postgres_plan(const Value& plan) {
    const Value* root = &plan;
    if (plan.isArray()) {
        analysis::check<ErrorCode::E_UNPARSEABLE_PLAN>(!plan.empty(), "Empty plan document");
        root = &plan[0];
    }
    const auto* top = member(*root, "Plan");
    analysis::check<ErrorCode::E_UNPARSEABLE_PLAN>(top != nullptr, "No Plan in {}", entity::to_json(plan));

    PlanSummary summary;
    summary.total_cost_ = number(member(*top, "Total Cost"));
    summary.plan_rows_ = number(member(*top, "Plan Rows"));
    collect_postgres_nodes(*top, summary);
    return summary;
}

PlanSummary parse_mysql_plan(const Value& plan) {
    const auto* block = member(plan, "query_block");
    analysis::check<ErrorCode::E_UNPARSEABLE_PLAN>(block != nullptr && block->isObject(), "No query_block in {}", entity::to_json(plan));

    PlanSummary summary;
    if (const auto* cost_info = member(*block, "cost_info"))
        summary.total_cost_ = number(member(*cost_info, "query_cost"));
    collect_mysql_block(*block, summary);
    return summary;
}

PlanSummary parse_plan(adapter::AdapterId id, const Value& plan) {
    switch (id) {
    case adapter::AdapterId::POSTGRES: return parse_postgres_plan(plan);
    case adapter::AdapterId::MYSQL: return parse_mysql_plan(plan);
    default:
        break;
    }
    analysis::raise<ErrorCode::E_EXPLAIN_FAILED>("No plan format is known for the {} adapter", id);
}

ComplexityAnalysis analyze_plan(const PlanSummary& summary, adapter::AdapterId id, const adapter::QueryOptions& opts) {
    ComplexityAnalysis result;
    result.method_ = AnalysisMethod::EXPLAIN;
    result.cost_ = summary.total_cost_;
    const auto scaled_cost = id == adapter::AdapterId::MYSQL ? summary.total_cost_ * MYSQL_COST_SCALE : summary.total_cost_;
    result.normalized_score_ = normalize_cost(scaled_cost, summary.seq_scans_);

    if (!summary.seq_scan_relations_.empty())
        result.suggestions_.push_back(fmt::format("Consider adding indexes to: {}", fmt::join(summary.seq_scan_relations_, ", ")));
    if (!opts.limit_)
        result.suggestions_.emplace_back("Add a LIMIT clause to restrict the number of rows returned");
    if (scaled_cost > VERY_HIGH_COST)
        result.suggestions_.push_back(fmt::format("Query cost is very high ({:.2f}). Consider adding filters or limits.", summary.total_cost_));
    if (summary.join_nodes_ > MAX_JOINS_BEFORE_VIEW)
        result.suggestions_.emplace_back("Consider using a materialized view for this complex join query");
    if (id == adapter::AdapterId::MYSQL && summary.using_filesort_)
        result.suggestions_.emplace_back("Query uses filesort - consider adding index for ORDER BY");
    if (id == adapter::AdapterId::MYSQL && summary.using_temporary_)
        result.suggestions_.emplace_back("Query uses temporary table - consider optimizing GROUP BY");

    Value indexes = Value::array;
    for (const auto& index : summary.indexes_used_)
        indexes.push_back(index);

    result.raw_details_ = Value::object
        ("rows", summary.plan_rows_)
        ("seq_scans", static_cast<int64_t>(summary.seq_scans_))
        ("index_usage", std::move(indexes))
        ("plan_nodes", static_cast<int64_t>(summary.node_count_))
        ("join_nodes", static_cast<int64_t>(summary.join_nodes_))
        ("using_filesort", summary.using_filesort_)
        ("using_temporary", summary.using_temporary_)
        ("execution_time_estimate_ms", summary.total_cost_ * 0.1 + summary.plan_rows_ * 0.001);
    return result;
}

} // namespace querygate::complexity
