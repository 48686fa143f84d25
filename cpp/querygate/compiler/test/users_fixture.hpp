/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/adapter/adapter_factory.hpp>
#include <querygate/adapter/capability_detection.hpp>
#include <querygate/entity/field_descriptor.hpp>

#include <folly/json.h>

#include <memory>
#include <string>
#include <vector>

namespace querygate::test {

inline std::shared_ptr<const entity::EnumDefinition> plan_enum() {
    auto plan = std::make_shared<entity::EnumDefinition>("Plan");
    plan->add("free", 0).add("pro", 1).add("enterprise", 2);
    return plan;
}

/// Fields of the users relation the compiler tests filter on
inline entity::FieldDescriptorTable users_fields() {
    using namespace entity;
    return FieldDescriptorTable{
        FieldDescriptor::storage("id", FieldType::scalar(FieldKind::ID)),
        FieldDescriptor::storage("age", FieldType::scalar(FieldKind::INTEGER)),
        FieldDescriptor::storage("status", FieldType::scalar(FieldKind::STRING)),
        FieldDescriptor::storage("tags", FieldType::array(FieldKind::STRING)),
        FieldDescriptor::storage("profile", FieldType::json()),
        FieldDescriptor::associated("company", FieldType::scalar(FieldKind::STRING), "company", "name"),
        FieldDescriptor::enumeration("plan", plan_enum()),
        FieldDescriptor::custom("is_adult", FieldType::scalar(FieldKind::BOOLEAN))
    };
}

inline Value users_dataset() {
    return folly::parseJson(R"([
        {"id": 1, "age": 30, "status": "active", "tags": [], "plan": 1, "company": {"name": "Acme"}},
        {"id": 2, "age": 17, "status": "trial", "tags": ["a"], "plan": 0, "profile": {"bio": "hi"}},
        {"id": 3, "age": 40, "status": "banned", "tags": ["a", "b"]}
    ])");
}

inline std::shared_ptr<adapter::Adapter> make_adapter(
        adapter::AdapterId id,
        const std::string& version = {},
        const std::vector<std::string>& extensions = {}) {
    return adapter::create_adapter(adapter::build_capabilities(id, version, extensions));
}

inline std::vector<int64_t> ids_of(const Value& rows) {
    std::vector<int64_t> ids;
    for (const auto& row : rows)
        ids.push_back(row["id"].asInt());
    return ids;
}

} // namespace querygate::test
