/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/entity/field_type.hpp>
#include <querygate/entity/value.hpp>

#include <ankerl/unordered_dense.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace querygate::entity {

/**
 * Maps the externally visible enum values onto their stored representation.
 */
class EnumDefinition {
public:
    explicit EnumDefinition(std::string name) :
        name_(std::move(name)) {
    }

    EnumDefinition& add(std::string external, Value internal);

    [[nodiscard]] const std::string& name() const { return name_; }

    /// nullopt if the value is not a declared member of the enum
    [[nodiscard]] std::optional<Value> to_internal(const Value& external) const;

    /// Coerces a leaf value, element-wise for lists. Raises E_UNMAPPED_ENUM_VALUE for undeclared members.
    [[nodiscard]] Value coerce(const Value& external, std::string_view field) const;

private:
    std::string name_;
    ankerl::unordered_dense::map<std::string, Value> mapping_;
};

enum class FieldSource : uint8_t {
    /// Backed by a storage column, compiled by the adapter
    STORAGE,
    /// Backed by a registered custom filter function, never reaches the adapter
    CUSTOM
};

struct FieldDescriptor {
    std::string name_;
    FieldType type_;
    FieldSource source_ = FieldSource::STORAGE;
    std::string column_;
    std::optional<std::string> association_;
    std::shared_ptr<const EnumDefinition> enum_definition_;

    static FieldDescriptor storage(std::string name, FieldType type, std::string column = {});

    static FieldDescriptor associated(std::string name, FieldType type, std::string association, std::string column = {});

    static FieldDescriptor enumeration(std::string name, std::shared_ptr<const EnumDefinition> definition, bool is_array = false);

    static FieldDescriptor custom(std::string name, FieldType type);

    [[nodiscard]] bool is_custom() const { return source_ == FieldSource::CUSTOM; }

    /// Column path as addressed by adapters, "association.column" when reached through an association
    [[nodiscard]] std::string qualified_column() const;
};

class FieldDescriptorTable {
public:
    FieldDescriptorTable() = default;
    FieldDescriptorTable(std::initializer_list<FieldDescriptor> fields);

    FieldDescriptorTable& add(FieldDescriptor field);

    [[nodiscard]] const FieldDescriptor* find(std::string_view name) const;

    /// Raises E_UNKNOWN_FIELD if absent
    [[nodiscard]] const FieldDescriptor& at(std::string_view name) const;

    [[nodiscard]] size_t size() const { return fields_.size(); }

    [[nodiscard]] std::vector<std::string> names() const;

private:
    ankerl::unordered_dense::map<std::string, FieldDescriptor> fields_;
};

/**
 * The set of fields the caller is allowed to filter on, as resolved by the authorization layer for a request.
 */
class AuthorizedFieldSet {
public:
    static AuthorizedFieldSet all();
    static AuthorizedFieldSet of(std::vector<std::string> fields);

    [[nodiscard]] bool permits(std::string_view field) const;
    [[nodiscard]] bool is_all() const { return all_; }

private:
    AuthorizedFieldSet(bool all, std::vector<std::string> fields);

    bool all_;
    ankerl::unordered_dense::set<std::string> fields_;
};

} // namespace querygate::entity
