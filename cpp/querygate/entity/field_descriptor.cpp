/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/entity/field_descriptor.hpp>
#include <querygate/util/preconditions.hpp>

#include <algorithm>

namespace querygate::entity {

EnumDefinition& EnumDefinition::add(std::string external, Value internal) {
    mapping_.insert_or_assign(std::move(external), std::move(internal));
    return *this;
}

std::optional<Value> EnumDefinition::to_internal(const Value& external) const {
    if (!external.isString())
        return std::nullopt;

    if (auto it = mapping_.find(external.getString()); it != mapping_.end())
        return it->second;

    return std::nullopt;
}

Value EnumDefinition::coerce(const Value& external, std::string_view field) const {
    auto coerce_one = [this, field](const Value& item) {
        auto internal = to_internal(item);
        structural::check<ErrorCode::E_UNMAPPED_ENUM_VALUE>(internal.has_value(),
            "Value {} is not a member of enum {} used by field '{}'", to_json(item), name_, field);
        return std::move(*internal);
    };

    if (!external.isArray())
        return coerce_one(external);

    Value output = Value::array;
    for (const auto& item : external)
        output.push_back(coerce_one(item));

    return output;
}

FieldDescriptor FieldDescriptor::storage(std::string name, FieldType type, std::string column) {
    FieldDescriptor descriptor;
    descriptor.column_ = column.empty() ? name : std::move(column);
    descriptor.name_ = std::move(name);
    descriptor.type_ = type;
    return descriptor;
}

FieldDescriptor FieldDescriptor::associated(std::string name, FieldType type, std::string association, std::string column) {
    auto descriptor = storage(std::move(name), type, std::move(column));
    descriptor.association_ = std::move(association);
    return descriptor;
}

FieldDescriptor FieldDescriptor::enumeration(std::string name, std::shared_ptr<const EnumDefinition> definition, bool is_array) {
    util::check_arg(static_cast<bool>(definition), "Enum field '{}' declared without a definition", name);
    auto descriptor = storage(std::move(name), is_array ? FieldType::array(FieldKind::ENUM) : FieldType::scalar(FieldKind::ENUM));
    descriptor.enum_definition_ = std::move(definition);
    return descriptor;
}

FieldDescriptor FieldDescriptor::custom(std::string name, FieldType type) {
    FieldDescriptor descriptor;
    descriptor.name_ = std::move(name);
    descriptor.type_ = type;
    descriptor.source_ = FieldSource::CUSTOM;
    return descriptor;
}

std::string FieldDescriptor::qualified_column() const {
    if (association_)
        return fmt::format("{}.{}", *association_, column_);

    return column_;
}

FieldDescriptorTable::FieldDescriptorTable(std::initializer_list<FieldDescriptor> fields) {
    for (const auto& field : fields)
        add(field);
}

FieldDescriptorTable& FieldDescriptorTable::add(FieldDescriptor field) {
    structural::check<ErrorCode::E_EMPTY_FIELD_NAME>(!field.name_.empty(), "Field descriptors must be named");
    auto name = field.name_;
    fields_.insert_or_assign(std::move(name), std::move(field));
    return *this;
}

const FieldDescriptor* FieldDescriptorTable::find(std::string_view name) const {
    if (auto it = fields_.find(std::string{name}); it != fields_.end())
        return &it->second;

    return nullptr;
}

const FieldDescriptor& FieldDescriptorTable::at(std::string_view name) const {
    const auto* field = find(name);
    structural::check<ErrorCode::E_UNKNOWN_FIELD>(field != nullptr, "Unknown field '{}'", name);
    return *field;
}

std::vector<std::string> FieldDescriptorTable::names() const {
    std::vector<std::string> output;
    output.reserve(fields_.size());
    for (const auto& [name, _] : fields_)
        output.push_back(name);

    std::sort(output.begin(), output.end());
    return output;
}

AuthorizedFieldSet::AuthorizedFieldSet(bool all, std::vector<std::string> fields) :
    all_(all),
    fields_(fields.begin(), fields.end()) {
}

AuthorizedFieldSet AuthorizedFieldSet::all() {
    return AuthorizedFieldSet{true, {}};
}

AuthorizedFieldSet AuthorizedFieldSet::of(std::vector<std::string> fields) {
    return AuthorizedFieldSet{false, std::move(fields)};
}

bool AuthorizedFieldSet::permits(std::string_view field) const {
    return all_ || fields_.contains(std::string{field});
}

} // namespace querygate::entity
