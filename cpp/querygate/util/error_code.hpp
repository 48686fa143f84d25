/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace querygate {

namespace detail {
using BaseType = std::uint32_t;
constexpr BaseType error_category_scale = 1000u;
}

enum class ErrorCategory : detail::BaseType {
    INTERNAL = 1,
    /// The filter expression is malformed or references unknown symbols
    STRUCTURAL = 2,
    AUTHORIZATION = 3,
    /// The selected backend cannot express the requested operation
    CAPABILITY = 4,
    ADAPTER_SELECTION = 5,
    /// Cost estimation failures, never surfaced past the analyzer
    ANALYSIS = 6,
    USER_INPUT = 7
};

inline std::unordered_map<ErrorCategory, const char*> get_error_category_names() {
    return {
        {ErrorCategory::INTERNAL, "INTERNAL"},
        {ErrorCategory::STRUCTURAL, "STRUCTURAL"},
        {ErrorCategory::AUTHORIZATION, "AUTHORIZATION"},
        {ErrorCategory::CAPABILITY, "CAPABILITY"},
        {ErrorCategory::ADAPTER_SELECTION, "ADAPTER_SELECTION"},
        {ErrorCategory::ANALYSIS, "ANALYSIS"},
        {ErrorCategory::USER_INPUT, "USER_INPUT"},
    };
}

// A macro that will be expanded in different ways by redefining ERROR_CODE():
#define QUERYGATE_ERROR_CODES \
    ERROR_CODE(1000, E_ASSERTION_FAILURE) \
    ERROR_CODE(1001, E_INVALID_ARGUMENT) \
    ERROR_CODE(1002, E_RUNTIME_ERROR) \
    ERROR_CODE(1003, E_CUSTOM_FILTER_MISMATCH) \
    ERROR_CODE(1004, E_ADAPTER_MISMATCH) \
    ERROR_CODE(2000, E_MALFORMED_FILTER) \
    ERROR_CODE(2001, E_UNKNOWN_COMBINATOR) \
    ERROR_CODE(2002, E_UNKNOWN_OPERATOR) \
    ERROR_CODE(2003, E_UNKNOWN_FIELD) \
    ERROR_CODE(2004, E_EMPTY_FIELD_NAME) \
    ERROR_CODE(2005, E_INVALID_OPERATOR_VALUE) \
    ERROR_CODE(2006, E_UNMAPPED_ENUM_VALUE) \
    ERROR_CODE(2007, E_INVALID_FILTER_JSON) \
    ERROR_CODE(2008, E_MISSING_CUSTOM_FILTER) \
    ERROR_CODE(3000, E_UNAUTHORIZED_FIELD) \
    ERROR_CODE(4000, E_UNSUPPORTED_OPERATOR) \
    ERROR_CODE(4001, E_FEATURE_UNAVAILABLE) \
    ERROR_CODE(4002, E_TOO_MANY_LIST_ITEMS) \
    ERROR_CODE(5000, E_NO_ADAPTER_MAPPING) \
    ERROR_CODE(5001, E_UNKNOWN_ADAPTER) \
    ERROR_CODE(6000, E_EXPLAIN_FAILED) \
    ERROR_CODE(6001, E_UNPARSEABLE_PLAN) \
    ERROR_CODE(6002, E_CONNECTOR_UNAVAILABLE) \
    ERROR_CODE(7000, E_INVALID_CONFIG)

enum class ErrorCode : detail::BaseType {
#define ERROR_CODE(code, Name, ...) Name = code,
    QUERYGATE_ERROR_CODES
#undef ERROR_CODE
};

struct ErrorCodeData {
    std::string_view name_;
    std::string_view as_string_;
};

template<ErrorCode code>
inline constexpr ErrorCodeData error_code_data{};

#define ERROR_CODE(code, Name, ...) template<> inline constexpr ErrorCodeData error_code_data<ErrorCode::Name> \
    { #Name, "E" #code };
QUERYGATE_ERROR_CODES
#undef ERROR_CODE

inline std::vector<ErrorCode> get_error_codes() {
    static std::vector<ErrorCode> error_codes{
#define ERROR_CODE(code, Name) ErrorCode::Name,
        QUERYGATE_ERROR_CODES
#undef ERROR_CODE
    };
    return error_codes;
}

ErrorCodeData get_error_code_data(ErrorCode code);

constexpr ErrorCategory get_error_category(ErrorCode code) {
    return static_cast<ErrorCategory>(static_cast<detail::BaseType>(code) / detail::error_category_scale);
}

struct QuerygateException : public std::runtime_error {
    explicit QuerygateException(const std::string& msg_with_error_code):
            std::runtime_error(msg_with_error_code) {
    }
};

template<ErrorCategory error_category>
struct QuerygateCategorizedException : public QuerygateException {
    using QuerygateException::QuerygateException;
};

template<ErrorCode specific_code>
struct QuerygateSpecificException : public QuerygateCategorizedException<get_error_category(specific_code)> {
    static constexpr ErrorCategory category = get_error_category(specific_code);

    explicit QuerygateSpecificException(const std::string& msg_with_error_code) :
            QuerygateCategorizedException<category>(msg_with_error_code) {
        static_assert(get_error_category(specific_code) == category);
    }
};

using InternalException = QuerygateCategorizedException<ErrorCategory::INTERNAL>;
using StructuralException = QuerygateCategorizedException<ErrorCategory::STRUCTURAL>;
using AuthorizationException = QuerygateCategorizedException<ErrorCategory::AUTHORIZATION>;
using CapabilityException = QuerygateCategorizedException<ErrorCategory::CAPABILITY>;
using AdapterSelectionException = QuerygateCategorizedException<ErrorCategory::ADAPTER_SELECTION>;
using AnalysisException = QuerygateCategorizedException<ErrorCategory::ANALYSIS>;
using UserInputException = QuerygateCategorizedException<ErrorCategory::USER_INPUT>;
using UnmappedEnumValueException = QuerygateSpecificException<ErrorCode::E_UNMAPPED_ENUM_VALUE>;

/// Raised when a filter references fields outside the caller's visible set. Lists every offending field.
struct UnauthorizedFieldException : public QuerygateSpecificException<ErrorCode::E_UNAUTHORIZED_FIELD> {
    UnauthorizedFieldException(const std::string& msg_with_error_code, std::vector<std::string> fields) :
        QuerygateSpecificException<ErrorCode::E_UNAUTHORIZED_FIELD>(msg_with_error_code),
        fields_(std::move(fields)) {
    }

    [[nodiscard]] const std::vector<std::string>& fields() const { return fields_; }

  private:
    std::vector<std::string> fields_;
};

/// Raised when an operator is not expressible on the selected adapter.
struct UnsupportedOperatorException : public QuerygateSpecificException<ErrorCode::E_UNSUPPORTED_OPERATOR> {
    UnsupportedOperatorException(const std::string& msg_with_error_code, std::string field, std::string op, std::string adapter) :
        QuerygateSpecificException<ErrorCode::E_UNSUPPORTED_OPERATOR>(msg_with_error_code),
        field_(std::move(field)),
        operator_(std::move(op)),
        adapter_(std::move(adapter)) {
    }

    [[nodiscard]] const std::string& field() const { return field_; }
    [[nodiscard]] const std::string& operator_symbol() const { return operator_; }
    [[nodiscard]] const std::string& adapter() const { return adapter_; }

  private:
    std::string field_;
    std::string operator_;
    std::string adapter_;
};

template<ErrorCode error_code>
[[noreturn]] void throw_error(const std::string& msg) {
    throw QuerygateCategorizedException<get_error_category(error_code)>(msg);
}

template<>
[[noreturn]] inline void throw_error<ErrorCode::E_UNMAPPED_ENUM_VALUE>(const std::string& msg) {
    throw QuerygateSpecificException<ErrorCode::E_UNMAPPED_ENUM_VALUE>(msg);
}

template<>
[[noreturn]] inline void throw_error<ErrorCode::E_TOO_MANY_LIST_ITEMS>(const std::string& msg) {
    throw QuerygateSpecificException<ErrorCode::E_TOO_MANY_LIST_ITEMS>(msg);
}

template<>
[[noreturn]] inline void throw_error<ErrorCode::E_FEATURE_UNAVAILABLE>(const std::string& msg) {
    throw QuerygateSpecificException<ErrorCode::E_FEATURE_UNAVAILABLE>(msg);
}

template<>
[[noreturn]] inline void throw_error<ErrorCode::E_NO_ADAPTER_MAPPING>(const std::string& msg) {
    throw QuerygateSpecificException<ErrorCode::E_NO_ADAPTER_MAPPING>(msg);
}

} // namespace querygate

namespace fmt {
template<>
struct formatter<querygate::ErrorCode> {
    template<typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(querygate::ErrorCode code, FormatContext &ctx) const {
        std::string_view str = querygate::get_error_code_data(code).as_string_;
        return std::copy(str.begin(), str.end(), ctx.out());
    }
};
}
