/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/log/log.hpp>
#include <querygate/util/error_code.hpp>
#include <querygate/util/preprocess.hpp>

#include <fmt/compile.h>

namespace querygate {

namespace util::detail {

template<ErrorCode code, ErrorCategory error_category>
struct Raise {
    static_assert(get_error_category(code) == error_category);

    template<typename...Args>
    [[noreturn]] void operator()(fmt::format_string<Args...> format, Args&&...args) const {
        std::string msg = fmt::format(FMT_COMPILE("{} {}"), error_code_data<code>.name_,
                                      fmt::format(format, std::forward<Args>(args)...));
        if constexpr(error_category == ErrorCategory::INTERNAL)
            log::root().error(msg);
        throw_error<code>(msg);
    }
};

template<ErrorCode code, ErrorCategory error_category>
struct Check {
    static constexpr Raise<code, error_category> raise{};

    template<typename...Args>
    void operator()(bool cond, fmt::format_string<Args...> format, Args&&...args) const {
        if (QUERYGATE_UNLIKELY(!cond)) {
            raise(format, std::forward<Args>(args)...);
        }
    }
};
} // namespace util::detail

namespace internal {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::INTERNAL>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace structural {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::STRUCTURAL>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace capability {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::CAPABILITY>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace adapter_selection {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::ADAPTER_SELECTION>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace analysis {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::ANALYSIS>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace user_input {
    template<ErrorCode code>
    constexpr auto check = util::detail::Check<code, ErrorCategory::USER_INPUT>{};

    template<ErrorCode code>
    constexpr auto raise = check<code>.raise;
}

namespace util {

constexpr auto check = util::detail::Check<ErrorCode::E_ASSERTION_FAILURE, ErrorCategory::INTERNAL>{};

constexpr auto check_arg = util::detail::Check<ErrorCode::E_INVALID_ARGUMENT, ErrorCategory::INTERNAL>{};

constexpr auto raise_rte = util::detail::Check<ErrorCode::E_RUNTIME_ERROR, ErrorCategory::INTERNAL>::raise;

template<typename...Args>
void warn(bool cond, fmt::format_string<Args...> format, Args&&...args) {
    if (QUERYGATE_UNLIKELY(!cond)) {
        log::root().warn("ASSERTION WARNING: {}", fmt::format(format, std::forward<Args>(args)...));
    }
}

} // namespace util

} // namespace querygate
