/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/util/error_code.hpp>

namespace querygate {

ErrorCodeData get_error_code_data(ErrorCode code) {
    switch (code) {
#define ERROR_CODE(code, Name) case ErrorCode::Name: return error_code_data<ErrorCode::Name>;
        QUERYGATE_ERROR_CODES
#undef ERROR_CODE
    }
    throw std::invalid_argument(fmt::format("Unknown error code {}", static_cast<detail::BaseType>(code)));
}

} //namespace querygate
