/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <google/protobuf/text_format.h>
#include <google/protobuf/message.h>

#include <optional>
#include <string>

namespace querygate::util {

template<class T>
std::optional<T> as_opt(T val, const T &sentinel = T()) {
    if (val == sentinel) {
        return std::nullopt;
    }
    return std::make_optional(val);
}

inline std::string format(const google::protobuf::Message &msg) {
    std::string dest;
    google::protobuf::TextFormat::Printer p;
    p.SetSingleLineMode(true);
    p.PrintToString(msg, &dest);
    return dest;
}

} // namespace querygate::util
