/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/engine/engine_config.hpp>
#include <querygate/log/log.hpp>
#include <querygate/util/pb_util.hpp>
#include <querygate/util/preconditions.hpp>

#include <fmt/format.h>
#include <folly/FileUtil.h>
#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/text_format.h>

#include <vector>

namespace querygate::engine {

namespace {

class CollectingErrorCollector : public google::protobuf::io::ErrorCollector {
public:
    void AddError(int line, google::protobuf::io::ColumnNumber column, const std::string& message) override {
        errors_.emplace_back(fmt::format("{}:{}: {}", line + 1, column + 1, message));
    }

    void AddWarning(int line, google::protobuf::io::ColumnNumber column, const std::string& message) override {
        log::root().warn("Engine config {}:{}: {}", line + 1, column + 1, message);
    }

    [[nodiscard]] const std::vector<std::string>& errors() const { return errors_; }

private:
    std::vector<std::string> errors_;
};

} // namespace

proto::config::EngineConfig load_engine_config_from_text(std::string_view text) {
    proto::config::EngineConfig config;
    CollectingErrorCollector collector;
    google::protobuf::TextFormat::Parser parser;
    parser.RecordErrorsTo(&collector);

    const auto ok = parser.ParseFromString(std::string{text}, &config);
    user_input::check<ErrorCode::E_INVALID_CONFIG>(ok, "Invalid engine config: {}", fmt::join(collector.errors(), "; "));

    log::root().debug("Loaded engine config: {}", util::format(config));
    return config;
}

proto::config::EngineConfig load_engine_config_file(const std::string& path) {
    std::string contents;
    user_input::check<ErrorCode::E_INVALID_CONFIG>(folly::readFile(path.c_str(), contents),
        "Unable to read engine config file {}", path);
    return load_engine_config_from_text(contents);
}

} // namespace querygate::engine
