/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#pragma once

#include <querygate/logger.pb.h>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <unordered_map>

#ifdef DEBUG_BUILD
#define QUERYGATE_DEBUG(logger, ...) logger.debug(__VA_ARGS__)
#define QUERYGATE_TRACE(logger, ...) logger.trace(__VA_ARGS__)
#else
#define QUERYGATE_DEBUG(logger, ...) (void)0
#define QUERYGATE_TRACE(logger, ...) (void)0
#endif

#define QUERYGATE_RUNTIME_DEBUG(logger, ...) logger.debug(__VA_ARGS__)

namespace querygate::proto {
    namespace logger = querygate::pb::logger;
}

namespace querygate::log {
class Loggers {
  public:
    Loggers();
    ~Loggers();

    static Loggers& instance();

    /**
     * Configure the loggers instance.
     * If called multiple times will ignore subsequent calls and return false, unless force is set
     * @return true if configuration occurred
     */
    bool configure(const querygate::proto::logger::LoggersConfig &conf, bool force=false);

    spdlog::logger &root();
    spdlog::logger &filter();
    spdlog::logger &adapter();
    spdlog::logger &capability();
    spdlog::logger &analyzer();
    spdlog::logger &admission();
    spdlog::logger &load();
    spdlog::logger &telemetry();

    void flush_all();

  private:
    static void init();

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

spdlog::logger &root();
spdlog::logger &filter();
spdlog::logger &adapter();
spdlog::logger &capability();
spdlog::logger &analyzer();
spdlog::logger &admission();
spdlog::logger &load();
spdlog::logger &telemetry();

inline std::unordered_map<std::string, spdlog::logger*> get_loggers_by_name() {
    return {
        {"root", &root()},
        {"filter", &filter()},
        {"adapter", &adapter()},
        {"capability", &capability()},
        {"analyzer", &analyzer()},
        {"admission", &admission()},
        {"load", &load()},
        {"telemetry", &telemetry()}
    };
}

} //namespace querygate::log
