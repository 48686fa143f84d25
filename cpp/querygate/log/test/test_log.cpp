/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/log/log.hpp>

#include <gtest/gtest.h>
#include <google/protobuf/text_format.h>

TEST(TestLog, SmokeTest) { querygate::log::root().info("Some msg"); }

TEST(TestLog, ConfigureSingleton) {
    std::string txt_conf = R"pb(
sink_by_id {
    key: "console"
    value {
        console {
            has_color: true
            std_err: true
        }
    }
}
logger_by_id {
    key: "root"
    value {
        pattern: "*** [%H:%M:%S %z] [thread %t] %v ***"
        sink_ids: "console"
    }
}
logger_by_id {
    key: "admission"
    value {
        level: DEBUG
        sink_ids: "console"
    }
}
    )pb";
    querygate::proto::logger::LoggersConfig cfg;
    ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(txt_conf, &cfg));
    querygate::log::Loggers::instance().configure(cfg, true);
    querygate::log::root().info("Some msg");
    querygate::log::admission().debug("Admission msg");
}

TEST(TestLog, EveryNamedLoggerIsReachable) {
    const auto loggers = querygate::log::get_loggers_by_name();
    for (const auto* name : {"root", "filter", "adapter", "capability", "analyzer", "admission", "load", "telemetry"}) {
        auto it = loggers.find(name);
        ASSERT_NE(it, loggers.end()) << name;
        ASSERT_NE(it->second, nullptr) << name;
    }
}
