/* Copyright 2026 Man Group Operations Limited
 *
 * Use of this software is governed by the Business Source License 1.1 included in the file licenses/BSL.txt.
 *
 * As of the Change Date specified in that file, in accordance with the Business Source License, use of this software
 * will be governed by the Apache License, version 2.0.
 */

#include <querygate/log/log.hpp>
#include <querygate/util/preprocess.hpp>
#include <querygate/util/pb_util.hpp>
#include <querygate/util/preconditions.hpp>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/periodic_worker.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/daily_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <filesystem>
#include <mutex>
#include <optional>

namespace querygate::log {

static const char* DefaultLogPattern = "%Y%m%d %H:%M:%S.%f %t %L %n | %v";

namespace {
std::shared_ptr<Loggers> loggers_instance_;
std::once_flag loggers_init_flag_;
} // namespace

struct Loggers::Impl {
    std::mutex config_mutex_;
    std::unordered_map<std::string, spdlog::sink_ptr> sink_by_id_;
    std::unique_ptr<spdlog::logger> unconfigured_ = std::make_unique<spdlog::logger>("querygate",
        std::make_shared<spdlog::sinks::stderr_sink_mt>());
    std::unique_ptr<spdlog::logger> root_;
    std::unique_ptr<spdlog::logger> filter_;
    std::unique_ptr<spdlog::logger> adapter_;
    std::unique_ptr<spdlog::logger> capability_;
    std::unique_ptr<spdlog::logger> analyzer_;
    std::unique_ptr<spdlog::logger> admission_;
    std::unique_ptr<spdlog::logger> load_;
    std::unique_ptr<spdlog::logger> telemetry_;
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::optional<spdlog::details::periodic_worker> periodic_worker_;

    void configure_logger(const querygate::proto::logger::LoggerConfig& conf,
        const std::string& name,
        std::unique_ptr<spdlog::logger>& logger);

    spdlog::logger& logger_ref(std::unique_ptr<spdlog::logger>& src);
};

constexpr auto get_default_log_level() {
    return spdlog::level::info;
}

spdlog::logger &root() {
    return Loggers::instance().root();
}

spdlog::logger &filter() {
    return Loggers::instance().filter();
}

spdlog::logger &adapter() {
    return Loggers::instance().adapter();
}

spdlog::logger &capability() {
    return Loggers::instance().capability();
}

spdlog::logger &analyzer() {
    return Loggers::instance().analyzer();
}

spdlog::logger &admission() {
    return Loggers::instance().admission();
}

spdlog::logger &load() {
    return Loggers::instance().load();
}

spdlog::logger &telemetry() {
    return Loggers::instance().telemetry();
}

namespace fs = std::filesystem;

using SinkConf = querygate::proto::logger::SinkConfig;

Loggers::Loggers()
        : impl_(std::make_unique<Impl>()) {
    impl_->unconfigured_->set_level(get_default_log_level());
    impl_->unconfigured_->set_pattern(DefaultLogPattern);
}

Loggers::~Loggers() = default;

Loggers& Loggers::instance() {
    std::call_once(loggers_init_flag_, &Loggers::init);
    return *loggers_instance_;
}

spdlog::logger &Loggers::root() {
    return impl_->logger_ref(impl_->root_);
}

spdlog::logger &Loggers::filter() {
    return impl_->logger_ref(impl_->filter_);
}

spdlog::logger &Loggers::adapter() {
    return impl_->logger_ref(impl_->adapter_);
}

spdlog::logger &Loggers::capability() {
    return impl_->logger_ref(impl_->capability_);
}

spdlog::logger &Loggers::analyzer() {
    return impl_->logger_ref(impl_->analyzer_);
}

spdlog::logger &Loggers::admission() {
    return impl_->logger_ref(impl_->admission_);
}

spdlog::logger &Loggers::load() {
    return impl_->logger_ref(impl_->load_);
}

spdlog::logger &Loggers::telemetry() {
    return impl_->logger_ref(impl_->telemetry_);
}

void Loggers::flush_all() {
    root().flush();
    filter().flush();
    adapter().flush();
    capability().flush();
    analyzer().flush();
    admission().flush();
    load().flush();
    telemetry().flush();
}

void Loggers::init() {
    loggers_instance_ = std::make_shared<Loggers>();
}

namespace {
std::string make_parent_dir(const std::string &p_str, std::string_view def_p_str) {
    fs::path p;
    if (p_str.empty()) {
        p = fs::path(def_p_str);
    } else {
        p = fs::path(p_str);
    }
    if (p.has_parent_path() && !fs::exists(p.parent_path())) {
        fs::create_directories(p.parent_path());
    }
    return p.generic_string();
}
}

spdlog::logger& Loggers::Impl::logger_ref(std::unique_ptr<spdlog::logger>& src) {
    if (QUERYGATE_LIKELY(bool(src)))
        return *src;

    return *unconfigured_;
}

bool Loggers::configure(const querygate::proto::logger::LoggersConfig &conf, bool force) {
    auto lock = std::scoped_lock(impl_->config_mutex_);
    if (!force && impl_->root_)
        return false;

    if (force) {
        impl_->periodic_worker_.reset();
        impl_->sink_by_id_.clear();
    }

    // Configure async behavior
    if (conf.has_async()) {
        impl_->thread_pool_ = std::make_shared<spdlog::details::thread_pool>(
            util::as_opt(conf.async().queue_size()).value_or(8192),
            util::as_opt(conf.async().thread_pool_size()).value_or(1)
        );
    }

    // Configure the sinks
    for (auto &&[sink_id, sink_conf] : conf.sink_by_id()) {
        switch (sink_conf.sink_case()) {
            case SinkConf::kConsole:
                if (sink_conf.console().has_color()) {
                    if (sink_conf.console().std_err()) {
                        impl_->sink_by_id_.try_emplace(sink_id, std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
                    } else {
                        impl_->sink_by_id_.try_emplace(sink_id, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
                    }
                } else {
                    if (sink_conf.console().std_err()) {
                        impl_->sink_by_id_.try_emplace(sink_id, std::make_shared<spdlog::sinks::stderr_sink_mt>());
                    } else {
                        impl_->sink_by_id_.try_emplace(sink_id, std::make_shared<spdlog::sinks::stdout_sink_mt>());
                    }
                }
                break;
            case SinkConf::kFile:
                impl_->sink_by_id_.try_emplace(sink_id, std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                    make_parent_dir(sink_conf.file().path(), "./querygate.basic.log")
                ));
                break;
            case SinkConf::kRotFile:
                impl_->sink_by_id_.try_emplace(sink_id, std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    make_parent_dir(sink_conf.rot_file().path(), "./querygate.rot.log"),
                    util::as_opt(sink_conf.rot_file().max_size_bytes()).value_or(64ULL* (1ULL<< 20)),
                    util::as_opt(sink_conf.rot_file().max_file_count()).value_or(8)
                ));
                break;
            case SinkConf::kDailyFile:
                impl_->sink_by_id_.try_emplace(sink_id, std::make_shared<spdlog::sinks::daily_file_sink_mt>(
                    make_parent_dir(sink_conf.daily_file().path(), "./querygate.daily.log"),
                    static_cast<int>(sink_conf.daily_file().utc_rotation_hour()),
                    static_cast<int>(sink_conf.daily_file().utc_rotation_minute())
                ));
                break;
            default:
                user_input::raise<ErrorCode::E_INVALID_CONFIG>("Sink '{}' has no sink type: {}", sink_id, util::format(sink_conf));
        }
    }

    // Now associate loggers with sinks
    auto check_and_configure = [&](
        const std::string &name,
        const std::string &fallback,
        auto &logger) {
        const auto& logger_by_id = conf.logger_by_id();
        if (auto it = logger_by_id.find(name); it != logger_by_id.end()) {
            impl_->configure_logger(it->second, name, logger);
        } else {
            user_input::check<ErrorCode::E_INVALID_CONFIG>(!fallback.empty(),
                "Logger '{}' has no configuration and no fallback", name);
            impl_->configure_logger(logger_by_id.at(fallback), name, logger);
        }
    };

    check_and_configure("root", std::string(), impl_->root_);
    check_and_configure("filter", "root", impl_->filter_);
    check_and_configure("adapter", "root", impl_->adapter_);
    check_and_configure("capability", "root", impl_->capability_);
    check_and_configure("analyzer", "root", impl_->analyzer_);
    check_and_configure("admission", "root", impl_->admission_);
    check_and_configure("load", "root", impl_->load_);
    check_and_configure("telemetry", "root", impl_->telemetry_);

    if (auto flush_sec = util::as_opt(conf.flush_interval_seconds()).value_or(1); flush_sec > 0) {
        impl_->periodic_worker_.emplace(
            [loggers = std::weak_ptr(loggers_instance_)]() {
                if (auto l = loggers.lock()) {
                    l->flush_all();
                }
            }, std::chrono::seconds(flush_sec));
    }
    return true;
}

void Loggers::Impl::configure_logger(
        const querygate::proto::logger::LoggerConfig &conf,
        const std::string &name,
        std::unique_ptr<spdlog::logger> &logger) {
    std::vector<spdlog::sink_ptr> sink_ptrs;
    for (const auto& sink_id : conf.sink_ids()) {
        if (auto it = sink_by_id_.find(sink_id); it != sink_by_id_.end()) {
            sink_ptrs.push_back(it->second);
        } else {
            user_input::raise<ErrorCode::E_INVALID_CONFIG>("Logger '{}' refers to unknown sink '{}'", name, sink_id);
        }
    }
    auto fq_name = fmt::format("querygate.{}", name);
    if (thread_pool_) {
        logger = std::make_unique<spdlog::async_logger>(fq_name, sink_ptrs.begin(), sink_ptrs.end(),
            thread_pool_, spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_unique<spdlog::logger>(fq_name, sink_ptrs.begin(), sink_ptrs.end());
    }

    if (!conf.pattern().empty())
        logger->set_pattern(conf.pattern());
    else
        logger->set_pattern(DefaultLogPattern);

    if (conf.level() != 0)
        logger->set_level(static_cast<spdlog::level::level_enum>(conf.level() - 1));
    else
        logger->set_level(get_default_log_level());
}

} // namespace querygate::log
