/** \file logging.cpp
 *  \brief spdlog-backed library logger.
 */

#include "visage/core/logging.hpp"
#include "visage/core/platform_utils.hpp"

#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace visage::core {

namespace {

constexpr const char* kLoggerName = "visage";

struct LoggerState {
    std::shared_ptr<spdlog::sinks::dist_sink_mt> fanout;
    std::shared_ptr<spdlog::logger> logger;
};

auto output_sink(const LogParams& params) -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (params.color) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    }
    sink->set_pattern(params.pattern);
    return sink;
}

auto effective_level(const LogParams& params) -> spdlog::level::level_enum {
    if (auto env = getenv_nonempty("VISAGE_LOG_LEVEL")) {
        return spdlog::level::from_str(*env);
    }
    return spdlog::level::from_str(params.level);
}

// The logger object lives for the whole process. Reconfiguration swaps the
// fan-out sink's children under its own mutex; the logger is never replaced.
auto state() -> LoggerState& {
    static LoggerState s = [] {
        const LogParams defaults;
        LoggerState st;
        st.fanout = std::make_shared<spdlog::sinks::dist_sink_mt>();
        st.fanout->set_sinks({output_sink(defaults)});
        st.logger = std::make_shared<spdlog::logger>(kLoggerName, st.fanout);
        st.logger->set_level(effective_level(defaults));
        return st;
    }();
    return s;
}

} // anonymous namespace

auto init_logging(const LogParams& params) -> std::shared_ptr<spdlog::logger> {
    auto& st = state();
    st.fanout->set_sinks({output_sink(params)});
    st.logger->set_level(effective_level(params));
    return st.logger;
}

auto logger() -> spdlog::logger& {
    return *state().logger;
}

} // namespace visage::core
