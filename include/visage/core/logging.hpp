#pragma once

/** \file logging.hpp
 *  \brief Library logger (spdlog) and its setup.
 *
 * All components log through one named logger, "visage". Messages carry a
 * bracketed component tag, e.g. "[rebuild] ...". If init_logging() is never
 * called, logger() lazily creates a stderr logger at info level.
 */

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace visage::core {

/** \brief Logger configuration. */
struct LogParams {
    std::string level{"info"};        /**< trace|debug|info|warn|error|critical|off */
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    bool color{true};                 /**< colored stderr sink */
};

/** \brief Reconfigure the "visage" logger in place.
 *
 * VISAGE_LOG_LEVEL, when set, overrides params.level.
 * Thread-safety: safe to call while other threads log. The logger object is
 * created once per process and never destroyed by reconfiguration, so
 * references returned by logger() stay valid.
 */
auto init_logging(const LogParams& params = {}) -> std::shared_ptr<spdlog::logger>;

/** \brief The library logger. Valid for the lifetime of the process. */
auto logger() -> spdlog::logger&;

} // namespace visage::core
