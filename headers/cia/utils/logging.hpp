#ifndef CIA_LOGGING_HPP
#define CIA_LOGGING_HPP

/**
 * @file logging.hpp
 * @brief Library logger.
 *
 * All components log through one named spdlog logger ("cia") writing to
 * stderr. The logger is created on first use with level warn.
 */

#include "cia/result.hpp"
#include "cia/error.hpp"

#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace cia::logging {

    enum class LogLevel {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Off
    };

    /**
     * Returns the shared "cia" logger, creating it if needed.
     */
    std::shared_ptr<spdlog::logger> logger();

    void set_level(LogLevel level);

    [[nodiscard]] LogLevel level();

    /**
     * Parses "trace", "debug", "info", "warn", "error" or "off"
     * (case-insensitive; "warning" is accepted for warn).
     */
    Result<LogLevel, Error> level_from_string(std::string_view name);

    const char* to_string(LogLevel level) noexcept;

}  // namespace cia::logging

#endif //CIA_LOGGING_HPP
