#include "cia/utils/logging.hpp"
#include "cia/utils/string_utils.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <string>

namespace cia::logging {

    namespace {

        constexpr auto kLoggerName = "cia";

        spdlog::level::level_enum to_spdlog(const LogLevel level) {
            switch (level) {
                case LogLevel::Trace: return spdlog::level::trace;
                case LogLevel::Debug: return spdlog::level::debug;
                case LogLevel::Info:  return spdlog::level::info;
                case LogLevel::Warn:  return spdlog::level::warn;
                case LogLevel::Error: return spdlog::level::err;
                case LogLevel::Off:   return spdlog::level::off;
            }
            return spdlog::level::warn;
        }

        LogLevel from_spdlog(const spdlog::level::level_enum level) {
            switch (level) {
                case spdlog::level::trace:    return LogLevel::Trace;
                case spdlog::level::debug:    return LogLevel::Debug;
                case spdlog::level::info:     return LogLevel::Info;
                case spdlog::level::warn:     return LogLevel::Warn;
                case spdlog::level::err:
                case spdlog::level::critical: return LogLevel::Error;
                default:                      return LogLevel::Off;
            }
        }

        std::shared_ptr<spdlog::logger> create_logger() {
            if (auto existing = spdlog::get(kLoggerName)) {
                return existing;
            }
            auto created = spdlog::stderr_color_mt(kLoggerName);
            created->set_level(spdlog::level::warn);
            created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            return created;
        }

    }  // namespace

    std::shared_ptr<spdlog::logger> logger() {
        static std::shared_ptr<spdlog::logger> instance = create_logger();
        return instance;
    }

    void set_level(const LogLevel level) {
        logger()->set_level(to_spdlog(level));
    }

    LogLevel level() {
        return from_spdlog(logger()->level());
    }

    Result<LogLevel, Error> level_from_string(const std::string_view name) {
        const std::string lower = string_utils::to_lower(string_utils::trim(name));

        if (lower == "trace") return Result<LogLevel, Error>::success(LogLevel::Trace);
        if (lower == "debug") return Result<LogLevel, Error>::success(LogLevel::Debug);
        if (lower == "info") return Result<LogLevel, Error>::success(LogLevel::Info);
        if (lower == "warn" || lower == "warning") return Result<LogLevel, Error>::success(LogLevel::Warn);
        if (lower == "error") return Result<LogLevel, Error>::success(LogLevel::Error);
        if (lower == "off") return Result<LogLevel, Error>::success(LogLevel::Off);

        return Result<LogLevel, Error>::failure(
            Error::config_error("Unknown log level", std::string(name))
        );
    }

    const char* to_string(const LogLevel level) noexcept {
        switch (level) {
            case LogLevel::Trace: return "trace";
            case LogLevel::Debug: return "debug";
            case LogLevel::Info:  return "info";
            case LogLevel::Warn:  return "warn";
            case LogLevel::Error: return "error";
            case LogLevel::Off:   return "off";
        }
        return "warn";
    }

}  // namespace cia::logging
