#ifndef CIA_ERROR_HPP
#define CIA_ERROR_HPP

/**
 * @file error.hpp
 * @brief Structured error type carried by Result<T, Error>.
 *
 * Error categories:
 * - InvalidArgument: a caller passed an unusable value
 * - NotFound: a file or entry does not exist
 * - ParseError: source text is not valid for its language
 * - IoError: reading or writing a file failed
 * - ConfigError: configuration could not be parsed or validated
 * - AnalysisError: diffing or impact analysis could not complete
 * - InvalidState: the object is not usable (e.g. a closed session)
 * - InternalError: unexpected failure inside the library
 *
 * Rendering: "[ParseError] expected ')' (context: main.go:4:17)"
 */

#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace cia {

    enum class ErrorCode {
        None,
        InvalidArgument,
        NotFound,
        ParseError,
        IoError,
        ConfigError,
        AnalysisError,
        InvalidState,
        InternalError
    };

    inline const char* error_code_to_string(const ErrorCode code) noexcept {
        switch (code) {
            case ErrorCode::None:            return "None";
            case ErrorCode::InvalidArgument: return "InvalidArgument";
            case ErrorCode::NotFound:        return "NotFound";
            case ErrorCode::ParseError:      return "ParseError";
            case ErrorCode::IoError:         return "IoError";
            case ErrorCode::ConfigError:     return "ConfigError";
            case ErrorCode::AnalysisError:   return "AnalysisError";
            case ErrorCode::InvalidState:    return "InvalidState";
            case ErrorCode::InternalError:   return "InternalError";
        }
        return "Unknown";
    }

    /**
     * Immutable error value: a code, a message and optional context such as
     * a file path or a "file:line:column" position.
     */
    class Error {
    public:
        Error(const ErrorCode code, std::string message)
            : code_(code)
            , message_(std::move(message)) {}

        Error(const ErrorCode code, std::string message, std::string context)
            : code_(code)
            , message_(std::move(message))
            , context_(std::move(context)) {}

        static Error invalid_argument(std::string message) {
            return {ErrorCode::InvalidArgument, std::move(message)};
        }

        static Error invalid_argument(std::string message, std::string context) {
            return {ErrorCode::InvalidArgument, std::move(message), std::move(context)};
        }

        static Error not_found(std::string message, std::string context) {
            return {ErrorCode::NotFound, std::move(message), std::move(context)};
        }

        static Error parse_error(std::string message) {
            return {ErrorCode::ParseError, std::move(message)};
        }

        static Error parse_error(std::string message, std::string context) {
            return {ErrorCode::ParseError, std::move(message), std::move(context)};
        }

        static Error io_error(std::string message, std::string context) {
            return {ErrorCode::IoError, std::move(message), std::move(context)};
        }

        static Error config_error(std::string message) {
            return {ErrorCode::ConfigError, std::move(message)};
        }

        static Error config_error(std::string message, std::string context) {
            return {ErrorCode::ConfigError, std::move(message), std::move(context)};
        }

        static Error analysis_error(std::string message, std::string context) {
            return {ErrorCode::AnalysisError, std::move(message), std::move(context)};
        }

        static Error invalid_state(std::string message) {
            return {ErrorCode::InvalidState, std::move(message)};
        }

        static Error internal_error(std::string message) {
            return {ErrorCode::InternalError, std::move(message)};
        }

        [[nodiscard]] ErrorCode code() const noexcept {
            return code_;
        }

        [[nodiscard]] const std::string& message() const noexcept {
            return message_;
        }

        [[nodiscard]] const std::optional<std::string>& context() const noexcept {
            return context_;
        }

        [[nodiscard]] bool has_context() const noexcept {
            return context_.has_value();
        }

        /**
         * Returns a copy whose message is prefixed with @p outer, keeping the
         * original code and context. Used when a lower layer's failure is
         * reported by a higher-level operation.
         */
        [[nodiscard]] Error wrap(const std::string& outer) const {
            Error wrapped = *this;
            wrapped.message_ = outer + ": " + message_;
            return wrapped;
        }

        /**
         * Returns a copy with @p additional appended to the context.
         */
        [[nodiscard]] Error with_context(std::string additional) const {
            if (context_.has_value()) {
                return {code_, message_, *context_ + "; " + std::move(additional)};
            }
            return {code_, message_, std::move(additional)};
        }

        [[nodiscard]] std::string to_string() const {
            std::string result = "[";
            result += error_code_to_string(code_);
            result += "] ";
            result += message_;
            if (context_.has_value()) {
                result += " (context: ";
                result += *context_;
                result += ")";
            }
            return result;
        }

        bool operator==(const Error& other) const = default;

    private:
        ErrorCode code_;
        std::string message_;
        std::optional<std::string> context_;
    };

    inline std::ostream& operator<<(std::ostream& os, const Error& error) {
        return os << error.to_string();
    }

    inline std::ostream& operator<<(std::ostream& os, const ErrorCode code) {
        return os << error_code_to_string(code);
    }

}  // namespace cia

#endif //CIA_ERROR_HPP
