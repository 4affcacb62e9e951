#ifndef CIA_CONFIG_HPP
#define CIA_CONFIG_HPP

/**
 * @file config.hpp
 * @brief Analysis configuration loaded from TOML.
 *
 * Defaults reproduce the documented analyzer behaviour, so an empty
 * configuration file is equivalent to default_config().
 */

#include "cia/result.hpp"
#include "cia/error.hpp"
#include "cia/utils/logging.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cia {

    /**
     * What indexing a file path a second time does to its earlier entries.
     */
    enum class ReindexPolicy {
        Append,   ///< Earlier symbols and references stay in the index
        Replace   ///< Earlier contributions of the file are removed first
    };

    const char* to_string(ReindexPolicy policy) noexcept;

    Result<ReindexPolicy, Error> reindex_policy_from_string(const std::string& name);

    struct ImpactConfig {
        std::size_t high_reference_threshold = 10;
        std::size_t critical_reference_threshold = 50;
        ReindexPolicy reindex_policy = ReindexPolicy::Append;
        std::vector<std::string> comment_prefixes = {"//", "#", "/*"};
    };

    struct ReportConfig {
        std::size_t max_listed_references = 10;
        bool include_warnings = true;
    };

    struct LoggingConfig {
        logging::LogLevel level = logging::LogLevel::Warn;
    };

    class Config {
    public:
        Config() = default;

        ImpactConfig impact;
        ReportConfig report;
        LoggingConfig logging;

        /**
         * Load configuration from a TOML file.
         *
         * @return The parsed and validated configuration, NotFound if the
         *         file does not exist, ConfigError if it is invalid.
         */
        static Result<Config, Error> load_from_file(const std::string& path);

        /**
         * Load configuration from TOML text.
         */
        static Result<Config, Error> load_from_string(const std::string& content);

        static Config default_config();

        /**
         * Serialize to TOML text that load_from_string() reads back.
         */
        [[nodiscard]] std::string to_string() const;

        [[nodiscard]] Result<void, Error> save_to_file(const std::string& path) const;

        /**
         * Checks thresholds are ordered and comment prefixes are non-empty.
         */
        [[nodiscard]] Result<void, Error> validate() const;
    };

}  // namespace cia

#endif //CIA_CONFIG_HPP
