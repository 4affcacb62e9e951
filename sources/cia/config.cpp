#include "cia/config.hpp"
#include "cia/utils/file_utils.hpp"
#include "cia/utils/string_utils.hpp"

#include <toml++/toml.h>

#include <cstdint>
#include <sstream>

namespace cia {

    namespace {

        Result<std::size_t, Error> read_count(const toml::table& table, const char* key, const std::size_t fallback) {
            const auto node = table[key];
            if (!node) {
                return Result<std::size_t, Error>::success(fallback);
            }
            if (!node.is_integer()) {
                return Result<std::size_t, Error>::failure(
                    Error::config_error(std::string(key) + " must be an integer")
                );
            }
            const auto value = node.value_or(std::int64_t{0});
            if (value < 0) {
                return Result<std::size_t, Error>::failure(
                    Error::config_error(std::string(key) + " must be non-negative")
                );
            }
            return Result<std::size_t, Error>::success(static_cast<std::size_t>(value));
        }

        std::string quote(const std::string& s) {
            return "\"" + string_utils::replace_all(string_utils::replace_all(s, "\\", "\\\\"), "\"", "\\\"") + "\"";
        }

    }  // namespace

    const char* to_string(const ReindexPolicy policy) noexcept {
        switch (policy) {
            case ReindexPolicy::Append:  return "append";
            case ReindexPolicy::Replace: return "replace";
        }
        return "append";
    }

    Result<ReindexPolicy, Error> reindex_policy_from_string(const std::string& name) {
        const std::string lower = string_utils::to_lower(name);
        if (lower == "append") return Result<ReindexPolicy, Error>::success(ReindexPolicy::Append);
        if (lower == "replace") return Result<ReindexPolicy, Error>::success(ReindexPolicy::Replace);
        return Result<ReindexPolicy, Error>::failure(
            Error::config_error("Unknown reindex policy", name)
        );
    }

    Result<Config, Error> Config::load_from_file(const std::string& path) {
        auto content = file_utils::read_file(path);
        if (!content) {
            return Result<Config, Error>::failure(content.error());
        }

        auto config = load_from_string(content.value());
        if (!config) {
            return Result<Config, Error>::failure(config.error().with_context(path));
        }
        return config;
    }

    Result<Config, Error> Config::load_from_string(const std::string& content) {
        toml::table tbl;
        try {
            tbl = toml::parse(content);
        } catch (const toml::parse_error& err) {
            return Result<Config, Error>::failure(
                Error::config_error("Failed to parse TOML configuration: " + std::string(err.description()))
            );
        }

        Config config;

        if (const auto* impact = tbl["impact"].as_table()) {
            auto high = read_count(*impact, "high_reference_threshold", config.impact.high_reference_threshold);
            if (!high) {
                return Result<Config, Error>::failure(high.error());
            }
            config.impact.high_reference_threshold = high.value();

            auto critical = read_count(*impact, "critical_reference_threshold", config.impact.critical_reference_threshold);
            if (!critical) {
                return Result<Config, Error>::failure(critical.error());
            }
            config.impact.critical_reference_threshold = critical.value();

            if ((*impact)["reindex_policy"]) {
                auto policy = reindex_policy_from_string((*impact)["reindex_policy"].value_or(std::string{}));
                if (!policy) {
                    return Result<Config, Error>::failure(policy.error());
                }
                config.impact.reindex_policy = policy.value();
            }

            if (const auto* prefixes = (*impact)["comment_prefixes"].as_array()) {
                config.impact.comment_prefixes.clear();
                for (const auto& prefix : *prefixes) {
                    config.impact.comment_prefixes.emplace_back(prefix.value_or(std::string{}));
                }
            }
        }

        if (const auto* report = tbl["report"].as_table()) {
            auto listed = read_count(*report, "max_listed_references", config.report.max_listed_references);
            if (!listed) {
                return Result<Config, Error>::failure(listed.error());
            }
            config.report.max_listed_references = listed.value();

            if ((*report)["include_warnings"])
                config.report.include_warnings = (*report)["include_warnings"].value_or(true);
        }

        if (const auto* log = tbl["logging"].as_table()) {
            if ((*log)["level"]) {
                auto level = logging::level_from_string((*log)["level"].value_or(std::string{"warn"}));
                if (!level) {
                    return Result<Config, Error>::failure(level.error());
                }
                config.logging.level = level.value();
            }
        }

        if (auto validation = config.validate(); !validation) {
            return Result<Config, Error>::failure(validation.error());
        }

        return Result<Config, Error>::success(std::move(config));
    }

    Config Config::default_config() {
        return Config{};
    }

    std::string Config::to_string() const {
        std::ostringstream ss;

        ss << "[impact]\n";
        ss << "high_reference_threshold = " << impact.high_reference_threshold << "\n";
        ss << "critical_reference_threshold = " << impact.critical_reference_threshold << "\n";
        ss << "reindex_policy = \"" << cia::to_string(impact.reindex_policy) << "\"\n";
        ss << "comment_prefixes = [";
        for (std::size_t i = 0; i < impact.comment_prefixes.size(); ++i) {
            if (i > 0) ss << ", ";
            ss << quote(impact.comment_prefixes[i]);
        }
        ss << "]\n\n";

        ss << "[report]\n";
        ss << "max_listed_references = " << report.max_listed_references << "\n";
        ss << "include_warnings = " << (report.include_warnings ? "true" : "false") << "\n\n";

        ss << "[logging]\n";
        ss << "level = \"" << logging::to_string(logging.level) << "\"\n";

        return ss.str();
    }

    Result<void, Error> Config::save_to_file(const std::string& path) const {
        return file_utils::write_file(path, to_string());
    }

    Result<void, Error> Config::validate() const {
        std::vector<std::string> errors;

        if (impact.critical_reference_threshold < impact.high_reference_threshold) {
            errors.emplace_back("critical_reference_threshold must not be below high_reference_threshold");
        }

        for (const auto& prefix : impact.comment_prefixes) {
            if (string_utils::trim(prefix).empty()) {
                errors.emplace_back("comment_prefixes must not contain empty entries");
                break;
            }
        }

        if (!errors.empty()) {
            return Result<void, Error>::failure(
                Error::config_error("Configuration validation failed: " + string_utils::join(errors, "; "))
            );
        }

        return Result<void, Error>::success();
    }

}  // namespace cia
