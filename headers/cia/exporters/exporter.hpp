#ifndef CIA_EXPORTER_HPP
#define CIA_EXPORTER_HPP

/**
 * @file exporter.hpp
 * @brief Renderers for breaking-change reports and file impacts.
 *
 * Formats:
 * - Markdown: human-readable text for review comments
 * - JSON: machine-readable, snake_case keys
 *
 * Rendering never changes a report; exporters are stateless.
 */

#include "cia/analysis/breaking_change.hpp"
#include "cia/analysis/impact_analyzer.hpp"
#include "cia/config.hpp"
#include "cia/result.hpp"
#include "cia/error.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace cia::exporters {

    namespace fs = std::filesystem;

    enum class ExportFormat {
        JSON,
        Markdown
    };

    struct ExportOptions {
        bool pretty_print = true;                  // JSON indentation
        std::size_t max_listed_references = 10;    // Markdown impact reference list
        bool include_warnings = true;              // Markdown breaking report

        static ExportOptions from_config(const ReportConfig& config) {
            ExportOptions options;
            options.max_listed_references = config.max_listed_references;
            options.include_warnings = config.include_warnings;
            return options;
        }
    };

    /**
     * Interface for all exporters.
     */
    class IExporter {
    public:
        virtual ~IExporter() = default;

        [[nodiscard]] virtual ExportFormat format() const noexcept = 0;

        /**
         * Returns the file extension for this format, including the dot.
         */
        [[nodiscard]] virtual std::string_view file_extension() const noexcept = 0;

        [[nodiscard]] virtual std::string_view format_name() const noexcept = 0;

        [[nodiscard]] virtual Result<void, Error> export_to_stream(
            std::ostream& stream,
            const analysis::BreakingChangeReport& report,
            const ExportOptions& options
        ) const = 0;

        [[nodiscard]] virtual Result<void, Error> export_to_stream(
            std::ostream& stream,
            const analysis::FileImpact& impact,
            const ExportOptions& options
        ) const = 0;

        [[nodiscard]] Result<std::string, Error> export_to_string(
            const analysis::BreakingChangeReport& report,
            const ExportOptions& options = {}
        ) const;

        [[nodiscard]] Result<std::string, Error> export_to_string(
            const analysis::FileImpact& impact,
            const ExportOptions& options = {}
        ) const;

        /**
         * Renders into @p path, creating parent directories.
         */
        [[nodiscard]] Result<void, Error> export_to_file(
            const fs::path& path,
            const analysis::BreakingChangeReport& report,
            const ExportOptions& options = {}
        ) const;

        [[nodiscard]] Result<void, Error> export_to_file(
            const fs::path& path,
            const analysis::FileImpact& impact,
            const ExportOptions& options = {}
        ) const;
    };

    class ExporterFactory {
    public:
        [[nodiscard]] static Result<std::unique_ptr<IExporter>, Error> create(ExportFormat format);

        /**
         * Picks the format from the extension: .json, .md or .markdown.
         */
        [[nodiscard]] static Result<std::unique_ptr<IExporter>, Error> create_for_file(const fs::path& path);

        [[nodiscard]] static std::vector<ExportFormat> available_formats();
    };

    [[nodiscard]] std::string_view format_to_string(ExportFormat format) noexcept;

    [[nodiscard]] std::optional<ExportFormat> string_to_format(std::string_view str) noexcept;

}  // namespace cia::exporters

#endif //CIA_EXPORTER_HPP
