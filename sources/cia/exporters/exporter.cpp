#include "cia/exporters/exporter.hpp"
#include "cia/exporters/json_exporter.hpp"
#include "cia/exporters/markdown_exporter.hpp"
#include "cia/utils/file_utils.hpp"

#include <sstream>

namespace cia::exporters {

    namespace {

        template<typename Report>
        Result<std::string, Error> render(const IExporter& exporter, const Report& report,
                                          const ExportOptions& options) {
            std::ostringstream ss;
            if (auto result = exporter.export_to_stream(ss, report, options); result.is_err()) {
                return Result<std::string, Error>::failure(result.error());
            }
            return Result<std::string, Error>::success(ss.str());
        }

        template<typename Report>
        Result<void, Error> render_to_file(const IExporter& exporter, const fs::path& path,
                                           const Report& report, const ExportOptions& options) {
            auto content = render(exporter, report, options);
            if (content.is_err()) {
                return Result<void, Error>::failure(content.error());
            }
            return file_utils::write_file(path, content.value());
        }

    }  // namespace

    std::string_view format_to_string(const ExportFormat format) noexcept {
        switch (format) {
            case ExportFormat::JSON:     return "json";
            case ExportFormat::Markdown: return "markdown";
        }
        return "unknown";
    }

    std::optional<ExportFormat> string_to_format(const std::string_view str) noexcept {
        if (str == "json" || str == "JSON") return ExportFormat::JSON;
        if (str == "markdown" || str == "md" || str == "Markdown") return ExportFormat::Markdown;
        return std::nullopt;
    }

    // =============================================================================
    // IExporter
    // =============================================================================

    Result<std::string, Error> IExporter::export_to_string(
        const analysis::BreakingChangeReport& report,
        const ExportOptions& options
    ) const {
        return render(*this, report, options);
    }

    Result<std::string, Error> IExporter::export_to_string(
        const analysis::FileImpact& impact,
        const ExportOptions& options
    ) const {
        return render(*this, impact, options);
    }

    Result<void, Error> IExporter::export_to_file(
        const fs::path& path,
        const analysis::BreakingChangeReport& report,
        const ExportOptions& options
    ) const {
        return render_to_file(*this, path, report, options);
    }

    Result<void, Error> IExporter::export_to_file(
        const fs::path& path,
        const analysis::FileImpact& impact,
        const ExportOptions& options
    ) const {
        return render_to_file(*this, path, impact, options);
    }

    // =============================================================================
    // Exporter Factory
    // =============================================================================

    Result<std::unique_ptr<IExporter>, Error> ExporterFactory::create(const ExportFormat format) {
        switch (format) {
        case ExportFormat::JSON:
            return Result<std::unique_ptr<IExporter>, Error>::success(
                std::make_unique<JsonExporter>()
            );
        case ExportFormat::Markdown:
            return Result<std::unique_ptr<IExporter>, Error>::success(
                std::make_unique<MarkdownExporter>()
            );
        }
        return Result<std::unique_ptr<IExporter>, Error>::failure(
            Error::invalid_argument("Unknown export format")
        );
    }

    Result<std::unique_ptr<IExporter>, Error> ExporterFactory::create_for_file(const fs::path& path) {
        const std::string ext = file_utils::extension_of(path);

        if (ext == ".json") return create(ExportFormat::JSON);
        if (ext == ".md" || ext == ".markdown") return create(ExportFormat::Markdown);

        return Result<std::unique_ptr<IExporter>, Error>::failure(
            Error::invalid_argument("Cannot determine format from extension: " + ext, path.string())
        );
    }

    std::vector<ExportFormat> ExporterFactory::available_formats() {
        return {ExportFormat::JSON, ExportFormat::Markdown};
    }

}  // namespace cia::exporters
