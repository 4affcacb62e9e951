#ifndef CIA_MARKDOWN_EXPORTER_HPP
#define CIA_MARKDOWN_EXPORTER_HPP

#include "cia/exporters/exporter.hpp"

namespace cia::exporters {

    /**
     * Markdown rendering for review comments.
     *
     * A breaking-change report with neither breaking changes nor rendered
     * warnings produces no output. Changes are grouped critical, error,
     * warning. A file impact lists each changed symbol and, when there are
     * at most max_listed_references, where it is used.
     */
    class MarkdownExporter : public IExporter {
    public:
        [[nodiscard]] ExportFormat format() const noexcept override { return ExportFormat::Markdown; }
        [[nodiscard]] std::string_view file_extension() const noexcept override { return ".md"; }
        [[nodiscard]] std::string_view format_name() const noexcept override { return "Markdown"; }

        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream,
            const analysis::BreakingChangeReport& report,
            const ExportOptions& options
        ) const override;

        [[nodiscard]] Result<void, Error> export_to_stream(
            std::ostream& stream,
            const analysis::FileImpact& impact,
            const ExportOptions& options
        ) const override;
    };

}  // namespace cia::exporters

#endif //CIA_MARKDOWN_EXPORTER_HPP
