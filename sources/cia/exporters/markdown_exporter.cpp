#include "cia/exporters/markdown_exporter.hpp"
#include "cia/utils/string_utils.hpp"

namespace cia::exporters {

    namespace {

        void write_change(std::ostream& stream, const analysis::BreakingChange& change) {
            stream << "**" << analysis::to_string(change.type) << "** `" << change.symbol.name
                   << "` (line " << change.line << ")\n";
            stream << "- " << change.description << "\n";
            if (!change.old_value.empty() && !change.new_value.empty()) {
                stream << "- Changed: `" << change.old_value << "` → `" << change.new_value << "`\n";
            }
            if (change.suggestion && !change.suggestion->empty()) {
                stream << "- 💡 " << *change.suggestion << "\n";
            }
            stream << "\n";
        }

        void write_group(
            std::ostream& stream,
            const analysis::BreakingChangeReport& report,
            const analysis::ChangeSeverity severity,
            const std::string_view heading
        ) {
            stream << heading << "\n\n";
            for (const auto& change : report.changes) {
                if (change.severity == severity) {
                    write_change(stream, change);
                }
            }
        }

        Result<void, Error> finish(const std::ostream& stream) {
            if (!stream) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to write Markdown output", "stream")
                );
            }
            return Result<void, Error>::success();
        }

    }  // namespace

    Result<void, Error> MarkdownExporter::export_to_stream(
        std::ostream& stream,
        const analysis::BreakingChangeReport& report,
        const ExportOptions& options
    ) const {
        const bool show_warnings = options.include_warnings && report.warning_count > 0;
        if (!report.has_breaking && !show_warnings) {
            return finish(stream);
        }

        stream << "## ⚠️ Breaking Change Analysis\n\n";
        stream << "**File:** `" << report.file_name << "`\n";
        stream << "**Summary:** " << report.summary << "\n\n";

        if (report.critical_count > 0) {
            write_group(stream, report, analysis::ChangeSeverity::Critical, "### 🔴 Critical Breaking Changes");
        }
        if (report.error_count > 0) {
            write_group(stream, report, analysis::ChangeSeverity::Error, "### 🟠 Error-Level Breaking Changes");
        }
        if (show_warnings) {
            write_group(stream, report, analysis::ChangeSeverity::Warning, "### 🟡 Warnings");
        }

        return finish(stream);
    }

    Result<void, Error> MarkdownExporter::export_to_stream(
        std::ostream& stream,
        const analysis::FileImpact& impact,
        const ExportOptions& options
    ) const {
        stream << "## Impact Analysis for " << impact.file_path << "\n\n";
        stream << "**Overall Severity:** " << string_utils::to_upper(analysis::to_string(impact.overall_severity)) << "\n";
        stream << "**Changed Symbols:** " << impact.changed_symbols.size() << "\n";
        stream << "**Total References:** " << impact.total_references << "\n";
        stream << "**Affected Files:** " << impact.affected_files.size() << "\n\n";

        if (!impact.affected_files.empty()) {
            stream << "### Affected Files\n";
            for (const auto& file : impact.affected_files) {
                stream << "- " << file << "\n";
            }
            stream << "\n";
        }

        if (!impact.impacts.empty()) {
            stream << "### Symbol Changes\n";
            for (const auto& item : impact.impacts) {
                stream << "\n#### " << to_string(item.changed_symbol.kind) << " `" << item.changed_symbol.name << "`\n";
                stream << "- **Severity:** " << analysis::to_string(item.severity) << "\n";
                stream << "- **Description:** " << item.description << "\n";
                stream << "- **References:** " << item.references.size() << "\n";

                if (!item.references.empty() && item.references.size() <= options.max_listed_references) {
                    stream << "- **Used in:**\n";
                    for (const auto& ref : item.references) {
                        stream << "  - " << ref.file_path << ":" << ref.line << "\n";
                    }
                }
            }
        }

        return finish(stream);
    }

}  // namespace cia::exporters
