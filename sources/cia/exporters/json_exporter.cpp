#include "cia/exporters/json_exporter.hpp"

namespace cia::exporters {

    using json = nlohmann::json;

    namespace {

        Result<void, Error> write(std::ostream& stream, const json& output, const ExportOptions& options) {
            stream << (options.pretty_print ? output.dump(2) : output.dump()) << '\n';
            if (!stream) {
                return Result<void, Error>::failure(
                    Error::io_error("Failed to write JSON output", "stream")
                );
            }
            return Result<void, Error>::success();
        }

        template<typename T>
        json array_of(const std::vector<T>& items) {
            json array = json::array();
            for (const auto& item : items) {
                array.push_back(to_json(item));
            }
            return array;
        }

    }  // namespace

    json to_json(const Symbol& symbol) {
        return {
            {"name", symbol.name},
            {"kind", to_string(symbol.kind)},
            {"start_line", symbol.start_line},
            {"end_line", symbol.end_line},
            {"signature", symbol.signature},
            {"exported", symbol.exported},
            {"parameters", symbol.parameters},
            {"return_type", symbol.return_type},
            {"parent", symbol.parent},
            {"file_path", symbol.file_path}
        };
    }

    json to_json(const Reference& reference) {
        return {
            {"file_path", reference.file_path},
            {"line", reference.line},
            {"context", reference.context}
        };
    }

    json to_json(const analysis::BreakingChange& change) {
        json entry;
        entry["type"] = analysis::to_string(change.type);
        entry["symbol"] = to_json(change.symbol);
        if (!change.old_value.empty()) {
            entry["old_value"] = change.old_value;
        }
        if (!change.new_value.empty()) {
            entry["new_value"] = change.new_value;
        }
        entry["file_path"] = change.file_path;
        entry["line"] = change.line;
        entry["severity"] = analysis::to_string(change.severity);
        entry["description"] = change.description;
        if (change.suggestion) {
            entry["suggestion"] = *change.suggestion;
        }
        return entry;
    }

    json to_json(const analysis::BreakingChangeReport& report) {
        json output;
        output["file_name"] = report.file_name;
        output["total_changes"] = report.total_changes;
        output["critical_count"] = report.critical_count;
        output["error_count"] = report.error_count;
        output["warning_count"] = report.warning_count;
        output["changes"] = array_of(report.changes);
        output["summary"] = report.summary;
        output["has_breaking"] = report.has_breaking;
        return output;
    }

    json to_json(const analysis::Impact& impact) {
        json entry;
        entry["changed_symbol"] = to_json(impact.changed_symbol);
        entry["change_kind"] = analysis::to_string(impact.change_kind);
        entry["affected_files"] = impact.affected_files;
        entry["affected_symbols"] = array_of(impact.affected_symbols);
        entry["references"] = array_of(impact.references);
        entry["severity"] = analysis::to_string(impact.severity);
        entry["description"] = impact.description;
        return entry;
    }

    json to_json(const analysis::FileImpact& impact) {
        json output;
        output["file_path"] = impact.file_path;
        output["changed_symbols"] = array_of(impact.changed_symbols);
        output["impacts"] = array_of(impact.impacts);
        output["total_references"] = impact.total_references;
        output["affected_files"] = impact.affected_files;
        output["overall_severity"] = analysis::to_string(impact.overall_severity);
        return output;
    }

    Result<void, Error> JsonExporter::export_to_stream(
        std::ostream& stream,
        const analysis::BreakingChangeReport& report,
        const ExportOptions& options
    ) const {
        return write(stream, to_json(report), options);
    }

    Result<void, Error> JsonExporter::export_to_stream(
        std::ostream& stream,
        const analysis::FileImpact& impact,
        const ExportOptions& options
    ) const {
        return write(stream, to_json(impact), options);
    }

}  // namespace cia::exporters
