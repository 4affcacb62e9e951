#include "cia/analysis/breaking_change.hpp"
#include "cia/analysis/symbol_diff.hpp"
#include "cia/extractors/extractor.hpp"
#include "cia/utils/logging.hpp"
#include "cia/utils/string_utils.hpp"

#include <algorithm>
#include <iterator>
#include <sstream>

namespace cia::analysis {

    namespace {

        constexpr const char* kExternalConsumers =
            "This breaks all external consumers. Consider keeping it exported or deprecating first";

        std::string quoted(const Symbol& symbol) {
            return std::string(to_string(symbol.kind)) + " '" + symbol.name + "'";
        }

        std::string parameter_count(const std::size_t count) {
            return std::to_string(count) + " parameters";
        }

        BreakingChange make_change(
            const BreakingChangeType type,
            const Symbol& symbol,
            const std::string& file_path,
            const ChangeSeverity severity
        ) {
            BreakingChange change;
            change.type = type;
            change.symbol = symbol;
            change.file_path = file_path;
            change.line = symbol.start_line;
            change.severity = severity;
            return change;
        }

        /// Same kind, name equal ignoring case but not identical.
        const Symbol* find_case_rename(const Symbol& removed, const std::vector<Symbol>& new_symbols) {
            const auto it = std::ranges::find_if(new_symbols, [&](const Symbol& candidate) {
                return candidate.kind == removed.kind
                    && candidate.name != removed.name
                    && string_utils::equals_ignore_case(candidate.name, removed.name);
            });
            return it == new_symbols.end() ? nullptr : &*it;
        }

        void detect_parameter_changes(
            const Symbol& before,
            const Symbol& after,
            const std::string& file_path,
            std::vector<BreakingChange>& out
        ) {
            const auto& old_params = before.parameters;
            const auto& new_params = after.parameters;

            if (new_params.size() > old_params.size()) {
                auto change = make_change(BreakingChangeType::RequiredParameter, after, file_path, ChangeSeverity::Error);
                change.old_value = parameter_count(old_params.size());
                change.new_value = parameter_count(new_params.size());
                change.description = quoted(after) + " added "
                    + std::to_string(new_params.size() - old_params.size()) + " required parameter(s)";
                change.suggestion = "Consider making new parameters optional or provide a new overload";
                out.push_back(std::move(change));
            }

            if (new_params.size() < old_params.size()) {
                auto change = make_change(BreakingChangeType::ParameterChange, after, file_path, ChangeSeverity::Warning);
                change.old_value = parameter_count(old_params.size());
                change.new_value = parameter_count(new_params.size());
                change.description = quoted(after) + " removed "
                    + std::to_string(old_params.size() - new_params.size()) + " parameter(s)";
                change.suggestion = "Verify callers don't rely on removed parameters";
                out.push_back(std::move(change));
            }

            const std::size_t common = std::min(old_params.size(), new_params.size());
            for (std::size_t i = 0; i < common; ++i) {
                if (old_params[i] == new_params[i]) {
                    continue;
                }
                auto change = make_change(BreakingChangeType::ParameterChange, after, file_path, ChangeSeverity::Error);
                change.old_value = old_params[i];
                change.new_value = new_params[i];
                change.description = quoted(after) + " parameter " + std::to_string(i + 1)
                    + " changed from '" + old_params[i] + "' to '" + new_params[i] + "'";
                change.suggestion = "Consider if this change is backward compatible";
                out.push_back(std::move(change));
            }
        }

        std::string summarize(const BreakingChangeReport& report) {
            if (report.total_changes == 0) {
                return "No breaking changes detected";
            }

            std::vector<std::string> parts;
            if (report.critical_count > 0) {
                parts.push_back(std::to_string(report.critical_count) + " critical");
            }
            if (report.error_count > 0) {
                parts.push_back(std::to_string(report.error_count) + " error");
            }
            if (report.warning_count > 0) {
                parts.push_back(std::to_string(report.warning_count) + " warning");
            }

            std::ostringstream ss;
            ss << "Found " << report.total_changes << " breaking changes: "
               << string_utils::join(parts, ", ");
            return ss.str();
        }

    }  // namespace

    Result<BreakingChangeReport, Error> BreakingChangeDetector::detect(
        const std::string_view old_content,
        const std::string_view new_content,
        const std::string& file_path
    ) const {
        std::vector<Symbol> old_symbols;
        if (auto old_result = extractors::extract_symbols(file_path, old_content); old_result.is_ok()) {
            old_symbols = std::move(old_result.value());
        } else {
            logging::logger()->debug("{}: old revision does not parse, treating as new file ({})",
                                     file_path, old_result.error().message());
        }

        auto new_result = extractors::extract_symbols(file_path, new_content);
        if (new_result.is_err()) {
            return Result<BreakingChangeReport, Error>::failure(
                new_result.error().wrap("failed to parse new content"));
        }

        return Result<BreakingChangeReport, Error>::success(
            compare(old_symbols, new_result.value(), file_path));
    }

    BreakingChangeReport BreakingChangeDetector::compare(
        const std::vector<Symbol>& old_symbols,
        const std::vector<Symbol>& new_symbols,
        const std::string& file_path
    ) const {
        BreakingChangeReport report;
        report.file_name = file_path;

        const SymbolMap old_map(old_symbols);
        const SymbolMap new_map(new_symbols);

        for (const auto& old_symbol : old_map.symbols()) {
            if (new_map.contains(SymbolKey::of(old_symbol)) || !old_symbol.exported) {
                continue;
            }

            if (const Symbol* renamed = find_case_rename(old_symbol, new_symbols)) {
                auto change = make_change(BreakingChangeType::VisibilityChange, *renamed, file_path,
                                          ChangeSeverity::Critical);
                change.old_value = "exported";
                change.new_value = "unexported";
                change.description = quoted(old_symbol) + " changed from exported to unexported (renamed to '"
                    + renamed->name + "')";
                change.suggestion = kExternalConsumers;
                report.changes.push_back(std::move(change));
                continue;
            }

            auto change = make_change(BreakingChangeType::Removal, old_symbol, file_path, ChangeSeverity::Critical);
            change.old_value = old_symbol.signature;
            change.description = "Exported " + quoted(old_symbol) + " was removed";
            change.suggestion = "If this removal is intentional, consider deprecating first or updating documentation";
            report.changes.push_back(std::move(change));
        }

        for (const auto& new_symbol : new_map.symbols()) {
            const Symbol* old_symbol = old_map.find(SymbolKey::of(new_symbol));
            if (old_symbol == nullptr) {
                continue;
            }
            if (!old_symbol->exported && !new_symbol.exported) {
                continue;
            }

            if (old_symbol->exported && !new_symbol.exported) {
                auto change = make_change(BreakingChangeType::VisibilityChange, new_symbol, file_path,
                                          ChangeSeverity::Critical);
                change.old_value = "exported";
                change.new_value = "unexported";
                change.description = quoted(new_symbol) + " changed from exported to unexported";
                change.suggestion = kExternalConsumers;
                report.changes.push_back(std::move(change));
                continue;
            }

            const std::size_t before = report.changes.size();
            detect_parameter_changes(*old_symbol, new_symbol, file_path, report.changes);

            if (old_symbol->return_type != new_symbol.return_type
                && !old_symbol->return_type.empty() && !new_symbol.return_type.empty()) {
                auto change = make_change(BreakingChangeType::ReturnTypeChange, new_symbol, file_path,
                                          ChangeSeverity::Error);
                change.old_value = old_symbol->return_type;
                change.new_value = new_symbol.return_type;
                change.description = quoted(new_symbol) + " return type changed from '"
                    + old_symbol->return_type + "' to '" + new_symbol.return_type + "'";
                change.suggestion = "Consider if this change is backward compatible or create a new function";
                report.changes.push_back(std::move(change));
            }

            const bool already_reported = report.changes.size() != before;
            if (!already_reported && old_symbol->signature != new_symbol.signature
                && !old_symbol->signature.empty() && !new_symbol.signature.empty()) {
                auto change = make_change(BreakingChangeType::SignatureChange, new_symbol, file_path,
                                          ChangeSeverity::Warning);
                change.old_value = old_symbol->signature;
                change.new_value = new_symbol.signature;
                change.description = quoted(new_symbol) + " signature changed";
                change.suggestion = "Review if this change affects callers";
                report.changes.push_back(std::move(change));
            }
        }

        for (const auto& change : report.changes) {
            switch (change.severity) {
                case ChangeSeverity::Critical: ++report.critical_count; break;
                case ChangeSeverity::Error:    ++report.error_count; break;
                case ChangeSeverity::Warning:  ++report.warning_count; break;
            }
        }
        report.total_changes = report.changes.size();
        report.has_breaking = report.critical_count > 0 || report.error_count > 0;
        report.summary = summarize(report);

        logging::logger()->debug("{}: {}", file_path, report.summary);
        return report;
    }

    std::vector<BreakingChange> get_breaking_changes(const BreakingChangeReport& report) {
        std::vector<BreakingChange> breaking;
        std::ranges::copy_if(report.changes, std::back_inserter(breaking),
                             [](const BreakingChange& change) { return change.is_breaking(); });
        return breaking;
    }

}  // namespace cia::analysis
