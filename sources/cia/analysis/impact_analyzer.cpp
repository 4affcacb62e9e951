#include "cia/analysis/impact_analyzer.hpp"
#include "cia/extractors/extractor.hpp"
#include "cia/utils/logging.hpp"
#include "cia/utils/parallel.hpp"
#include "cia/utils/string_utils.hpp"

#include <algorithm>
#include <mutex>
#include <optional>
#include <set>

namespace cia::analysis {

    namespace {

        std::vector<Symbol> extract_old_revision(const std::string& file_path, const std::string_view content) {
            auto result = extractors::extract_symbols(file_path, content);
            if (result.is_err()) {
                logging::logger()->debug("{}: old revision does not parse, treating as new file ({})",
                                         file_path, result.error().message());
                return {};
            }
            return std::move(result).value();
        }

        std::string describe_modification(const Symbol& before, const Symbol& after, ImpactSeverity& severity) {
            std::vector<std::string> changes;
            severity = ImpactSeverity::Medium;

            if (before.signature != after.signature) {
                changes.emplace_back("signature");
            }
            if (before.parameters.size() != after.parameters.size()) {
                changes.emplace_back("parameters");
                severity = ImpactSeverity::High;
            } else if (before.parameters != after.parameters) {
                changes.emplace_back("parameters");
            }
            if (before.return_type != after.return_type) {
                changes.emplace_back("return type");
                severity = ImpactSeverity::High;
            }
            if (before.exported != after.exported) {
                changes.emplace_back("visibility");
                if (before.exported && !after.exported) {
                    severity = ImpactSeverity::Critical;
                }
            }

            return "Symbol '" + after.name + "' modified: " + string_utils::join(changes, ", ");
        }

    }  // namespace

    ImpactAnalyzer::ImpactAnalyzer(ImpactConfig config)
        : config_(std::move(config))
        , index_(config_.comment_prefixes) {}

    Result<void, Error> ImpactAnalyzer::index_file(const std::string& file_path, const std::string_view content) {
        auto symbols = extractors::extract_symbols(file_path, content);
        if (symbols.is_err()) {
            return Result<void, Error>::failure(symbols.error().wrap("failed to parse " + file_path));
        }

        std::unique_lock lock(mutex_);
        index_.add_file(file_path, content, std::move(symbols).value(), config_.reindex_policy);
        return Result<void, Error>::success();
    }

    Result<void, Error> ImpactAnalyzer::index_files(const std::vector<SourceFile>& files) {
        auto extracted = parallel::map(files, [](const SourceFile& file) {
            return extractors::extract_symbols(file.path, file.content);
        });

        std::optional<Error> first_error;
        std::size_t indexed = 0;
        {
            std::unique_lock lock(mutex_);
            for (std::size_t i = 0; i < files.size(); ++i) {
                if (extracted[i].is_err()) {
                    if (!first_error) {
                        first_error = extracted[i].error().wrap("failed to parse " + files[i].path);
                    }
                    continue;
                }
                index_.add_file(files[i].path, files[i].content, std::move(extracted[i]).value(),
                                config_.reindex_policy);
                ++indexed;
            }
        }

        logging::logger()->info("indexed {}/{} files", indexed, files.size());
        if (first_error) {
            return Result<void, Error>::failure(*first_error);
        }
        return Result<void, Error>::success();
    }

    Result<FileImpact, Error> ImpactAnalyzer::analyze_impact(
        const std::string_view old_content,
        const std::string_view new_content,
        const std::string& file_path
    ) const {
        const auto old_symbols = extract_old_revision(file_path, old_content);

        auto new_symbols = extractors::extract_symbols(file_path, new_content);
        if (new_symbols.is_err()) {
            return Result<FileImpact, Error>::failure(new_symbols.error().wrap("failed to parse new content"));
        }

        return Result<FileImpact, Error>::success(analyze_symbols(old_symbols, new_symbols.value(), file_path));
    }

    FileImpact ImpactAnalyzer::analyze_symbols(
        const std::vector<Symbol>& old_symbols,
        const std::vector<Symbol>& new_symbols,
        const std::string& file_path
    ) const {
        FileImpact result;
        result.file_path = file_path;

        const auto changes = diff_symbols(SymbolMap(old_symbols), SymbolMap(new_symbols));
        std::set<std::string> affected;

        {
            std::shared_lock lock(mutex_);
            for (const auto& change : changes) {
                result.changed_symbols.push_back(change.symbol());
                Impact impact = rate_change(change);
                result.total_references += impact.references.size();
                affected.insert(impact.affected_files.begin(), impact.affected_files.end());
                result.overall_severity = std::max(result.overall_severity, impact.severity);
                result.impacts.push_back(std::move(impact));
            }
        }

        affected.erase(file_path);
        result.affected_files.assign(affected.begin(), affected.end());

        logging::logger()->debug("{}: {} changed symbols, {} references, overall {}",
                                 file_path, result.changed_symbols.size(), result.total_references,
                                 to_string(result.overall_severity));
        return result;
    }

    Impact ImpactAnalyzer::rate_change(const SymbolChange& change) const {
        Impact impact;
        impact.changed_symbol = change.symbol();
        impact.change_kind = change.kind;
        impact.references = index_.symbol_references(impact.changed_symbol.name);

        std::set<std::string> files;
        for (const auto& ref : impact.references) {
            if (ref.file_path != impact.changed_symbol.file_path) {
                files.insert(ref.file_path);
            }
        }
        impact.affected_files.assign(files.begin(), files.end());
        impact.affected_symbols = enclosing_symbols(impact.changed_symbol, impact.references);

        const Symbol& symbol = impact.changed_symbol;
        switch (change.kind) {
            case ChangeKind::Removed:
                impact.severity = ImpactSeverity::High;
                impact.description = "Symbol '" + symbol.name + "' was removed";
                if (symbol.exported) {
                    impact.severity = ImpactSeverity::Critical;
                    impact.description += " (was exported/public)";
                }
                break;
            case ChangeKind::Added:
                impact.severity = ImpactSeverity::Low;
                impact.description = "New symbol '" + symbol.name + "' added";
                break;
            case ChangeKind::Modified:
                impact.description = describe_modification(*change.before, *change.after, impact.severity);
                break;
        }

        const std::size_t count = impact.references.size();
        if (count > config_.critical_reference_threshold) {
            impact.severity = ImpactSeverity::Critical;
        } else if (count > config_.high_reference_threshold && impact.severity == ImpactSeverity::Medium) {
            impact.severity = ImpactSeverity::High;
        }

        return impact;
    }

    std::vector<Symbol> ImpactAnalyzer::enclosing_symbols(
        const Symbol& changed,
        const std::vector<Reference>& references
    ) const {
        std::vector<Symbol> result;
        std::set<std::pair<std::string, SymbolKey>> seen;
        const auto changed_key = SymbolKey::of(changed);

        for (const auto& ref : references) {
            const auto candidates = index_.symbols_in_file(ref.file_path);
            const Symbol* innermost = nullptr;
            for (const auto& candidate : candidates) {
                if (!candidate.is_callable() || !candidate.contains_line(ref.line)) {
                    continue;
                }
                if (innermost == nullptr
                    || candidate.end_line - candidate.start_line < innermost->end_line - innermost->start_line) {
                    innermost = &candidate;
                }
            }
            if (innermost == nullptr) {
                continue;
            }

            auto key = SymbolKey::of(*innermost);
            if (innermost->file_path == changed.file_path && key == changed_key) {
                continue;
            }
            if (seen.emplace(innermost->file_path, std::move(key)).second) {
                result.push_back(*innermost);
            }
        }
        return result;
    }

    bool ImpactAnalyzer::remove_file(const std::string& file_path) {
        std::unique_lock lock(mutex_);
        return index_.remove_file(file_path);
    }

    void ImpactAnalyzer::rebuild_references() {
        std::unique_lock lock(mutex_);
        index_.rebuild_references();
    }

    void ImpactAnalyzer::clear() {
        std::unique_lock lock(mutex_);
        index_.clear();
    }

    std::vector<Symbol> ImpactAnalyzer::symbols_in_file(const std::string& file_path) const {
        std::shared_lock lock(mutex_);
        return index_.symbols_in_file(file_path);
    }

    std::vector<Symbol> ImpactAnalyzer::find_symbol(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return index_.find_symbol(name);
    }

    std::vector<Reference> ImpactAnalyzer::symbol_references(const std::string& name) const {
        std::shared_lock lock(mutex_);
        return index_.symbol_references(name);
    }

    std::vector<std::string> ImpactAnalyzer::dependents(const std::string& file_path) const {
        std::shared_lock lock(mutex_);
        return index_.dependents(file_path);
    }

    std::vector<std::string> ImpactAnalyzer::dependencies(const std::string& file_path) const {
        std::shared_lock lock(mutex_);
        return index_.dependencies(file_path);
    }

    std::vector<std::string> ImpactAnalyzer::indexed_files() const {
        std::shared_lock lock(mutex_);
        return index_.indexed_files();
    }

    IndexStats ImpactAnalyzer::stats() const {
        std::shared_lock lock(mutex_);
        return index_.stats();
    }

}  // namespace cia::analysis
