#ifndef CIA_IMPACT_ANALYZER_HPP
#define CIA_IMPACT_ANALYZER_HPP

/**
 * @file impact_analyzer.hpp
 * @brief Cross-file impact of changing one file.
 *
 * Callers index every file of interest first, then hand an old/new pair of
 * one file to analyze_impact(). The analysis only uses references already
 * recorded by earlier index calls; it does not rescan the codebase.
 *
 * Severity of one changed symbol:
 * - removed: high, critical if it was exported
 * - added: low
 * - modified: medium, high if the parameter count or return type changed,
 *   critical if it went from exported to unexported
 * - more than critical_reference_threshold references: critical
 * - more than high_reference_threshold references: medium becomes high
 */

#include "cia/analysis/reference_index.hpp"
#include "cia/analysis/symbol_diff.hpp"
#include "cia/config.hpp"
#include "cia/result.hpp"
#include "cia/error.hpp"
#include "cia/types.hpp"

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cia::analysis {

    /**
     * Impact scale: low < medium < high < critical. Unrelated to
     * ChangeSeverity.
     */
    enum class ImpactSeverity {
        Low,
        Medium,
        High,
        Critical
    };

    inline const char* to_string(const ImpactSeverity severity) noexcept {
        switch (severity) {
            case ImpactSeverity::Low:      return "low";
            case ImpactSeverity::Medium:   return "medium";
            case ImpactSeverity::High:     return "high";
            case ImpactSeverity::Critical: return "critical";
        }
        return "unknown";
    }

    struct Impact {
        Symbol changed_symbol;
        ChangeKind change_kind = ChangeKind::Modified;
        std::vector<std::string> affected_files;   ///< Sorted, own file excluded
        std::vector<Symbol> affected_symbols;      ///< Enclosing functions of references
        std::vector<Reference> references;
        ImpactSeverity severity = ImpactSeverity::Low;
        std::string description;
    };

    struct FileImpact {
        std::string file_path;
        std::vector<Symbol> changed_symbols;
        std::vector<Impact> impacts;
        std::size_t total_references = 0;
        std::vector<std::string> affected_files;   ///< Sorted, analyzed file excluded
        ImpactSeverity overall_severity = ImpactSeverity::Low;
    };

    class ImpactAnalyzer {
    public:
        explicit ImpactAnalyzer(ImpactConfig config = {});

        ImpactAnalyzer(const ImpactAnalyzer&) = delete;
        ImpactAnalyzer& operator=(const ImpactAnalyzer&) = delete;

        /**
         * Extracts and indexes one file. A file that does not parse leaves
         * the index untouched.
         */
        [[nodiscard]] Result<void, Error> index_file(const std::string& file_path, std::string_view content);

        /**
         * Extracts all files on the thread pool, then indexes them in the
         * given order. Files that parse are indexed even when others fail;
         * the first failure is returned.
         */
        [[nodiscard]] Result<void, Error> index_files(const std::vector<SourceFile>& files);

        /**
         * Diffs two revisions of @p file_path and rates each changed symbol.
         *
         * An old revision that does not parse is treated as a new file. A new
         * revision that does not parse is a ParseError.
         */
        [[nodiscard]] Result<FileImpact, Error> analyze_impact(
            std::string_view old_content,
            std::string_view new_content,
            const std::string& file_path
        ) const;

        /**
         * Same as analyze_impact() on already extracted symbol lists.
         */
        [[nodiscard]] FileImpact analyze_symbols(
            const std::vector<Symbol>& old_symbols,
            const std::vector<Symbol>& new_symbols,
            const std::string& file_path
        ) const;

        bool remove_file(const std::string& file_path);

        void rebuild_references();

        void clear();

        [[nodiscard]] std::vector<Symbol> symbols_in_file(const std::string& file_path) const;
        [[nodiscard]] std::vector<Symbol> find_symbol(const std::string& name) const;
        [[nodiscard]] std::vector<Reference> symbol_references(const std::string& name) const;
        [[nodiscard]] std::vector<std::string> dependents(const std::string& file_path) const;
        [[nodiscard]] std::vector<std::string> dependencies(const std::string& file_path) const;
        [[nodiscard]] std::vector<std::string> indexed_files() const;
        [[nodiscard]] IndexStats stats() const;

        [[nodiscard]] const ImpactConfig& config() const noexcept {
            return config_;
        }

    private:
        /// Caller holds at least a shared lock.
        [[nodiscard]] Impact rate_change(const SymbolChange& change) const;

        [[nodiscard]] std::vector<Symbol> enclosing_symbols(
            const Symbol& changed,
            const std::vector<Reference>& references
        ) const;

        ImpactConfig config_;
        mutable std::shared_mutex mutex_;
        ReferenceIndex index_;
    };

}  // namespace cia::analysis

#endif //CIA_IMPACT_ANALYZER_HPP
