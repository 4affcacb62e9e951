#ifndef CIA_SESSION_HPP
#define CIA_SESSION_HPP

/**
 * @file session.hpp
 * @brief One analysis session: configuration, index and detectors.
 *
 * The reference index lives exactly as long as the session. After close()
 * every operation fails with InvalidState. close() must not race with
 * other calls on the same session; all other operations may be called
 * from several threads.
 */

#include "cia/analysis/breaking_change.hpp"
#include "cia/analysis/impact_analyzer.hpp"
#include "cia/config.hpp"
#include "cia/exporters/exporter.hpp"
#include "cia/result.hpp"
#include "cia/error.hpp"
#include "cia/types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cia {

    namespace fs = std::filesystem;

    class Session {
    public:
        /**
         * Validates @p config, applies its log level and creates an empty
         * index.
         */
        [[nodiscard]] static Result<Session, Error> open(Config config = Config::default_config());

        /**
         * Discards the index. Closing a closed session is a no-op.
         */
        Result<void, Error> close();

        [[nodiscard]] bool is_open() const noexcept {
            return analyzer_ != nullptr;
        }

        [[nodiscard]] const Config& config() const noexcept {
            return config_;
        }

        [[nodiscard]] Result<void, Error> index_file(const std::string& file_path, std::string_view content);

        [[nodiscard]] Result<void, Error> index_files(const std::vector<SourceFile>& files);

        /**
         * Reads @p path from disk and indexes it under its string form.
         */
        [[nodiscard]] Result<void, Error> index_path(const fs::path& path);

        /**
         * Removes a file's contributions. NotFound if it was never indexed.
         */
        [[nodiscard]] Result<void, Error> remove_file(const std::string& file_path);

        [[nodiscard]] Result<void, Error> rebuild_references();

        [[nodiscard]] Result<analysis::BreakingChangeReport, Error> detect_breaking_changes(
            std::string_view old_content,
            std::string_view new_content,
            const std::string& file_path
        ) const;

        [[nodiscard]] Result<analysis::FileImpact, Error> analyze_impact(
            std::string_view old_content,
            std::string_view new_content,
            const std::string& file_path
        ) const;

        [[nodiscard]] Result<std::vector<Symbol>, Error> symbols_in_file(const std::string& file_path) const;
        [[nodiscard]] Result<std::vector<Symbol>, Error> find_symbol(const std::string& name) const;
        [[nodiscard]] Result<std::vector<Reference>, Error> symbol_references(const std::string& name) const;
        [[nodiscard]] Result<std::vector<std::string>, Error> dependents(const std::string& file_path) const;
        [[nodiscard]] Result<std::vector<std::string>, Error> dependencies(const std::string& file_path) const;
        [[nodiscard]] Result<analysis::IndexStats, Error> stats() const;

        /**
         * Renders with the session's [report] settings.
         */
        [[nodiscard]] Result<std::string, Error> render(
            const analysis::BreakingChangeReport& report,
            exporters::ExportFormat format = exporters::ExportFormat::Markdown
        ) const;

        [[nodiscard]] Result<std::string, Error> render(
            const analysis::FileImpact& impact,
            exporters::ExportFormat format = exporters::ExportFormat::Markdown
        ) const;

    private:
        explicit Session(Config config);

        [[nodiscard]] Result<void, Error> ensure_open() const;

        Config config_;
        analysis::BreakingChangeDetector detector_;
        std::unique_ptr<analysis::ImpactAnalyzer> analyzer_;
    };

}  // namespace cia

#endif //CIA_SESSION_HPP
