#include "cia/session.hpp"
#include "cia/utils/file_utils.hpp"
#include "cia/utils/logging.hpp"

namespace cia {

    namespace {

        template<typename T, typename F>
        Result<T, Error> guarded(const Result<void, Error>& state, F&& f) {
            if (state.is_err()) {
                return Result<T, Error>::failure(state.error());
            }
            return Result<T, Error>::success(std::forward<F>(f)());
        }

    }  // namespace

    Session::Session(Config config)
        : config_(std::move(config))
        , analyzer_(std::make_unique<analysis::ImpactAnalyzer>(config_.impact)) {}

    Result<Session, Error> Session::open(Config config) {
        if (auto valid = config.validate(); valid.is_err()) {
            return Result<Session, Error>::failure(valid.error());
        }

        logging::set_level(config.logging.level);
        logging::logger()->info("session opened (reindex policy {})", to_string(config.impact.reindex_policy));
        return Result<Session, Error>::success(Session(std::move(config)));
    }

    Result<void, Error> Session::close() {
        if (analyzer_) {
            const auto stats = analyzer_->stats();
            analyzer_.reset();
            logging::logger()->info("session closed ({} files, {} symbols, {} references discarded)",
                                    stats.files, stats.symbols, stats.references);
        }
        return Result<void, Error>::success();
    }

    Result<void, Error> Session::ensure_open() const {
        if (!analyzer_) {
            return Result<void, Error>::failure(Error::invalid_state("Session is closed"));
        }
        return Result<void, Error>::success();
    }

    Result<void, Error> Session::index_file(const std::string& file_path, const std::string_view content) {
        if (auto state = ensure_open(); state.is_err()) {
            return state;
        }
        return analyzer_->index_file(file_path, content);
    }

    Result<void, Error> Session::index_files(const std::vector<SourceFile>& files) {
        if (auto state = ensure_open(); state.is_err()) {
            return state;
        }
        return analyzer_->index_files(files);
    }

    Result<void, Error> Session::index_path(const fs::path& path) {
        if (auto state = ensure_open(); state.is_err()) {
            return state;
        }

        auto content = file_utils::read_file(path);
        if (content.is_err()) {
            return Result<void, Error>::failure(content.error());
        }
        return analyzer_->index_file(path.string(), content.value());
    }

    Result<void, Error> Session::remove_file(const std::string& file_path) {
        if (auto state = ensure_open(); state.is_err()) {
            return state;
        }
        if (!analyzer_->remove_file(file_path)) {
            return Result<void, Error>::failure(Error::not_found("File is not indexed", file_path));
        }
        return Result<void, Error>::success();
    }

    Result<void, Error> Session::rebuild_references() {
        if (auto state = ensure_open(); state.is_err()) {
            return state;
        }
        analyzer_->rebuild_references();
        return Result<void, Error>::success();
    }

    Result<analysis::BreakingChangeReport, Error> Session::detect_breaking_changes(
        const std::string_view old_content,
        const std::string_view new_content,
        const std::string& file_path
    ) const {
        if (auto state = ensure_open(); state.is_err()) {
            return Result<analysis::BreakingChangeReport, Error>::failure(state.error());
        }
        return detector_.detect(old_content, new_content, file_path);
    }

    Result<analysis::FileImpact, Error> Session::analyze_impact(
        const std::string_view old_content,
        const std::string_view new_content,
        const std::string& file_path
    ) const {
        if (auto state = ensure_open(); state.is_err()) {
            return Result<analysis::FileImpact, Error>::failure(state.error());
        }
        return analyzer_->analyze_impact(old_content, new_content, file_path);
    }

    Result<std::vector<Symbol>, Error> Session::symbols_in_file(const std::string& file_path) const {
        return guarded<std::vector<Symbol>>(ensure_open(), [&] { return analyzer_->symbols_in_file(file_path); });
    }

    Result<std::vector<Symbol>, Error> Session::find_symbol(const std::string& name) const {
        return guarded<std::vector<Symbol>>(ensure_open(), [&] { return analyzer_->find_symbol(name); });
    }

    Result<std::vector<Reference>, Error> Session::symbol_references(const std::string& name) const {
        return guarded<std::vector<Reference>>(ensure_open(), [&] { return analyzer_->symbol_references(name); });
    }

    Result<std::vector<std::string>, Error> Session::dependents(const std::string& file_path) const {
        return guarded<std::vector<std::string>>(ensure_open(), [&] { return analyzer_->dependents(file_path); });
    }

    Result<std::vector<std::string>, Error> Session::dependencies(const std::string& file_path) const {
        return guarded<std::vector<std::string>>(ensure_open(), [&] { return analyzer_->dependencies(file_path); });
    }

    Result<analysis::IndexStats, Error> Session::stats() const {
        return guarded<analysis::IndexStats>(ensure_open(), [&] { return analyzer_->stats(); });
    }

    Result<std::string, Error> Session::render(
        const analysis::BreakingChangeReport& report,
        const exporters::ExportFormat format
    ) const {
        return exporters::ExporterFactory::create(format).and_then([&](const auto& exporter) {
            return exporter->export_to_string(report, exporters::ExportOptions::from_config(config_.report));
        });
    }

    Result<std::string, Error> Session::render(
        const analysis::FileImpact& impact,
        const exporters::ExportFormat format
    ) const {
        return exporters::ExporterFactory::create(format).and_then([&](const auto& exporter) {
            return exporter->export_to_string(impact, exporters::ExportOptions::from_config(config_.report));
        });
    }

}  // namespace cia
