#include "cia/extractors/extractor.hpp"
#include "cia/extractors/all_extractors.hpp"
#include "cia/utils/file_utils.hpp"
#include "cia/utils/logging.hpp"

#include <algorithm>

namespace cia::extractors {

    ExtractorRegistry& ExtractorRegistry::instance() {
        static ExtractorRegistry registry;
        static const bool populated = [] {
            register_builtin_extractors(registry);
            return true;
        }();
        (void)populated;
        return registry;
    }

    void ExtractorRegistry::register_extractor(std::unique_ptr<ISymbolExtractor> extractor) {
        if (!extractor) {
            return;
        }

        logging::logger()->debug("registering {} extractor", extractor->name());

        const auto existing = std::ranges::find_if(extractors_, [&](const auto& registered) {
            return registered->language() == extractor->language();
        });
        if (existing != extractors_.end()) {
            *existing = std::move(extractor);
            return;
        }
        extractors_.push_back(std::move(extractor));
    }

    ISymbolExtractor* ExtractorRegistry::find_extractor_for_file(const fs::path& path) const {
        const auto ext = file_utils::extension_of(path);
        if (ext.empty()) {
            return nullptr;
        }

        for (const auto& extractor : extractors_) {
            auto extensions = extractor->supported_extensions();
            if (std::ranges::find(extensions, ext) != extensions.end()) {
                return extractor.get();
            }
        }

        return nullptr;
    }

    ISymbolExtractor* ExtractorRegistry::get_extractor(const Language language) const {
        for (const auto& extractor : extractors_) {
            if (extractor->language() == language) {
                return extractor.get();
            }
        }
        return nullptr;
    }

    std::vector<ISymbolExtractor*> ExtractorRegistry::list_extractors() const {
        std::vector<ISymbolExtractor*> result;
        result.reserve(extractors_.size());

        for (const auto& extractor : extractors_) {
            result.push_back(extractor.get());
        }

        return result;
    }

    Language detect_language(const fs::path& path) {
        const auto ext = file_utils::extension_of(path);

        if (ext == ".go") return Language::Go;
        if (ext == ".ts" || ext == ".tsx") return Language::TypeScript;
        if (ext == ".js" || ext == ".jsx" || ext == ".mjs") return Language::JavaScript;
        if (ext == ".py") return Language::Python;
        if (ext == ".rs") return Language::Rust;
        if (ext == ".java") return Language::Java;
        return Language::Unknown;
    }

    std::string language_name(const fs::path& path) {
        const Language language = detect_language(path);
        if (language == Language::Unknown) {
            return "";
        }
        return to_string(language);
    }

    Result<std::vector<Symbol>, Error> extract_symbols(const std::string& file_path, const std::string_view content) {
        const auto* extractor = ExtractorRegistry::instance().find_extractor_for_file(file_path);
        if (!extractor) {
            return Result<std::vector<Symbol>, Error>::success({});
        }
        return extractor->extract(content, file_path);
    }

}  // namespace cia::extractors
