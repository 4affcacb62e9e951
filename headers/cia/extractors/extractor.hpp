#ifndef CIA_EXTRACTOR_HPP
#define CIA_EXTRACTOR_HPP

/**
 * @file extractor.hpp
 * @brief Symbol extractor interface and language registry.
 *
 * Each supported language has one ISymbolExtractor. The registry selects
 * an extractor by file extension; files whose extension no extractor
 * claims yield an empty symbol list rather than an error.
 *
 * Supported languages:
 * - Go: full declaration parser, fails on invalid source
 * - TypeScript / JavaScript: line-anchored patterns
 * - Python: line-anchored patterns, indentation for block ends
 * - Rust: line-anchored patterns
 * - Java: line-anchored patterns
 */

#include "cia/result.hpp"
#include "cia/error.hpp"
#include "cia/types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace cia::extractors {

    namespace fs = std::filesystem;

    /**
     * Base interface for all symbol extractors.
     *
     * Implementations are stateless and safe to call from several threads
     * at once.
     */
    class ISymbolExtractor {
    public:
        virtual ~ISymbolExtractor() = default;

        /**
         * Returns the extractor name (e.g., "Go", "TypeScript").
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        [[nodiscard]] virtual Language language() const noexcept = 0;

        /**
         * Returns lower-case extensions including the dot (e.g., {".go"}).
         */
        [[nodiscard]] virtual std::vector<std::string> supported_extensions() const = 0;

        /**
         * Whether extract() rejects syntactically invalid input. Heuristic
         * extractors never fail; they find fewer symbols instead.
         */
        [[nodiscard]] virtual bool validates_syntax() const noexcept {
            return false;
        }

        /**
         * Extracts symbols in source order.
         *
         * @param content The file content.
         * @param file_path Path recorded in every Symbol and in errors.
         */
        [[nodiscard]] virtual Result<std::vector<Symbol>, Error> extract(
            std::string_view content,
            const std::string& file_path
        ) const = 0;
    };

    /**
     * Registry of extractors keyed by language.
     */
    class ExtractorRegistry {
    public:
        /**
         * Gets the process-wide registry, populated with the built-in
         * extractors on first use.
         */
        static ExtractorRegistry& instance();

        /**
         * Registers an extractor, replacing any extractor already
         * registered for the same language.
         */
        void register_extractor(std::unique_ptr<ISymbolExtractor> extractor);

        /**
         * Finds the extractor for a file by its (case-insensitive) extension.
         *
         * @return The extractor, or nullptr for unsupported files.
         */
        [[nodiscard]] ISymbolExtractor* find_extractor_for_file(const fs::path& path) const;

        [[nodiscard]] ISymbolExtractor* get_extractor(Language language) const;

        [[nodiscard]] std::vector<ISymbolExtractor*> list_extractors() const;

    private:
        ExtractorRegistry() = default;
        std::vector<std::unique_ptr<ISymbolExtractor>> extractors_;
    };

    /**
     * Language for a file name by extension: .go; .ts .tsx; .js .jsx .mjs;
     * .py; .rs; .java. Anything else is Language::Unknown.
     */
    [[nodiscard]] Language detect_language(const fs::path& path);

    /**
     * Language name for a file ("go", "typescript", ...), empty if unknown.
     */
    [[nodiscard]] std::string language_name(const fs::path& path);

    /**
     * Extracts symbols from one file with the registered extractor.
     *
     * Unsupported files give an empty list. Go sources that do not parse
     * give a ParseError.
     */
    [[nodiscard]] Result<std::vector<Symbol>, Error> extract_symbols(
        const std::string& file_path,
        std::string_view content
    );

}  // namespace cia::extractors

#endif //CIA_EXTRACTOR_HPP
