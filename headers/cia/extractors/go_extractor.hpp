#ifndef CIA_GO_EXTRACTOR_HPP
#define CIA_GO_EXTRACTOR_HPP

/**
 * @file go_extractor.hpp
 * @brief Go symbol extractor built on the tree-sitter-go grammar.
 *
 * Produces:
 * - function / method (receiver type without '*' as parent)
 * - struct / interface / type for type declarations
 * - variable / constant per declared name
 *
 * Declarations inside function bodies are reported too. Exported means
 * the name starts with an upper-case letter. A tree with syntax errors,
 * or a file that breaks Go's file-scope rules, fails with a ParseError
 * whose context is "file:line:column".
 */

#include "cia/extractors/extractor.hpp"

namespace cia::extractors {

    class GoSymbolExtractor : public ISymbolExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "Go";
        }

        [[nodiscard]] Language language() const noexcept override {
            return Language::Go;
        }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            return {".go"};
        }

        [[nodiscard]] bool validates_syntax() const noexcept override {
            return true;
        }

        [[nodiscard]] Result<std::vector<Symbol>, Error> extract(
            std::string_view content,
            const std::string& file_path
        ) const override;
    };

    /**
     * Registers the Go extractor with @p registry.
     */
    void register_go_extractor(ExtractorRegistry& registry);

}  // namespace cia::extractors

#endif //CIA_GO_EXTRACTOR_HPP
