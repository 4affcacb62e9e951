#ifndef CIA_TYPESCRIPT_EXTRACTOR_HPP
#define CIA_TYPESCRIPT_EXTRACTOR_HPP

/**
 * @file typescript_extractor.hpp
 * @brief Heuristic extractor for TypeScript and JavaScript.
 *
 * Recognised at the start of a line:
 *   [export] [default] [abstract] class Name
 *   [export] [declare] interface Name
 *   [export] [declare] type Name
 *   [export] [default] [async] function Name<...>(params): Ret
 *   [export] const Name = [async] (params): Ret =>
 *   [export] const Name
 * and, inside a class body, indented methods "name(params): Ret {".
 *
 * Arrow-function bindings are reported once, as functions, never also as
 * constants. Exported means an "export" keyword precedes the declaration.
 */

#include "cia/extractors/extractor.hpp"

namespace cia::extractors {

    class TypeScriptSymbolExtractor : public ISymbolExtractor {
    public:
        /**
         * @param language Language::TypeScript or Language::JavaScript.
         */
        explicit TypeScriptSymbolExtractor(Language language = Language::TypeScript)
            : language_(language) {}

        [[nodiscard]] std::string_view name() const noexcept override {
            return language_ == Language::JavaScript ? "JavaScript" : "TypeScript";
        }

        [[nodiscard]] Language language() const noexcept override {
            return language_;
        }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            if (language_ == Language::JavaScript) {
                return {".js", ".jsx", ".mjs"};
            }
            return {".ts", ".tsx"};
        }

        [[nodiscard]] Result<std::vector<Symbol>, Error> extract(
            std::string_view content,
            const std::string& file_path
        ) const override;

    private:
        Language language_;
    };

    /**
     * Registers the TypeScript and JavaScript extractors with @p registry.
     */
    void register_typescript_extractors(ExtractorRegistry& registry);

}  // namespace cia::extractors

#endif //CIA_TYPESCRIPT_EXTRACTOR_HPP
