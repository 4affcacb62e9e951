#ifndef CIA_JAVA_EXTRACTOR_HPP
#define CIA_JAVA_EXTRACTOR_HPP

/**
 * @file java_extractor.hpp
 * @brief Heuristic extractor for Java.
 *
 * Classes and interfaces (with their modifiers) and methods declared with
 * an explicit access modifier and a return type; constructors are not
 * reported. Methods take the innermost enclosing class or interface as
 * parent. Exported means "public".
 */

#include "cia/extractors/extractor.hpp"

namespace cia::extractors {

    class JavaSymbolExtractor : public ISymbolExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "Java";
        }

        [[nodiscard]] Language language() const noexcept override {
            return Language::Java;
        }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            return {".java"};
        }

        [[nodiscard]] Result<std::vector<Symbol>, Error> extract(
            std::string_view content,
            const std::string& file_path
        ) const override;
    };

    void register_java_extractor(ExtractorRegistry& registry);

}  // namespace cia::extractors

#endif //CIA_JAVA_EXTRACTOR_HPP
