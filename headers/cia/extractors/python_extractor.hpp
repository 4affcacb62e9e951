#ifndef CIA_PYTHON_EXTRACTOR_HPP
#define CIA_PYTHON_EXTRACTOR_HPP

/**
 * @file python_extractor.hpp
 * @brief Heuristic extractor for Python.
 *
 * Top-level "class Name" and "[async] def name(params) -> Ret:" at column
 * zero, indented "def" inside a class as methods (self/cls dropped from
 * the parameters), and module constants written in UPPER_CASE. Block ends
 * come from indentation. Names starting with '_' are not exported.
 */

#include "cia/extractors/extractor.hpp"

namespace cia::extractors {

    class PythonSymbolExtractor : public ISymbolExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "Python";
        }

        [[nodiscard]] Language language() const noexcept override {
            return Language::Python;
        }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            return {".py"};
        }

        [[nodiscard]] Result<std::vector<Symbol>, Error> extract(
            std::string_view content,
            const std::string& file_path
        ) const override;
    };

    void register_python_extractor(ExtractorRegistry& registry);

}  // namespace cia::extractors

#endif //CIA_PYTHON_EXTRACTOR_HPP
