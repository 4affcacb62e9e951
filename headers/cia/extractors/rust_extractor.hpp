#ifndef CIA_RUST_EXTRACTOR_HPP
#define CIA_RUST_EXTRACTOR_HPP

/**
 * @file rust_extractor.hpp
 * @brief Heuristic extractor for Rust.
 *
 * Items at column zero: struct (struct), enum (type), trait (interface),
 * fn (function) and const (constant). Indented fn items inside an impl or
 * trait block become methods whose parent is the implementing type or the
 * trait. Exported means the item carries a "pub" visibility; methods of
 * traits and trait implementations follow the trait.
 */

#include "cia/extractors/extractor.hpp"

namespace cia::extractors {

    class RustSymbolExtractor : public ISymbolExtractor {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "Rust";
        }

        [[nodiscard]] Language language() const noexcept override {
            return Language::Rust;
        }

        [[nodiscard]] std::vector<std::string> supported_extensions() const override {
            return {".rs"};
        }

        [[nodiscard]] Result<std::vector<Symbol>, Error> extract(
            std::string_view content,
            const std::string& file_path
        ) const override;
    };

    void register_rust_extractor(ExtractorRegistry& registry);

}  // namespace cia::extractors

#endif //CIA_RUST_EXTRACTOR_HPP
