#include "cia/types.hpp"

#include <array>
#include <utility>

namespace cia {

    std::optional<SymbolKind> symbol_kind_from_string(const std::string_view name) noexcept {
        static constexpr std::array<std::pair<std::string_view, SymbolKind>, 9> kinds = {{
            {"function", SymbolKind::Function},
            {"method", SymbolKind::Method},
            {"class", SymbolKind::Class},
            {"interface", SymbolKind::Interface},
            {"struct", SymbolKind::Struct},
            {"variable", SymbolKind::Variable},
            {"constant", SymbolKind::Constant},
            {"type", SymbolKind::Type},
            {"import", SymbolKind::Import},
        }};

        for (const auto& [text, kind] : kinds) {
            if (text == name) {
                return kind;
            }
        }
        return std::nullopt;
    }

}  // namespace cia
