#ifndef CIA_TYPES_HPP
#define CIA_TYPES_HPP

/**
 * @file types.hpp
 * @brief Core data structures shared by extraction, diffing and indexing.
 *
 * - Language and SymbolKind enumerations with string conversions
 * - Symbol: one declaration found in source text
 * - SymbolKey: identity of a declaration across two revisions
 * - Reference: a textual use of a known symbol name
 * - SourceFile: an in-memory file handed in by a collaborator
 *
 * Symbols are plain values. Comparisons always happen between two
 * independently extracted lists and never mutate either side.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace cia {

    // ============================================================================
    // Languages
    // ============================================================================

    enum class Language {
        Unknown,
        Go,
        TypeScript,
        JavaScript,
        Python,
        Rust,
        Java
    };

    /**
     * Lower-case language name ("go", "typescript", ...), "unknown" otherwise.
     */
    inline const char* to_string(const Language language) noexcept {
        switch (language) {
            case Language::Unknown:    return "unknown";
            case Language::Go:         return "go";
            case Language::TypeScript: return "typescript";
            case Language::JavaScript: return "javascript";
            case Language::Python:     return "python";
            case Language::Rust:       return "rust";
            case Language::Java:       return "java";
        }
        return "unknown";
    }

    // ============================================================================
    // Symbols
    // ============================================================================

    enum class SymbolKind {
        Function,
        Method,
        Class,
        Interface,
        Struct,
        Variable,
        Constant,
        Type,
        Import
    };

    inline const char* to_string(const SymbolKind kind) noexcept {
        switch (kind) {
            case SymbolKind::Function:  return "function";
            case SymbolKind::Method:    return "method";
            case SymbolKind::Class:     return "class";
            case SymbolKind::Interface: return "interface";
            case SymbolKind::Struct:    return "struct";
            case SymbolKind::Variable:  return "variable";
            case SymbolKind::Constant:  return "constant";
            case SymbolKind::Type:      return "type";
            case SymbolKind::Import:    return "import";
        }
        return "unknown";
    }

    std::optional<SymbolKind> symbol_kind_from_string(std::string_view name) noexcept;

    /**
     * A named declaration extracted from one file.
     *
     * Line numbers are 1-based. Heuristic extractors may only know the start
     * line, in which case end_line == start_line.
     */
    struct Symbol {
        std::string name;
        SymbolKind kind = SymbolKind::Function;
        std::size_t start_line = 0;
        std::size_t end_line = 0;
        std::string signature;
        bool exported = false;
        std::vector<std::string> parameters;
        std::string return_type;
        std::string parent;       ///< Receiver or owner type; set for methods
        std::string file_path;

        [[nodiscard]] bool is_callable() const noexcept {
            return kind == SymbolKind::Function || kind == SymbolKind::Method;
        }

        [[nodiscard]] bool contains_line(const std::size_t line) const noexcept {
            return line >= start_line && line <= end_line;
        }

        bool operator==(const Symbol&) const = default;
    };

    /**
     * Identity of a declaration across revisions: (name, kind, parent).
     *
     * Overloads sharing a key collapse onto one entry when a key map is
     * built; the last declaration in source order wins.
     */
    struct SymbolKey {
        std::string name;
        SymbolKind kind = SymbolKind::Function;
        std::string parent;

        static SymbolKey of(const Symbol& symbol) {
            return {symbol.name, symbol.kind, symbol.parent};
        }

        /**
         * "name:kind:parent" rendering, stable across runs.
         */
        [[nodiscard]] std::string to_string() const {
            return name + ":" + cia::to_string(kind) + ":" + parent;
        }

        bool operator==(const SymbolKey&) const = default;

        bool operator<(const SymbolKey& other) const {
            return std::tie(name, kind, parent) < std::tie(other.name, other.kind, other.parent);
        }
    };

    // ============================================================================
    // References and inputs
    // ============================================================================

    /**
     * An occurrence of a known symbol name outside its own definition line.
     */
    struct Reference {
        std::string file_path;
        std::size_t line = 0;
        std::string context;      ///< The source line, trimmed

        bool operator==(const Reference&) const = default;
    };

    /**
     * File content supplied by a caller for batch indexing.
     */
    struct SourceFile {
        std::string path;
        std::string content;
    };

}  // namespace cia

#endif //CIA_TYPES_HPP
