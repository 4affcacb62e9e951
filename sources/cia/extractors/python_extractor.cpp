#include "cia/extractors/python_extractor.hpp"
#include "cia/extractors/pattern_matching.hpp"
#include "cia/utils/string_utils.hpp"

#include <regex>

namespace cia::extractors {

    namespace {

        using patterns::LineMatch;
        using patterns::SourceText;

        const std::regex& class_pattern() {
            static const std::regex re(R"(class\s+(\w+))");
            return re;
        }

        const std::regex& function_pattern() {
            static const std::regex re(R"((?:async\s+)?def\s+(\w+)\s*\(([^)]*)\))");
            return re;
        }

        const std::regex& method_pattern() {
            static const std::regex re(R"([ \t]+(?:async\s+)?def\s+(\w+)\s*\(([^)]*)\))");
            return re;
        }

        const std::regex& constant_pattern() {
            static const std::regex re(R"(([A-Z][A-Z0-9_]*)\s*(?::[^=\n]+)?=(?!=))");
            return re;
        }

        bool is_exported(const std::string& name) noexcept {
            return !string_utils::starts_with(name, "_");
        }

        std::string return_annotation(const SourceText& source, const LineMatch& match) {
            const std::string_view content = source.content();
            const std::size_t from = match.end_offset();
            const std::size_t to = content.find('\n', from);
            const std::string_view rest = content.substr(from, to == std::string_view::npos ? std::string_view::npos : to - from);

            std::string annotation = patterns::annotation_after(rest, "->", "#");
            // Drop the suite colon
            while (!annotation.empty() && (annotation.back() == ':' || annotation.back() == ' ')) {
                annotation.pop_back();
            }
            return annotation;
        }

        Symbol make_callable(const SourceText& source, const LineMatch& match, const SymbolKind kind,
                             const std::string& file_path) {
            Symbol symbol;
            symbol.name = match.group(1);
            symbol.kind = kind;
            symbol.start_line = match.line;
            symbol.end_line = patterns::find_indented_block_end(source, match.line);
            symbol.exported = is_exported(symbol.name);
            symbol.parameters = patterns::split_parameters(match.group(2));
            symbol.return_type = return_annotation(source, match);
            symbol.signature = string_utils::collapse_whitespace(match.group(0));
            if (!symbol.return_type.empty()) {
                symbol.signature += " -> " + symbol.return_type;
            }
            symbol.file_path = file_path;
            return symbol;
        }

    }  // namespace

    Result<std::vector<Symbol>, Error> PythonSymbolExtractor::extract(
        const std::string_view content,
        const std::string& file_path
    ) const {
        const SourceText source(content);
        std::vector<Symbol> symbols;
        std::vector<Symbol> classes;

        for (const auto& match : patterns::match_lines(source, class_pattern())) {
            Symbol symbol;
            symbol.name = match.group(1);
            symbol.kind = SymbolKind::Class;
            symbol.start_line = match.line;
            symbol.end_line = patterns::find_indented_block_end(source, match.line);
            symbol.exported = is_exported(symbol.name);
            symbol.signature = string_utils::collapse_whitespace(match.group(0));
            symbol.file_path = file_path;
            classes.push_back(symbol);
            symbols.push_back(std::move(symbol));
        }

        for (const auto& match : patterns::match_lines(source, function_pattern())) {
            symbols.push_back(make_callable(source, match, SymbolKind::Function, file_path));
        }

        std::vector<std::size_t> body_end(classes.size(), 0);
        for (const auto& match : patterns::match_lines(source, method_pattern())) {
            const std::size_t owner = patterns::innermost_owner(classes, match.line);
            // Functions nested in other functions are not methods
            if (owner == classes.size() || match.line <= body_end[owner]) {
                continue;
            }

            Symbol symbol = make_callable(source, match, SymbolKind::Method, file_path);
            symbol.parent = classes[owner].name;
            if (!symbol.parameters.empty()) {
                const std::string& receiver = symbol.parameters.front();
                if (receiver == "self" || receiver == "cls") {
                    symbol.parameters.erase(symbol.parameters.begin());
                }
            }
            body_end[owner] = symbol.end_line;
            symbols.push_back(std::move(symbol));
        }

        for (const auto& match : patterns::match_lines(source, constant_pattern())) {
            Symbol symbol;
            symbol.name = match.group(1);
            symbol.kind = SymbolKind::Constant;
            symbol.start_line = match.line;
            symbol.end_line = match.line;
            symbol.exported = is_exported(symbol.name);
            symbol.file_path = file_path;
            symbols.push_back(std::move(symbol));
        }

        patterns::sort_by_position(symbols);
        return Result<std::vector<Symbol>, Error>::success(std::move(symbols));
    }

    void register_python_extractor(ExtractorRegistry& registry) {
        registry.register_extractor(std::make_unique<PythonSymbolExtractor>());
    }

}  // namespace cia::extractors
