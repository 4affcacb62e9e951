#include "cia/extractors/typescript_extractor.hpp"
#include "cia/extractors/pattern_matching.hpp"
#include "cia/utils/string_utils.hpp"

#include <regex>
#include <unordered_set>

namespace cia::extractors {

    namespace {

        using patterns::LineMatch;
        using patterns::SourceText;

        const std::regex& class_pattern() {
            static const std::regex re(R"((export\s+)?(?:default\s+)?(?:declare\s+)?(?:abstract\s+)?class\s+(\w+))");
            return re;
        }

        const std::regex& interface_pattern() {
            static const std::regex re(R"((export\s+)?(?:declare\s+)?interface\s+(\w+))");
            return re;
        }

        const std::regex& type_pattern() {
            static const std::regex re(R"((export\s+)?(?:declare\s+)?type\s+(\w+))");
            return re;
        }

        const std::regex& function_pattern() {
            static const std::regex re(
                R"((export\s+)?(?:default\s+)?(?:declare\s+)?(?:async\s+)?function\s*\*?\s*(\w+)\s*(?:<[^>]*>)?\s*\(([^)]*)\))");
            return re;
        }

        const std::regex& arrow_pattern() {
            static const std::regex re(
                R"((export\s+)?const\s+(\w+)\s*(?::[^=]+)?=\s*(?:async\s+)?\(([^)]*)\)\s*(?::\s*([^=]+?)\s*)?=>)");
            return re;
        }

        const std::regex& const_pattern() {
            static const std::regex re(R"((export\s+)?const\s+(\w+))");
            return re;
        }

        const std::regex& method_pattern() {
            static const std::regex re(
                R"([ \t]+((?:(?:public|private|protected|static|readonly|abstract|override|async|get|set)\s+)*)(\w+)\s*(?:<[^>]*>)?\s*\(([^)]*)\))");
            return re;
        }

        std::string_view rest_of_line(const SourceText& source, const LineMatch& match) {
            const std::string_view content = source.content();
            const std::size_t from = match.end_offset();
            const std::size_t to = content.find('\n', from);
            return content.substr(from, to == std::string_view::npos ? std::string_view::npos : to - from);
        }

        Symbol make_symbol(const LineMatch& match, const std::size_t name_group, const SymbolKind kind,
                           const std::string& file_path) {
            Symbol symbol;
            symbol.name = match.group(name_group);
            symbol.kind = kind;
            symbol.start_line = match.line;
            symbol.end_line = match.line;
            symbol.exported = match.groups[1].matched;
            symbol.signature = string_utils::collapse_whitespace(match.group(0));
            symbol.file_path = file_path;
            return symbol;
        }

        void add_return_type(Symbol& symbol, std::string return_type) {
            symbol.return_type = std::move(return_type);
            if (!symbol.return_type.empty()) {
                symbol.signature += ": " + symbol.return_type;
            }
        }

    }  // namespace

    Result<std::vector<Symbol>, Error> TypeScriptSymbolExtractor::extract(
        const std::string_view content,
        const std::string& file_path
    ) const {
        const SourceText source(content);
        std::vector<Symbol> symbols;
        std::vector<Symbol> classes;

        for (const auto& match : patterns::match_lines(source, class_pattern())) {
            Symbol symbol = make_symbol(match, 2, SymbolKind::Class, file_path);
            symbol.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
            classes.push_back(symbol);
            symbols.push_back(std::move(symbol));
        }

        for (const auto& match : patterns::match_lines(source, interface_pattern())) {
            Symbol symbol = make_symbol(match, 2, SymbolKind::Interface, file_path);
            symbol.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
            symbols.push_back(std::move(symbol));
        }

        for (const auto& match : patterns::match_lines(source, type_pattern())) {
            Symbol symbol = make_symbol(match, 2, SymbolKind::Type, file_path);
            symbol.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
            symbols.push_back(std::move(symbol));
        }

        for (const auto& match : patterns::match_lines(source, function_pattern())) {
            Symbol symbol = make_symbol(match, 2, SymbolKind::Function, file_path);
            symbol.parameters = patterns::split_parameters(match.group(3));
            add_return_type(symbol, patterns::annotation_after(rest_of_line(source, match), ":", "{;="));
            symbol.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
            symbols.push_back(std::move(symbol));
        }

        std::unordered_set<std::string> arrow_names;
        for (const auto& match : patterns::match_lines(source, arrow_pattern())) {
            Symbol symbol = make_symbol(match, 2, SymbolKind::Function, file_path);
            symbol.parameters = patterns::split_parameters(match.group(3));
            symbol.return_type = string_utils::collapse_whitespace(match.group(4));
            symbol.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
            arrow_names.insert(symbol.name);
            symbols.push_back(std::move(symbol));
        }

        for (const auto& match : patterns::match_lines(source, const_pattern())) {
            if (arrow_names.contains(match.group(2))) {
                continue;
            }
            symbols.push_back(make_symbol(match, 2, SymbolKind::Constant, file_path));
        }

        // Methods: indented declarations directly inside a class body.
        std::vector<std::size_t> body_end(classes.size(), 0);
        for (const auto& match : patterns::match_lines(source, method_pattern())) {
            const std::string name = match.group(2);
            if (patterns::is_control_keyword(name)) {
                continue;
            }

            const std::size_t owner = patterns::innermost_owner(classes, match.line);
            if (owner == classes.size() || match.line <= body_end[owner]) {
                continue;
            }

            const std::string modifiers = match.group(1);
            const std::string_view rest = rest_of_line(source, match);
            const bool has_body = string_utils::contains(rest, "{");
            if (!has_body && !string_utils::contains(modifiers, "abstract")) {
                continue;
            }

            Symbol symbol;
            symbol.name = name;
            symbol.kind = SymbolKind::Method;
            symbol.start_line = match.line;
            symbol.end_line = has_body ? patterns::find_block_end(source, match.end_offset(), match.line) : match.line;
            symbol.parent = classes[owner].name;
            symbol.exported = classes[owner].exported &&
                              !string_utils::contains(modifiers, "private") &&
                              !string_utils::contains(modifiers, "protected");
            symbol.parameters = patterns::split_parameters(match.group(3));
            symbol.signature = string_utils::collapse_whitespace(match.group(0));
            symbol.file_path = file_path;
            add_return_type(symbol, patterns::annotation_after(rest, ":", "{;="));

            body_end[owner] = symbol.end_line;
            symbols.push_back(std::move(symbol));
        }

        patterns::sort_by_position(symbols);
        return Result<std::vector<Symbol>, Error>::success(std::move(symbols));
    }

    void register_typescript_extractors(ExtractorRegistry& registry) {
        registry.register_extractor(std::make_unique<TypeScriptSymbolExtractor>(Language::TypeScript));
        registry.register_extractor(std::make_unique<TypeScriptSymbolExtractor>(Language::JavaScript));
    }

}  // namespace cia::extractors
