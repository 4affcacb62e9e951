#include "cia/extractors/java_extractor.hpp"
#include "cia/extractors/pattern_matching.hpp"
#include "cia/utils/string_utils.hpp"

#include <regex>

namespace cia::extractors {

    namespace {

        using patterns::LineMatch;
        using patterns::SourceText;

        // Group 1 holds the modifiers, group 2 the name.
        const std::regex& class_pattern() {
            static const std::regex re(
                R"([ \t]*((?:(?:public|protected|private|abstract|final|static|sealed|strictfp)\s+)*)class\s+(\w+))");
            return re;
        }

        const std::regex& interface_pattern() {
            static const std::regex re(
                R"([ \t]*((?:(?:public|protected|private|abstract|static|sealed)\s+)*)@?interface\s+(\w+))");
            return re;
        }

        // Groups: 1 access, 2 other modifiers, 3 return type, 4 name, 5 parameters.
        const std::regex& method_pattern() {
            static const std::regex re(
                R"([ \t]+(public|private|protected)\s+((?:(?:static|final|abstract|synchronized|native|default|strictfp)\s+)*))"
                R"((?:<[^(){};]*?>\s+)?([\w.$]+(?:<[^(){};]*?>)?(?:\[\])*)\s+(\w+)\s*\(([^)]*)\))");
            return re;
        }

        bool is_public(const std::string& modifiers) {
            const std::string words = string_utils::collapse_whitespace(modifiers);
            for (const auto word : string_utils::split(words, ' ')) {
                if (word == "public") {
                    return true;
                }
            }
            return false;
        }

        Symbol make_type(const SourceText& source, const LineMatch& match, const SymbolKind kind,
                         const std::string& file_path) {
            Symbol symbol;
            symbol.name = match.group(2);
            symbol.kind = kind;
            symbol.start_line = match.line;
            symbol.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
            symbol.exported = is_public(match.group(1));
            symbol.signature = string_utils::collapse_whitespace(match.group(0));
            symbol.file_path = file_path;
            return symbol;
        }

    }  // namespace

    Result<std::vector<Symbol>, Error> JavaSymbolExtractor::extract(
        const std::string_view content,
        const std::string& file_path
    ) const {
        const SourceText source(content);
        std::vector<Symbol> symbols;
        std::vector<Symbol> owners;

        for (const auto& match : patterns::match_lines(source, class_pattern())) {
            Symbol symbol = make_type(source, match, SymbolKind::Class, file_path);
            owners.push_back(symbol);
            symbols.push_back(std::move(symbol));
        }

        for (const auto& match : patterns::match_lines(source, interface_pattern())) {
            Symbol symbol = make_type(source, match, SymbolKind::Interface, file_path);
            owners.push_back(symbol);
            symbols.push_back(std::move(symbol));
        }

        std::vector<std::size_t> body_end(owners.size(), 0);
        for (const auto& match : patterns::match_lines(source, method_pattern())) {
            const std::string name = match.group(4);
            const std::string return_type = match.group(3);
            if (patterns::is_control_keyword(name) || patterns::is_control_keyword(return_type)) {
                continue;
            }

            const std::size_t owner = patterns::innermost_owner(owners, match.line);
            if (owner != owners.size() && match.line <= body_end[owner]) {
                continue;
            }

            Symbol symbol;
            symbol.name = name;
            symbol.kind = SymbolKind::Method;
            symbol.start_line = match.line;
            symbol.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
            symbol.exported = match.group(1) == "public";
            symbol.parameters = patterns::split_parameters(match.group(5));
            symbol.return_type = string_utils::collapse_whitespace(return_type);
            symbol.signature = string_utils::collapse_whitespace(match.group(0));
            symbol.file_path = file_path;
            if (owner != owners.size()) {
                symbol.parent = owners[owner].name;
                body_end[owner] = symbol.end_line;
            }
            symbols.push_back(std::move(symbol));
        }

        patterns::sort_by_position(symbols);
        return Result<std::vector<Symbol>, Error>::success(std::move(symbols));
    }

    void register_java_extractor(ExtractorRegistry& registry) {
        registry.register_extractor(std::make_unique<JavaSymbolExtractor>());
    }

}  // namespace cia::extractors
