#include "cia/extractors/rust_extractor.hpp"
#include "cia/extractors/pattern_matching.hpp"
#include "cia/utils/string_utils.hpp"

#include <regex>
#include <string>

namespace cia::extractors {

    namespace {

        using patterns::LineMatch;
        using patterns::SourceText;

        // Group 1 is the visibility, group 2 the item name.
        constexpr std::string_view kVisibility = R"((pub(?:\s*\([^)]*\))?\s+)?)";
        constexpr std::string_view kFunction =
            R"((?:(?:const|async|unsafe|extern(?:\s+"[^"]*")?)\s+)*fn\s+(\w+)\s*(?:<[^>]*>)?\s*\(([^)]*)\))";

        const std::regex& struct_pattern() {
            static const std::regex re(std::string(kVisibility) + R"(struct\s+(\w+))");
            return re;
        }

        const std::regex& enum_pattern() {
            static const std::regex re(std::string(kVisibility) + R"(enum\s+(\w+))");
            return re;
        }

        const std::regex& trait_pattern() {
            static const std::regex re(std::string(kVisibility) + R"((?:unsafe\s+)?trait\s+(\w+))");
            return re;
        }

        const std::regex& function_pattern() {
            static const std::regex re(std::string(kVisibility).append(kFunction));
            return re;
        }

        const std::regex& method_pattern() {
            static const std::regex re(std::string("[ \\t]+").append(kVisibility).append(kFunction));
            return re;
        }

        const std::regex& const_pattern() {
            static const std::regex re(std::string(kVisibility) + R"(const\s+(?!fn\b)(\w+))");
            return re;
        }

        // Group 1 is "Trait for " when present, group 2 the implementing type.
        const std::regex& impl_pattern() {
            static const std::regex re(R"((?:unsafe\s+)?impl(?:<[^>]*>)?\s+([\w:]+(?:<[^>]*>)?\s+for\s+)?([\w:]+))");
            return re;
        }

        std::string_view rest_of_line(const SourceText& source, const LineMatch& match) {
            const std::string_view content = source.content();
            const std::size_t from = match.end_offset();
            const std::size_t to = content.find('\n', from);
            return content.substr(from, to == std::string_view::npos ? std::string_view::npos : to - from);
        }

        bool is_self_parameter(std::string_view param) {
            param = string_utils::trim(param);
            if (string_utils::starts_with(param, "&")) {
                param.remove_prefix(1);
                param = string_utils::trim_left(param);
                if (string_utils::starts_with(param, "'")) {
                    const auto space = param.find(' ');
                    param = space == std::string_view::npos ? std::string_view{} : string_utils::trim_left(param.substr(space));
                }
            }
            if (string_utils::starts_with(param, "mut ")) {
                param = string_utils::trim_left(param.substr(4));
            }
            return param == "self" || string_utils::starts_with(param, "self:") || string_utils::starts_with(param, "self ");
        }

        std::string return_type_of(const std::string_view rest) {
            std::string ret = patterns::annotation_after(rest, "->", "{;");
            if (const auto where = ret.find(" where "); where != std::string::npos) {
                ret.erase(where);
            } else if (string_utils::ends_with(ret, " where")) {
                ret.erase(ret.size() - 6);
            }
            return ret;
        }

        Symbol make_item(const LineMatch& match, const SymbolKind kind, const std::string& file_path) {
            Symbol symbol;
            symbol.name = match.group(2);
            symbol.kind = kind;
            symbol.start_line = match.line;
            symbol.end_line = match.line;
            symbol.exported = match.groups[1].matched;
            symbol.signature = string_utils::collapse_whitespace(match.group(0));
            symbol.file_path = file_path;
            return symbol;
        }

        void fill_callable(Symbol& symbol, const SourceText& source, const LineMatch& match) {
            symbol.parameters = patterns::split_parameters(match.group(3));
            symbol.return_type = return_type_of(rest_of_line(source, match));
            if (!symbol.return_type.empty()) {
                symbol.signature += " -> " + symbol.return_type;
            }
            symbol.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
        }

    }  // namespace

    Result<std::vector<Symbol>, Error> RustSymbolExtractor::extract(
        const std::string_view content,
        const std::string& file_path
    ) const {
        const SourceText source(content);
        std::vector<Symbol> symbols;

        // Blocks whose indented fn items are methods, and whether those
        // methods share the block's public surface.
        std::vector<Symbol> owners;
        std::vector<bool> owner_public;

        for (const auto& match : patterns::match_lines(source, struct_pattern())) {
            Symbol symbol = make_item(match, SymbolKind::Struct, file_path);
            symbol.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
            symbols.push_back(std::move(symbol));
        }

        for (const auto& match : patterns::match_lines(source, enum_pattern())) {
            Symbol symbol = make_item(match, SymbolKind::Type, file_path);
            symbol.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
            symbols.push_back(std::move(symbol));
        }

        for (const auto& match : patterns::match_lines(source, trait_pattern())) {
            Symbol symbol = make_item(match, SymbolKind::Interface, file_path);
            symbol.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
            owners.push_back(symbol);
            owner_public.push_back(symbol.exported);
            symbols.push_back(std::move(symbol));
        }

        for (const auto& match : patterns::match_lines(source, impl_pattern())) {
            std::string type = match.group(2);
            if (const auto sep = type.rfind("::"); sep != std::string::npos) {
                type.erase(0, sep + 2);
            }

            Symbol block;
            block.name = std::move(type);
            block.start_line = match.line;
            block.end_line = patterns::find_block_end(source, match.end_offset(), match.line);
            owners.push_back(std::move(block));
            owner_public.push_back(match.groups[1].matched);
        }

        for (const auto& match : patterns::match_lines(source, function_pattern())) {
            Symbol symbol = make_item(match, SymbolKind::Function, file_path);
            fill_callable(symbol, source, match);
            symbols.push_back(std::move(symbol));
        }

        std::vector<std::size_t> body_end(owners.size(), 0);
        for (const auto& match : patterns::match_lines(source, method_pattern())) {
            const std::size_t owner = patterns::innermost_owner(owners, match.line);
            if (owner == owners.size() || match.line <= body_end[owner]) {
                continue;
            }

            Symbol symbol = make_item(match, SymbolKind::Method, file_path);
            fill_callable(symbol, source, match);
            symbol.parent = owners[owner].name;
            symbol.exported = symbol.exported || owner_public[owner];
            if (!symbol.parameters.empty() && is_self_parameter(symbol.parameters.front())) {
                symbol.parameters.erase(symbol.parameters.begin());
            }
            body_end[owner] = symbol.end_line;
            symbols.push_back(std::move(symbol));
        }

        for (const auto& match : patterns::match_lines(source, const_pattern())) {
            symbols.push_back(make_item(match, SymbolKind::Constant, file_path));
        }

        patterns::sort_by_position(symbols);
        return Result<std::vector<Symbol>, Error>::success(std::move(symbols));
    }

    void register_rust_extractor(ExtractorRegistry& registry) {
        registry.register_extractor(std::make_unique<RustSymbolExtractor>());
    }

}  // namespace cia::extractors
