#include "cia/extractors/go_extractor.hpp"
#include "cia/utils/string_utils.hpp"

#include <tree_sitter/api.h>

#include <cctype>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <string>

extern "C" {
    const TSLanguage* tree_sitter_go();
}

namespace cia::extractors {

    namespace {

        using ParserHandle = std::unique_ptr<TSParser, decltype(&ts_parser_delete)>;
        using TreeHandle = std::unique_ptr<TSTree, decltype(&ts_tree_delete)>;
        using SymbolsResult = Result<std::vector<Symbol>, Error>;

        bool is_type(const TSNode node, const char* type) {
            return std::strcmp(ts_node_type(node), type) == 0;
        }

        bool is_exported(const std::string& name) noexcept {
            return !name.empty() && std::isupper(static_cast<unsigned char>(name.front()));
        }

        std::size_t line_of(const TSPoint point) noexcept {
            return static_cast<std::size_t>(point.row) + 1;
        }

        TSNode field_of(const TSNode node, const char* field) {
            return ts_node_child_by_field_name(node, field, static_cast<uint32_t>(std::strlen(field)));
        }

        /**
         * Every child stored under @p field, in source order. Go specs and
         * parameter declarations repeat the "name" field.
         */
        std::vector<TSNode> fields_of(const TSNode node, const char* field) {
            std::vector<TSNode> out;
            TSTreeCursor cursor = ts_tree_cursor_new(node);
            if (ts_tree_cursor_goto_first_child(&cursor)) {
                do {
                    const char* current = ts_tree_cursor_current_field_name(&cursor);
                    if (current != nullptr && std::strcmp(current, field) == 0) {
                        out.push_back(ts_tree_cursor_current_node(&cursor));
                    }
                } while (ts_tree_cursor_goto_next_sibling(&cursor));
            }
            ts_tree_cursor_delete(&cursor);
            return out;
        }

        std::vector<TSNode> named_children(const TSNode node) {
            std::vector<TSNode> out;
            const uint32_t count = ts_node_named_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                const TSNode child = ts_node_named_child(node, i);
                if (!is_type(child, "comment")) {
                    out.push_back(child);
                }
            }
            return out;
        }

        TSNode first_leaf(TSNode node) {
            while (ts_node_child_count(node) > 0) {
                node = ts_node_child(node, 0);
            }
            return node;
        }

        /**
         * The outermost ERROR or MISSING node on the leftmost erroneous path.
         */
        TSNode first_problem(const TSNode node) {
            if (ts_node_is_missing(node) || is_type(node, "ERROR")) {
                return node;
            }
            const uint32_t count = ts_node_child_count(node);
            for (uint32_t i = 0; i < count; ++i) {
                const TSNode child = ts_node_child(node, i);
                if (ts_node_has_error(child)) {
                    return first_problem(child);
                }
            }
            return node;
        }

        struct Field {
            std::vector<std::string> names;
            std::string type;
        };

        class DeclarationWalker {
        public:
            DeclarationWalker(const std::string_view source, const std::string& file_path)
                : source_(source), file_path_(file_path) {}

            SymbolsResult run(const TSNode root) {
                if (ts_node_has_error(root)) {
                    return SymbolsResult::failure(syntax_error(first_problem(root)));
                }
                if (auto error = check_top_level(root)) {
                    return SymbolsResult::failure(std::move(*error));
                }
                walk(root);
                return SymbolsResult::success(std::move(symbols_));
            }

        private:
            std::string_view source_;
            const std::string& file_path_;
            std::vector<Symbol> symbols_;

            std::string text(const TSNode node) const {
                if (ts_node_is_null(node)) {
                    return "";
                }
                const uint32_t start = ts_node_start_byte(node);
                const uint32_t end = ts_node_end_byte(node);
                return std::string(source_.substr(start, end - start));
            }

            std::string position(const TSNode node) const {
                const TSPoint point = ts_node_start_point(node);
                return file_path_ + ":" + std::to_string(point.row + 1) + ":" + std::to_string(point.column + 1);
            }

            Error error_at(const TSNode node, std::string message) const {
                return Error::parse_error(std::move(message), position(node));
            }

            Error syntax_error(const TSNode node) const {
                if (ts_node_is_missing(node)) {
                    return error_at(node, std::string("syntax error: missing '") + ts_node_type(node) + "'");
                }
                const std::string token = string_utils::collapse_whitespace(text(first_leaf(node)));
                if (token.empty()) {
                    return error_at(node, "syntax error: unexpected end of file");
                }
                return error_at(node, "syntax error: unexpected '" + token + "'");
            }

            /**
             * Rules the grammar accepts but the Go compiler rejects: the
             * package clause comes first, imports precede declarations, only
             * declarations appear at file scope and a method has exactly one
             * receiver.
             */
            std::optional<Error> check_top_level(const TSNode root) const {
                bool seen_package = false;
                bool seen_declaration = false;

                for (const TSNode child : named_children(root)) {
                    if (!seen_package) {
                        if (!is_type(child, "package_clause")) {
                            return error_at(child, "expected 'package', found '" + text(first_leaf(child)) + "'");
                        }
                        seen_package = true;
                        continue;
                    }

                    if (is_type(child, "import_declaration")) {
                        if (seen_declaration) {
                            return error_at(child, "syntax error: imports must appear before other declarations");
                        }
                        continue;
                    }

                    if (is_type(child, "method_declaration")) {
                        if (auto error = check_receiver(child)) {
                            return error;
                        }
                    } else if (!is_type(child, "function_declaration") &&
                               !is_type(child, "const_declaration") &&
                               !is_type(child, "var_declaration") &&
                               !is_type(child, "type_declaration")) {
                        return error_at(child, "syntax error: non-declaration statement outside function body");
                    }
                    seen_declaration = true;
                }

                if (!seen_package) {
                    return error_at(root, "expected 'package', found 'EOF'");
                }
                return std::nullopt;
            }

            std::optional<Error> check_receiver(const TSNode method) const {
                const TSNode receiver = field_of(method, "receiver");
                const auto fields = parameters_of(receiver);
                if (fields.empty()) {
                    return error_at(receiver, "method has no receiver");
                }
                if (fields.size() > 1 || fields.front().names.size() > 1) {
                    return error_at(receiver, "method has multiple receivers");
                }
                return std::nullopt;
            }

            void walk(const TSNode node) {
                if (is_type(node, "function_declaration") || is_type(node, "method_declaration")) {
                    add_function(node);
                } else if (is_type(node, "type_spec") || is_type(node, "type_alias")) {
                    add_type(node);
                } else if (is_type(node, "const_spec")) {
                    add_values(node, SymbolKind::Constant);
                } else if (is_type(node, "var_spec")) {
                    add_values(node, SymbolKind::Variable);
                }

                const uint32_t count = ts_node_named_child_count(node);
                for (uint32_t i = 0; i < count; ++i) {
                    walk(ts_node_named_child(node, i));
                }
            }

            Symbol make_symbol(std::string name, const SymbolKind kind, const TSNode node) const {
                Symbol symbol;
                symbol.exported = is_exported(name);
                symbol.name = std::move(name);
                symbol.kind = kind;
                symbol.start_line = line_of(ts_node_start_point(node));
                symbol.end_line = line_of(ts_node_end_point(node));
                symbol.file_path = file_path_;
                return symbol;
            }

            void add_function(const TSNode node) {
                const bool is_method = is_type(node, "method_declaration");
                Symbol symbol = make_symbol(text(field_of(node, "name")),
                                            is_method ? SymbolKind::Method : SymbolKind::Function, node);

                const auto params = render_parameters(parameters_of(field_of(node, "parameters")));
                const auto results = result_types(field_of(node, "result"));

                std::string signature = "func ";
                if (is_method) {
                    const TSNode receiver = field_of(node, "receiver");
                    const auto fields = parameters_of(receiver);
                    if (!fields.empty()) {
                        signature += "(" + string_utils::join(render_parameters(fields), ", ") + ") ";
                    }
                    symbol.parent = receiver_base(receiver);
                }
                signature += symbol.name + "(" + string_utils::join(params, ", ") + ")" + render_results(results);

                symbol.signature = std::move(signature);
                symbol.parameters = params;
                symbol.return_type = string_utils::join(results, ", ");
                symbols_.push_back(std::move(symbol));
            }

            void add_type(const TSNode node) {
                const std::string name = text(field_of(node, "name"));
                if (name.empty() || name == "_") {
                    return;
                }

                SymbolKind kind = SymbolKind::Type;
                const TSNode type = field_of(node, "type");
                if (is_type(node, "type_spec") && !ts_node_is_null(type)) {
                    if (is_type(type, "struct_type")) {
                        kind = SymbolKind::Struct;
                    } else if (is_type(type, "interface_type")) {
                        kind = SymbolKind::Interface;
                    }
                }
                symbols_.push_back(make_symbol(name, kind, node));
            }

            void add_values(const TSNode spec, const SymbolKind kind) {
                for (const TSNode name_node : fields_of(spec, "name")) {
                    std::string name = text(name_node);
                    if (name == "_") {
                        continue;
                    }
                    symbols_.push_back(make_symbol(std::move(name), kind, name_node));
                }
            }

            /**
             * Receiver type without pointer, parentheses or type arguments:
             * "(l *List[T])" -> "List".
             */
            std::string receiver_base(const TSNode receiver) const {
                const auto declarations = named_children(receiver);
                if (declarations.empty()) {
                    return "";
                }
                TSNode type = field_of(declarations.front(), "type");
                while (!ts_node_is_null(type)) {
                    if (is_type(type, "pointer_type") || is_type(type, "parenthesized_type")) {
                        const auto inner = named_children(type);
                        if (inner.empty()) {
                            break;
                        }
                        type = inner.front();
                    } else if (is_type(type, "generic_type")) {
                        type = field_of(type, "type");
                    } else {
                        break;
                    }
                }
                return text(type);
            }

            std::vector<Field> parameters_of(const TSNode list) const {
                std::vector<Field> out;
                if (ts_node_is_null(list)) {
                    return out;
                }
                for (const TSNode declaration : named_children(list)) {
                    Field field;
                    for (const TSNode name : fields_of(declaration, "name")) {
                        field.names.push_back(text(name));
                    }
                    field.type = render_type(field_of(declaration, "type"));
                    if (is_type(declaration, "variadic_parameter_declaration")) {
                        field.type = "..." + field.type;
                    }
                    out.push_back(std::move(field));
                }
                return out;
            }

            static std::vector<std::string> render_parameters(const std::vector<Field>& fields) {
                std::vector<std::string> out;
                for (const auto& field : fields) {
                    if (field.names.empty()) {
                        out.push_back(field.type);
                        continue;
                    }
                    for (const auto& name : field.names) {
                        out.push_back(name + " " + field.type);
                    }
                }
                return out;
            }

            // One rendered type per result field: "(n int, err error)" -> {"int", "error"}.
            std::vector<std::string> result_types(const TSNode result) const {
                std::vector<std::string> out;
                if (ts_node_is_null(result)) {
                    return out;
                }
                if (!is_type(result, "parameter_list")) {
                    out.push_back(render_type(result));
                    return out;
                }
                for (const auto& field : parameters_of(result)) {
                    out.push_back(field.type);
                }
                return out;
            }

            static std::string render_results(const std::vector<std::string>& results) {
                if (results.empty()) {
                    return "";
                }
                if (results.size() == 1) {
                    return " " + results.front();
                }
                return " (" + string_utils::join(results, ", ") + ")";
            }

            std::string render_children(const TSNode node, const std::string_view delimiter) const {
                std::vector<std::string> parts;
                for (const TSNode child : named_children(node)) {
                    parts.push_back(render_type(child));
                }
                return string_utils::join(parts, delimiter);
            }

            std::string render_first_child(const TSNode node) const {
                const auto children = named_children(node);
                return children.empty() ? std::string() : render_type(children.front());
            }

            /**
             * Canonical spelling of a type, independent of the source layout.
             */
            std::string render_type(const TSNode node) const {
                if (ts_node_is_null(node)) {
                    return "";
                }

                if (is_type(node, "pointer_type")) {
                    return "*" + render_first_child(node);
                }
                if (is_type(node, "slice_type")) {
                    return "[]" + render_type(field_of(node, "element"));
                }
                if (is_type(node, "array_type")) {
                    return "[" + string_utils::collapse_whitespace(text(field_of(node, "length"))) + "]" +
                           render_type(field_of(node, "element"));
                }
                if (is_type(node, "implicit_length_array_type")) {
                    return "[...]" + render_type(field_of(node, "element"));
                }
                if (is_type(node, "map_type")) {
                    return "map[" + render_type(field_of(node, "key")) + "]" + render_type(field_of(node, "value"));
                }
                if (is_type(node, "channel_type")) {
                    return channel_prefix(node) + render_type(field_of(node, "value"));
                }
                if (is_type(node, "function_type")) {
                    const auto params = render_parameters(parameters_of(field_of(node, "parameters")));
                    return "func(" + string_utils::join(params, ", ") + ")" +
                           render_results(result_types(field_of(node, "result")));
                }
                if (is_type(node, "qualified_type")) {
                    return text(field_of(node, "package")) + "." + text(field_of(node, "name"));
                }
                if (is_type(node, "generic_type")) {
                    return render_type(field_of(node, "type")) +
                           "[" + render_children(field_of(node, "type_arguments"), ", ") + "]";
                }
                if (is_type(node, "parenthesized_type")) {
                    return render_first_child(node);
                }
                if (is_type(node, "negated_type")) {
                    return "~" + render_first_child(node);
                }
                if (is_type(node, "type_elem") || is_type(node, "type_constraint")) {
                    return render_children(node, " | ");
                }
                if (is_type(node, "struct_type")) {
                    const auto members = named_children(node);
                    const bool empty = members.empty() || named_children(members.front()).empty();
                    return empty ? "struct{}" : "struct{...}";
                }
                if (is_type(node, "interface_type")) {
                    return named_children(node).empty() ? "interface{}" : "interface{...}";
                }
                return string_utils::collapse_whitespace(text(node));
            }

            // "chan ", "<-chan " or "chan<- " from the anonymous tokens.
            static std::string channel_prefix(const TSNode node) {
                const uint32_t count = ts_node_child_count(node);
                bool arrow_first = false;
                bool arrow_after_chan = false;
                bool seen_chan = false;
                for (uint32_t i = 0; i < count; ++i) {
                    const TSNode child = ts_node_child(node, i);
                    if (ts_node_is_named(child)) {
                        break;
                    }
                    if (is_type(child, "chan")) {
                        seen_chan = true;
                    } else if (is_type(child, "<-")) {
                        (seen_chan ? arrow_after_chan : arrow_first) = true;
                    }
                }
                if (arrow_first) {
                    return "<-chan ";
                }
                return arrow_after_chan ? "chan<- " : "chan ";
            }
        };

    }  // namespace

    Result<std::vector<Symbol>, Error> GoSymbolExtractor::extract(
        const std::string_view content,
        const std::string& file_path
    ) const {
        if (content.size() > std::numeric_limits<uint32_t>::max()) {
            return SymbolsResult::failure(Error::invalid_argument("file too large to parse", file_path));
        }

        const ParserHandle parser(ts_parser_new(), &ts_parser_delete);
        if (!parser || !ts_parser_set_language(parser.get(), tree_sitter_go())) {
            return SymbolsResult::failure(
                Error::internal_error("tree-sitter-go grammar is incompatible with the tree-sitter runtime"));
        }

        const TreeHandle tree(
            ts_parser_parse_string(parser.get(), nullptr, content.data(), static_cast<uint32_t>(content.size())),
            &ts_tree_delete
        );
        if (!tree) {
            return SymbolsResult::failure(Error::internal_error("tree-sitter failed to parse " + file_path));
        }

        DeclarationWalker walker(content, file_path);
        return walker.run(ts_tree_root_node(tree.get()));
    }

    void register_go_extractor(ExtractorRegistry& registry) {
        registry.register_extractor(std::make_unique<GoSymbolExtractor>());
    }

}  // namespace cia::extractors
