#ifndef CIA_REFERENCE_INDEX_HPP
#define CIA_REFERENCE_INDEX_HPP

/**
 * @file reference_index.hpp
 * @brief Cross-file symbol table and reference index.
 *
 * Holds, for every indexed file, its symbols and a word -> lines posting
 * list built once when the file is added. References to a symbol name are
 * found by looking the name up in the posting lists, which gives the same
 * lines as a word-boundary search of every non-comment line.
 *
 * Only names known when a file is added are searched in it. Adding files
 * in a different order can therefore find different references until
 * rebuild_references() is called.
 *
 * Not thread-safe; ImpactAnalyzer serializes access.
 */

#include "cia/config.hpp"
#include "cia/types.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cia::analysis {

    struct IndexStats {
        std::size_t files = 0;
        std::size_t symbols = 0;
        std::size_t distinct_names = 0;
        std::size_t references = 0;
    };

    class ReferenceIndex {
    public:
        explicit ReferenceIndex(std::vector<std::string> comment_prefixes = {"//", "#", "/*"});

        /**
         * Adds @p symbols extracted from @p content under @p file_path.
         *
         * The file's symbol list is always replaced. With
         * ReindexPolicy::Append the name table and references keep any
         * earlier contributions of the same file; with Replace they are
         * removed first.
         */
        void add_file(
            const std::string& file_path,
            std::string_view content,
            std::vector<Symbol> symbols,
            ReindexPolicy policy
        );

        /**
         * Removes every symbol, reference and posting list contributed by
         * @p file_path.
         *
         * @return false if the file was not indexed.
         */
        bool remove_file(const std::string& file_path);

        /**
         * Recomputes all references from the stored posting lists against
         * every known symbol name.
         */
        void rebuild_references();

        void clear();

        [[nodiscard]] std::vector<Symbol> symbols_in_file(const std::string& file_path) const;

        [[nodiscard]] std::vector<Symbol> find_symbol(const std::string& name) const;

        [[nodiscard]] std::vector<Reference> symbol_references(const std::string& name) const;

        /**
         * Files referencing a name defined in @p file_path, sorted.
         */
        [[nodiscard]] std::vector<std::string> dependents(const std::string& file_path) const;

        /**
         * Files defining a name referenced from @p file_path, sorted.
         */
        [[nodiscard]] std::vector<std::string> dependencies(const std::string& file_path) const;

        /**
         * Indexed files in the order they were first added.
         */
        [[nodiscard]] std::vector<std::string> indexed_files() const;

        [[nodiscard]] IndexStats stats() const;

    private:
        struct FileEntry {
            std::vector<Symbol> symbols;
            std::vector<std::string> lines;   ///< Trimmed source lines
            std::unordered_map<std::string, std::vector<std::size_t>> postings;
        };

        [[nodiscard]] bool is_comment_line(std::string_view trimmed) const;
        [[nodiscard]] bool is_definition_site(const std::string& name, const std::string& file_path,
                                              std::size_t line) const;

        void tokenize(std::string_view content, FileEntry& entry) const;
        void collect_references(const std::string& file_path, const FileEntry& entry);

        std::vector<std::string> comment_prefixes_;
        std::vector<std::string> file_order_;
        std::unordered_map<std::string, FileEntry> files_;
        std::map<std::string, std::vector<Symbol>> symbols_;
        std::map<std::string, std::vector<Reference>> references_;
    };

}  // namespace cia::analysis

#endif //CIA_REFERENCE_INDEX_HPP
