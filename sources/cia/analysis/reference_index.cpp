#include "cia/analysis/reference_index.hpp"
#include "cia/utils/logging.hpp"
#include "cia/utils/string_utils.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <set>

namespace cia::analysis {

    ReferenceIndex::ReferenceIndex(std::vector<std::string> comment_prefixes)
        : comment_prefixes_(std::move(comment_prefixes)) {}

    void ReferenceIndex::add_file(
        const std::string& file_path,
        const std::string_view content,
        std::vector<Symbol> symbols,
        const ReindexPolicy policy
    ) {
        if (policy == ReindexPolicy::Replace) {
            remove_file(file_path);
        }
        if (std::ranges::find(file_order_, file_path) == file_order_.end()) {
            file_order_.push_back(file_path);
        }

        FileEntry entry;
        tokenize(content, entry);
        for (const auto& symbol : symbols) {
            symbols_[symbol.name].push_back(symbol);
        }
        entry.symbols = std::move(symbols);

        auto& stored = files_[file_path];
        stored = std::move(entry);
        collect_references(file_path, stored);

        logging::logger()->debug("indexed {}: {} symbols, {} lines",
                                 file_path, stored.symbols.size(), stored.lines.size());
    }

    bool ReferenceIndex::remove_file(const std::string& file_path) {
        const auto it = files_.find(file_path);
        if (it == files_.end()) {
            return false;
        }

        const auto from_file = [&file_path](const auto& item) {
            return item.file_path == file_path;
        };

        for (auto sym_it = symbols_.begin(); sym_it != symbols_.end();) {
            std::erase_if(sym_it->second, from_file);
            sym_it = sym_it->second.empty() ? symbols_.erase(sym_it) : std::next(sym_it);
        }
        for (auto ref_it = references_.begin(); ref_it != references_.end();) {
            std::erase_if(ref_it->second, from_file);
            ref_it = ref_it->second.empty() ? references_.erase(ref_it) : std::next(ref_it);
        }

        files_.erase(it);
        std::erase(file_order_, file_path);
        return true;
    }

    void ReferenceIndex::rebuild_references() {
        references_.clear();
        for (const auto& file_path : file_order_) {
            collect_references(file_path, files_.at(file_path));
        }
        logging::logger()->info("rebuilt references for {} files: {} names referenced",
                                file_order_.size(), references_.size());
    }

    void ReferenceIndex::clear() {
        file_order_.clear();
        files_.clear();
        symbols_.clear();
        references_.clear();
    }

    std::vector<Symbol> ReferenceIndex::symbols_in_file(const std::string& file_path) const {
        const auto it = files_.find(file_path);
        return it == files_.end() ? std::vector<Symbol>{} : it->second.symbols;
    }

    std::vector<Symbol> ReferenceIndex::find_symbol(const std::string& name) const {
        const auto it = symbols_.find(name);
        return it == symbols_.end() ? std::vector<Symbol>{} : it->second;
    }

    std::vector<Reference> ReferenceIndex::symbol_references(const std::string& name) const {
        const auto it = references_.find(name);
        return it == references_.end() ? std::vector<Reference>{} : it->second;
    }

    std::vector<std::string> ReferenceIndex::dependents(const std::string& file_path) const {
        std::set<std::string> files;
        const auto it = files_.find(file_path);
        if (it == files_.end()) {
            return {};
        }

        for (const auto& symbol : it->second.symbols) {
            const auto refs = references_.find(symbol.name);
            if (refs == references_.end()) {
                continue;
            }
            for (const auto& ref : refs->second) {
                if (ref.file_path != file_path) {
                    files.insert(ref.file_path);
                }
            }
        }
        return {files.begin(), files.end()};
    }

    std::vector<std::string> ReferenceIndex::dependencies(const std::string& file_path) const {
        std::set<std::string> files;
        for (const auto& [name, refs] : references_) {
            const bool used_here = std::ranges::any_of(refs, [&file_path](const Reference& ref) {
                return ref.file_path == file_path;
            });
            if (!used_here) {
                continue;
            }
            const auto defs = symbols_.find(name);
            if (defs == symbols_.end()) {
                continue;
            }
            for (const auto& symbol : defs->second) {
                if (symbol.file_path != file_path) {
                    files.insert(symbol.file_path);
                }
            }
        }
        return {files.begin(), files.end()};
    }

    std::vector<std::string> ReferenceIndex::indexed_files() const {
        return file_order_;
    }

    IndexStats ReferenceIndex::stats() const {
        IndexStats stats;
        stats.files = files_.size();
        stats.distinct_names = symbols_.size();
        for (const auto& symbols : symbols_ | std::views::values) {
            stats.symbols += symbols.size();
        }
        for (const auto& refs : references_ | std::views::values) {
            stats.references += refs.size();
        }
        return stats;
    }

    bool ReferenceIndex::is_comment_line(const std::string_view trimmed) const {
        return std::ranges::any_of(comment_prefixes_, [trimmed](const std::string& prefix) {
            return string_utils::starts_with(trimmed, prefix);
        });
    }

    bool ReferenceIndex::is_definition_site(
        const std::string& name,
        const std::string& file_path,
        const std::size_t line
    ) const {
        const auto it = symbols_.find(name);
        if (it == symbols_.end()) {
            return false;
        }
        return std::ranges::any_of(it->second, [&](const Symbol& symbol) {
            return symbol.file_path == file_path && symbol.start_line == line;
        });
    }

    void ReferenceIndex::tokenize(const std::string_view content, FileEntry& entry) const {
        const auto lines = string_utils::split(content, '\n');
        entry.lines.reserve(lines.size());

        for (std::size_t i = 0; i < lines.size(); ++i) {
            const std::string_view raw = lines[i];
            const std::string_view trimmed = string_utils::trim(raw);
            entry.lines.emplace_back(trimmed);
            if (is_comment_line(trimmed)) {
                continue;
            }

            const std::size_t line_number = i + 1;
            std::size_t pos = 0;
            while (pos < raw.size()) {
                if (!string_utils::is_word_char(raw[pos])) {
                    ++pos;
                    continue;
                }
                const std::size_t start = pos;
                while (pos < raw.size() && string_utils::is_word_char(raw[pos])) {
                    ++pos;
                }
                auto& lines_for_word = entry.postings[std::string(raw.substr(start, pos - start))];
                if (lines_for_word.empty() || lines_for_word.back() != line_number) {
                    lines_for_word.push_back(line_number);
                }
            }
        }
    }

    void ReferenceIndex::collect_references(const std::string& file_path, const FileEntry& entry) {
        for (const auto& name : symbols_ | std::views::keys) {
            const auto hit = entry.postings.find(name);
            if (hit == entry.postings.end()) {
                continue;
            }
            for (const std::size_t line : hit->second) {
                if (is_definition_site(name, file_path, line)) {
                    continue;
                }
                references_[name].push_back({file_path, line, entry.lines[line - 1]});
            }
        }
    }

}  // namespace cia::analysis
