#include "cia/extractors/pattern_matching.hpp"
#include "cia/utils/string_utils.hpp"

#include <algorithm>
#include <array>

namespace cia::extractors::patterns {

    namespace {

        // Upper bound on how far one declaration pattern may reach past its
        // line start. Keeps backtracking in std::regex shallow.
        constexpr std::size_t kMatchWindow = 2048;

        constexpr std::array<std::string_view, 24> kControlKeywords = {
            "if", "for", "while", "switch", "catch", "with", "return", "function",
            "else", "do", "try", "new", "typeof", "delete", "await", "yield",
            "throw", "super", "sizeof", "elif", "except", "match", "loop", "synchronized"
        };

        std::size_t indentation(const std::string_view line) noexcept {
            std::size_t n = 0;
            while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
                ++n;
            }
            return n;
        }

    }  // namespace

    SourceText::SourceText(const std::string_view content)
        : content_(content) {
        starts_.push_back(0);
        for (std::size_t i = 0; i < content_.size(); ++i) {
            if (content_[i] == '\n' && i + 1 < content_.size()) {
                starts_.push_back(i + 1);
            }
        }
    }

    std::string_view SourceText::line(const std::size_t number) const {
        if (number == 0 || number > starts_.size()) {
            return {};
        }
        const std::size_t start = starts_[number - 1];
        std::size_t end = number < starts_.size() ? starts_[number] - 1 : content_.size();
        if (end > start && content_[end - 1] == '\n') {
            --end;
        }
        if (end > start && content_[end - 1] == '\r') {
            --end;
        }
        if (end < start) {
            return {};
        }
        return content_.substr(start, end - start);
    }

    std::size_t SourceText::line_start(const std::size_t number) const {
        if (number == 0 || number > starts_.size()) {
            return content_.size();
        }
        return starts_[number - 1];
    }

    std::size_t SourceText::line_of(const std::size_t offset) const {
        const auto it = std::upper_bound(starts_.begin(), starts_.end(), offset);
        return static_cast<std::size_t>(it - starts_.begin());
    }

    std::vector<LineMatch> match_lines(const SourceText& source, const std::regex& pattern) {
        std::vector<LineMatch> matches;
        const std::string_view content = source.content();
        if (content.empty()) {
            return matches;
        }

        for (std::size_t number = 1; number <= source.line_count(); ++number) {
            const std::size_t start = source.line_start(number);
            const std::size_t end = std::min(content.size(), start + kMatchWindow);

            LineMatch match;
            if (std::regex_search(content.data() + start, content.data() + end, match.groups, pattern,
                                  std::regex_constants::match_continuous)) {
                match.line = number;
                match.offset = start;
                matches.push_back(std::move(match));
            }
        }
        return matches;
    }

    std::size_t find_block_end(const SourceText& source, const std::size_t from_offset, const std::size_t start_line) {
        const std::string_view content = source.content();
        if (from_offset >= content.size()) {
            return start_line;
        }

        // Opening brace: rest of the current line, or the first character
        // of the next non-empty line.
        std::size_t i = from_offset;
        bool found = false;
        for (; i < content.size() && content[i] != '\n'; ++i) {
            if (content[i] == '{') {
                found = true;
                break;
            }
            if (content[i] == ';') {
                return start_line;
            }
        }
        if (!found) {
            const std::size_t next_line = source.line_of(from_offset) + 1;
            const std::string_view text = source.line(next_line);
            const std::string_view trimmed = string_utils::trim_left(text);
            if (trimmed.empty() || trimmed.front() != '{') {
                return start_line;
            }
            i = source.line_start(next_line) + (text.size() - trimmed.size());
        }

        int depth = 0;
        for (; i < content.size(); ++i) {
            const char c = content[i];
            const char next = i + 1 < content.size() ? content[i + 1] : '\0';

            if (c == '"') {
                for (++i; i < content.size() && content[i] != '"' && content[i] != '\n'; ++i) {
                    if (content[i] == '\\') {
                        ++i;
                    }
                }
            } else if (c == '\'') {
                // Character literals only; Rust lifetimes are left alone
                if (i + 2 < content.size() && content[i + 2] == '\'') {
                    i += 2;
                } else if (next == '\\' && i + 3 < content.size() && content[i + 3] == '\'') {
                    i += 3;
                }
            } else if (c == '/' && next == '/') {
                while (i < content.size() && content[i] != '\n') {
                    ++i;
                }
            } else if (c == '/' && next == '*') {
                const std::size_t close = content.find("*/", i + 2);
                if (close == std::string_view::npos) {
                    return start_line;
                }
                i = close + 1;
            } else if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (--depth == 0) {
                    return std::max(start_line, source.line_of(i));
                }
            }
        }
        return start_line;
    }

    std::size_t find_indented_block_end(const SourceText& source, const std::size_t start_line) {
        const std::size_t base = indentation(source.line(start_line));

        // A header may continue over several lines inside brackets.
        std::size_t header_end = start_line;
        int depth = 0;
        for (std::size_t n = start_line; n <= source.line_count(); ++n) {
            for (const char c : source.line(n)) {
                if (c == '(' || c == '[' || c == '{') ++depth;
                else if (c == ')' || c == ']' || c == '}') --depth;
                else if (c == '#') break;
            }
            header_end = n;
            if (depth <= 0) {
                break;
            }
        }

        std::size_t end = header_end;
        for (std::size_t n = header_end + 1; n <= source.line_count(); ++n) {
            const std::string_view text = source.line(n);
            const std::string_view trimmed = string_utils::trim(text);
            if (trimmed.empty() || trimmed.front() == '#') {
                continue;
            }
            if (indentation(text) <= base) {
                break;
            }
            end = n;
        }
        return end;
    }

    std::vector<std::string> split_parameters(const std::string_view list) {
        std::vector<std::string> params = string_utils::split_top_level(list, ',');
        for (auto& param : params) {
            param = string_utils::collapse_whitespace(param);
        }
        return params;
    }

    std::string annotation_after(const std::string_view rest, const std::string_view marker, const std::string_view terminators) {
        std::string_view text = string_utils::trim_left(rest);
        if (!string_utils::starts_with(text, marker)) {
            return {};
        }
        text.remove_prefix(marker.size());
        if (const auto stop = text.find_first_of(terminators); stop != std::string_view::npos) {
            text = text.substr(0, stop);
        }
        return string_utils::collapse_whitespace(text);
    }

    std::size_t innermost_owner(const std::vector<Symbol>& owners, const std::size_t line) {
        std::size_t best = owners.size();
        for (std::size_t i = 0; i < owners.size(); ++i) {
            const Symbol& owner = owners[i];
            if (owner.start_line == line || !owner.contains_line(line)) {
                continue;
            }
            if (best == owners.size() || owner.start_line >= owners[best].start_line) {
                best = i;
            }
        }
        return best;
    }

    void sort_by_position(std::vector<Symbol>& symbols) {
        std::stable_sort(symbols.begin(), symbols.end(), [](const Symbol& a, const Symbol& b) {
            return a.start_line < b.start_line;
        });
    }

    bool is_control_keyword(const std::string_view word) noexcept {
        return std::ranges::find(kControlKeywords, word) != kControlKeywords.end();
    }

}  // namespace cia::extractors::patterns
