#ifndef CIA_PATTERN_MATCHING_HPP
#define CIA_PATTERN_MATCHING_HPP

/**
 * @file pattern_matching.hpp
 * @brief Shared helpers for the line-anchored heuristic extractors.
 *
 * Patterns are applied at the start of every line (the equivalent of a
 * multi-line "^" anchor) and may continue over following lines, so a
 * parameter list split across lines is still captured. Matching is bounded
 * to a window after the line start.
 */

#include "cia/types.hpp"

#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace cia::extractors::patterns {

    /**
     * Line table over a source text. Line numbers are 1-based.
     */
    class SourceText {
    public:
        explicit SourceText(std::string_view content);

        [[nodiscard]] std::string_view content() const noexcept {
            return content_;
        }

        [[nodiscard]] std::size_t line_count() const noexcept {
            return starts_.size();
        }

        /**
         * Line text without its terminator.
         */
        [[nodiscard]] std::string_view line(std::size_t number) const;

        [[nodiscard]] std::size_t line_start(std::size_t number) const;

        /**
         * Line containing byte @p offset.
         */
        [[nodiscard]] std::size_t line_of(std::size_t offset) const;

    private:
        std::string_view content_;
        std::vector<std::size_t> starts_;
    };

    struct LineMatch {
        std::size_t line = 0;
        std::size_t offset = 0;      ///< Byte offset of the match start
        std::cmatch groups;          ///< Sub-matches point into the source

        [[nodiscard]] std::string group(std::size_t index) const {
            return index < groups.size() && groups[index].matched ? groups[index].str() : std::string{};
        }

        [[nodiscard]] std::size_t end_offset() const {
            return offset + static_cast<std::size_t>(groups.length(0));
        }
    };

    /**
     * Runs @p pattern anchored at the start of every line.
     */
    std::vector<LineMatch> match_lines(const SourceText& source, const std::regex& pattern);

    /**
     * Line of the '}' closing the block opened after @p from_offset.
     *
     * The opening '{' must follow on the same line or start the next line;
     * a ';' before it means a body-less declaration. Returns
     * @p start_line when no block is found or it is never closed.
     */
    std::size_t find_block_end(const SourceText& source, std::size_t from_offset, std::size_t start_line);

    /**
     * Last line of the indented block introduced at @p start_line
     * (Python-style suites).
     */
    std::size_t find_indented_block_end(const SourceText& source, std::size_t start_line);

    /**
     * Splits a captured parameter list on top-level commas, collapsing
     * whitespace inside each parameter.
     */
    std::vector<std::string> split_parameters(std::string_view list);

    /**
     * Text following @p marker in @p rest up to the first terminator
     * character, trimmed. Empty when @p rest does not start (after
     * whitespace) with the marker.
     */
    std::string annotation_after(std::string_view rest, std::string_view marker, std::string_view terminators);

    /**
     * Index of the innermost owner whose line range contains @p line, or
     * owners.size() if none does.
     */
    std::size_t innermost_owner(const std::vector<Symbol>& owners, std::size_t line);

    /**
     * Sorts by start line, keeping pattern order for equal lines.
     */
    void sort_by_position(std::vector<Symbol>& symbols);

    /**
     * Words that are never method names (control flow and operators that
     * precede a parenthesis).
     */
    bool is_control_keyword(std::string_view word) noexcept;

}  // namespace cia::extractors::patterns

#endif //CIA_PATTERN_MATCHING_HPP
