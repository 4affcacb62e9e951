#ifndef CIA_STRING_UTILS_HPP
#define CIA_STRING_UTILS_HPP

/**
 * @file string_utils.hpp
 * @brief String manipulation utilities.
 *
 * Provides the trimming, splitting and joining used throughout the
 * extractors, plus the small lexical helpers the reference index needs
 * (identifier characters, whitespace collapsing, top-level splitting).
 */

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace cia::string_utils {

    /**
     * Trims whitespace from the beginning of a string.
     */
    inline std::string_view trim_left(std::string_view s) noexcept {
        const auto it = std::ranges::find_if(s, [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(static_cast<std::size_t>(it - s.begin()));
    }

    /**
     * Trims whitespace from the end of a string.
     */
    inline std::string_view trim_right(std::string_view s) noexcept {
        const auto it = std::find_if(s.rbegin(), s.rend(), [](const unsigned char c) {
            return !std::isspace(c);
        });
        return s.substr(0, static_cast<std::size_t>(s.rend() - it));
    }

    /**
     * Trims whitespace from both ends of a string.
     */
    inline std::string_view trim(const std::string_view s) noexcept {
        return trim_left(trim_right(s));
    }

    /**
     * Splits a string by a delimiter.
     *
     * @param s The string to split.
     * @param delimiter The character to split on.
     * @return A vector of string views representing the parts.
     */
    inline std::vector<std::string_view> split(std::string_view s, const char delimiter) {
        std::vector<std::string_view> result;
        std::size_t start = 0;
        std::size_t end = s.find(delimiter);

        while (end != std::string_view::npos) {
            result.push_back(s.substr(start, end - start));
            start = end + 1;
            end = s.find(delimiter, start);
        }

        result.push_back(s.substr(start));
        return result;
    }

    /**
     * Splits on a delimiter that is not nested inside (), [], {} or <>.
     * Parts are trimmed and empty parts dropped.
     */
    inline std::vector<std::string> split_top_level(std::string_view s, const char delimiter) {
        std::vector<std::string> result;
        int depth = 0;
        std::size_t start = 0;

        auto flush = [&](const std::size_t end) {
            const auto part = trim(s.substr(start, end - start));
            if (!part.empty()) {
                result.emplace_back(part);
            }
        };

        for (std::size_t i = 0; i < s.size(); ++i) {
            const char c = s[i];
            if (c == '(' || c == '[' || c == '{' || c == '<') {
                ++depth;
            } else if ((c == ')' || c == ']' || c == '}' || c == '>') && depth > 0) {
                // "=>" inside a parameter type is not a closing bracket
                if (c == '>' && i > 0 && s[i - 1] == '=') {
                    continue;
                }
                --depth;
            } else if (c == delimiter && depth == 0) {
                flush(i);
                start = i + 1;
            }
        }
        flush(s.size());
        return result;
    }

    /**
     * Joins strings with a delimiter.
     */
    template<typename Container>
    std::string join(const Container& parts, const std::string_view delimiter) {
        if (parts.empty()) {
            return "";
        }

        std::ostringstream oss;
        auto it = parts.begin();
        oss << *it;
        ++it;

        for (; it != parts.end(); ++it) {
            oss << delimiter << *it;
        }

        return oss.str();
    }

    inline bool starts_with(const std::string_view s, const std::string_view prefix) noexcept {
        return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
    }

    inline bool ends_with(const std::string_view s, const std::string_view suffix) noexcept {
        return s.size() >= suffix.size() &&
               s.substr(s.size() - suffix.size()) == suffix;
    }

    inline bool contains(const std::string_view s, const std::string_view needle) noexcept {
        return s.find(needle) != std::string_view::npos;
    }

    /**
     * Converts a string to lowercase.
     */
    inline std::string to_lower(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return result;
    }

    /**
     * Converts a string to uppercase.
     */
    inline std::string to_upper(const std::string_view s) {
        std::string result(s);
        std::ranges::transform(result, result.begin(),
                               [](const unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return result;
    }

    /**
     * ASCII case-insensitive equality.
     */
    inline bool equals_ignore_case(const std::string_view a, const std::string_view b) noexcept {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](const unsigned char x, const unsigned char y) {
                   return std::tolower(x) == std::tolower(y);
               });
    }

    /**
     * Identifier character: ASCII letter, digit, underscore or any byte of a
     * multi-byte UTF-8 sequence.
     */
    inline bool is_word_char(const char c) noexcept {
        const auto u = static_cast<unsigned char>(c);
        return std::isalnum(u) || u == '_' || u >= 0x80;
    }

    /**
     * Replaces every run of whitespace with a single space and trims the ends.
     */
    inline std::string collapse_whitespace(const std::string_view s) {
        std::string result;
        result.reserve(s.size());
        bool pending_space = false;

        for (const char c : trim(s)) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                pending_space = true;
                continue;
            }
            if (pending_space) {
                result.push_back(' ');
                pending_space = false;
            }
            result.push_back(c);
        }
        return result;
    }

    /**
     * Replaces all occurrences of a substring.
     */
    inline std::string replace_all(std::string_view s, const std::string_view from, const std::string_view to) {
        if (from.empty()) {
            return std::string(s);
        }

        std::string result;
        result.reserve(s.size());

        std::size_t pos = 0;
        std::size_t found;

        while ((found = s.find(from, pos)) != std::string_view::npos) {
            result.append(s, pos, found - pos);
            result.append(to);
            pos = found + from.size();
        }

        result.append(s, pos, s.size() - pos);
        return result;
    }

}  // namespace cia::string_utils

#endif //CIA_STRING_UTILS_HPP
