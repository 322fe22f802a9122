#pragma once

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <iostream>
#include <optional>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>
#include <vector>

namespace ccprobe {

// Debug logger; no-op on release builds
#ifndef NDEBUG
    constexpr std::string_view sloc_fname(const std::source_location& loc) {
        std::string_view sv{loc.file_name()};
        if (auto p = sv.rfind('/'); p != sv.npos)
            sv.remove_prefix(p + 1);
        return sv;
    }

    inline void prepend_location(std::ostream& os, const std::source_location& loc) {
        os << '[' << sloc_fname(loc) << ':' << loc.line() << "] ";
    }

    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(
                Args&&... args, const std::source_location& loc = std::source_location::current()) {
            prepend_location(std::cerr, loc);
            (std::cerr << ... << std::forward<Args>(args)) << std::endl;
        }
    };
#else
    template <typename... Args>
    struct debug_log {
        constexpr explicit debug_log(Args&&...) {}
    };
#endif

    // deduction guide
    template <typename... Args>
    debug_log(Args&&...) -> debug_log<Args...>;

    namespace utils {
        constexpr char char_tolower(char c) {
            if (c >= 'A' && c <= 'Z') {
                return c + ('a' - 'A');
            }
            return c;
        }

        constexpr bool str_case_eq(std::string_view lhs, std::string_view rhs) {
            return std::ranges::equal(
                    lhs | std::views::transform(char_tolower), rhs | std::views::transform(char_tolower));
        }

        constexpr bool is_identifier_char(char c) noexcept {
            auto lower = static_cast<char>(c | 0x20);
            return (c >= '0' && c <= '9') || (lower >= 'a' && lower <= 'z') || c == '_';
        }

        constexpr bool is_space(char c) noexcept {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        }

        constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n\f\v");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n\f\v");
            return value.substr(first, (last - first) + 1U);
        }

        constexpr size_t skip_spaces(std::string_view text, size_t pos) noexcept {
            while (pos < text.size() && is_space(text[pos])) {
                ++pos;
            }
            return pos;
        }

        /// Count case-insensitive occurrences of `word` that start on a word boundary.
        /// A trailing boundary is required only when `word` ends in an identifier character.
        constexpr size_t count_words_icase(std::string_view text, std::string_view word) {
            if (word.empty() || text.size() < word.size()) {
                return 0U;
            }
            bool need_trailing = is_identifier_char(word.back());
            size_t count = 0U;
            for (size_t i = 0U; i + word.size() <= text.size(); ++i) {
                if (i > 0U && is_identifier_char(text[i - 1U])) {
                    continue;
                }
                if (!str_case_eq(text.substr(i, word.size()), word)) {
                    continue;
                }
                auto end = i + word.size();
                if (need_trailing && end < text.size() && is_identifier_char(text[end])) {
                    continue;
                }
                ++count;
            }
            return count;
        }

        constexpr bool contains_word_icase(std::string_view text, std::string_view word) {
            return count_words_icase(text, word) > 0U;
        }

        namespace detail {
            template <typename T>
            concept arithmetic_type = std::integral<T> || std::floating_point<T>;
        }

        template <detail::arithmetic_type T>
        constexpr std::optional<T> parse_arithmetic(std::string_view input, [[maybe_unused]] int base = 10) {
            T value{};
            std::from_chars_result result;

            if constexpr (std::integral<T>) {
                result = std::from_chars(input.data(), input.data() + input.size(), value, base);
            }
            else {
                result = std::from_chars(input.data(), input.data() + input.size(), value);
            }

            if (result.ec != std::errc{} || result.ptr != input.data() + input.size()) {
                return std::nullopt;
            }

            return {value};
        }

        inline std::string join_with_separator(const std::vector<std::string>& values, std::string_view separator) {
            if (values.empty()) {
                return {};
            }
            return values | std::views::join_with(separator) | std::ranges::to<std::string>();
        }

        /// Split on '\n' exactly; joining the pieces with '\n' reproduces the input.
        inline std::vector<std::string_view> split_lines(std::string_view text) {
            std::vector<std::string_view> lines{};
            size_t begin = 0U;
            while (true) {
                auto end = text.find('\n', begin);
                if (end == std::string_view::npos) {
                    lines.push_back(text.substr(begin));
                    break;
                }
                lines.push_back(text.substr(begin, end - begin));
                begin = end + 1U;
            }
            return lines;
        }

        inline void append_unique(std::vector<std::string>& values, std::string value) {
            if (std::ranges::find(values, value) == values.end()) {
                values.push_back(std::move(value));
            }
        }

    }  // namespace utils

}  // namespace ccprobe
