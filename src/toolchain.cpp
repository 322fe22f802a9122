#include "ccprobe/toolchain.hpp"

#include "ccprobe/utils.hpp"

#include "internal/process.hpp"

namespace ccprobe {

    using namespace std::string_view_literals;

    namespace detail {

        static constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        static size_t skip_digits(std::string_view text, size_t pos) {
            while (pos < text.size() && is_digit(text[pos])) {
                ++pos;
            }
            return pos;
        }

        // X.Y[.Z] starting exactly at `pos`; returns the match length or 0
        static size_t match_dotted_version(std::string_view text, size_t pos) {
            auto major_end = skip_digits(text, pos);
            if (major_end == pos || major_end >= text.size() || text[major_end] != '.') {
                return 0U;
            }
            auto minor_end = skip_digits(text, major_end + 1U);
            if (minor_end == major_end + 1U) {
                return 0U;
            }
            if (minor_end < text.size() && text[minor_end] == '.') {
                auto patch_end = skip_digits(text, minor_end + 1U);
                if (patch_end > minor_end + 1U) {
                    return patch_end - pos;
                }
            }
            return minor_end - pos;
        }

        static size_t find_icase(std::string_view text, std::string_view needle, size_t from) {
            for (auto i = from; i + needle.size() <= text.size(); ++i) {
                if (utils::str_case_eq(text.substr(i, needle.size()), needle)) {
                    return i;
                }
            }
            return std::string_view::npos;
        }

        static std::optional<std::string> match_gcc(std::string_view text) {
            for (auto at = find_icase(text, "gcc"sv, 0U); at != std::string_view::npos;
                 at = find_icase(text, "gcc"sv, at + 1U)) {
                auto line_end = text.find('\n', at);
                auto line = text.substr(0U, line_end == std::string_view::npos ? text.size() : line_end);
                for (auto i = at + 3U; i < line.size(); ++i) {
                    if (auto len = match_dotted_version(line, i)) {
                        return std::string{line.substr(i, len)};
                    }
                }
            }
            return std::nullopt;
        }

        static std::optional<std::string> match_clang(std::string_view text) {
            constexpr auto key = "clang version "sv;
            for (auto at = find_icase(text, key, 0U); at != std::string_view::npos; at = find_icase(text, key, at + 1U)) {
                if (auto len = match_dotted_version(text, at + key.size())) {
                    return std::string{text.substr(at + key.size(), len)};
                }
            }
            return std::nullopt;
        }

        static std::optional<std::string> match_tcc(std::string_view text) {
            constexpr auto key = "tcc version "sv;
            for (auto at = find_icase(text, key, 0U); at != std::string_view::npos; at = find_icase(text, key, at + 1U)) {
                auto begin = at + key.size();
                auto pos = begin;
                while (pos < text.size() && (is_digit(text[pos]) || text[pos] == '.')) {
                    ++pos;
                }
                if (pos == begin) {
                    continue;
                }
                while (pos < text.size() && utils::is_identifier_char(text[pos])) {
                    ++pos;
                }
                return std::string{text.substr(begin, pos - begin)};
            }
            return std::nullopt;
        }

    }  // namespace detail

    std::optional<toolchain_identity> parse_version_banner(std::string_view banner) {
        if (auto v = detail::match_gcc(banner)) {
            return toolchain_identity{"gcc", std::move(*v)};
        }
        if (auto v = detail::match_clang(banner)) {
            return toolchain_identity{"clang", std::move(*v)};
        }
        if (auto v = detail::match_tcc(banner)) {
            return toolchain_identity{"tcc", std::move(*v)};
        }
        return std::nullopt;
    }

    std::optional<toolchain_identity> detect_toolchain(const std::string& command, int timeout_ms) {
        auto proc = internal::process::run_subprocess({.args = {command, "--version"}, .timeout_ms = timeout_ms});
        if (proc.launch_failed || proc.timed_out) {
            debug_log("version probe failed for ", command);
            return std::nullopt;
        }
        return parse_version_banner(proc.stdout_output + proc.stderr_output);
    }

}  // namespace ccprobe
