#include "ccprobe/instrument.hpp"

#include "ccprobe/format.hpp"
#include "ccprobe/utils.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace ccprobe::literals;

namespace ccprobe {
    namespace detail {

        using utils::is_identifier_char;
        using utils::is_space;
        using utils::skip_spaces;

        struct include_directive {
            std::string_view indent{};
            std::string_view directive{};
            char open{};
            std::string_view path{};
            char close{};
        };

        // optional indent, '#', optional space, "include", optional space, <path> or "path"
        static std::optional<include_directive> match_include_line(std::string_view line) {
            size_t pos = skip_spaces(line, 0U);
            if (pos >= line.size() || line[pos] != '#') {
                return std::nullopt;
            }
            auto directive_begin = pos;
            pos = skip_spaces(line, pos + 1U);

            constexpr auto include_kw = "include"sv;
            if (line.substr(pos, include_kw.size()) != include_kw) {
                return std::nullopt;
            }
            pos = skip_spaces(line, pos + include_kw.size());
            if (pos >= line.size() || (line[pos] != '<' && line[pos] != '"')) {
                return std::nullopt;
            }

            include_directive out{};
            out.indent = line.substr(0U, directive_begin);
            out.directive = line.substr(directive_begin, pos - directive_begin);
            out.open = line[pos];

            auto path_begin = pos + 1U;
            auto close_pos = line.find_first_of(">\""sv, path_begin);
            if (close_pos == std::string_view::npos || close_pos == path_begin) {
                return std::nullopt;
            }
            out.path = line.substr(path_begin, close_pos - path_begin);
            out.close = line[close_pos];
            return out;
        }

        struct text_span {
            size_t begin{};
            size_t end{};
        };

        // `void <ws>+ MARKER <ws>* ( <ws>* [void <ws>*] ) <ws>* ;`
        static std::optional<text_span> find_marker_decl(std::string_view text, std::string_view marker, size_t from) {
            constexpr auto void_kw = "void"sv;

            for (auto at = text.find(marker, from); at != std::string_view::npos; at = text.find(marker, at + 1U)) {
                auto ws_begin = at;
                while (ws_begin > 0U && is_space(text[ws_begin - 1U])) {
                    --ws_begin;
                }
                if (ws_begin == at || ws_begin < void_kw.size() ||
                    text.substr(ws_begin - void_kw.size(), void_kw.size()) != void_kw) {
                    continue;
                }

                auto pos = at + marker.size();
                if (pos < text.size() && is_identifier_char(text[pos])) {
                    continue;
                }
                pos = skip_spaces(text, pos);
                if (pos >= text.size() || text[pos] != '(') {
                    continue;
                }
                pos = skip_spaces(text, pos + 1U);
                if (text.substr(pos, void_kw.size()) == void_kw) {
                    auto after_void = skip_spaces(text, pos + void_kw.size());
                    if (after_void < text.size() && text[after_void] == ')') {
                        pos = after_void;
                    }
                }
                if (pos >= text.size() || text[pos] != ')') {
                    continue;
                }
                pos = skip_spaces(text, pos + 1U);
                if (pos >= text.size() || text[pos] != ';') {
                    continue;
                }
                return text_span{ws_begin - void_kw.size(), pos + 1U};
            }
            return std::nullopt;
        }

        static std::optional<text_span> find_last_marker_decl(
                std::string_view text, std::string_view marker, size_t from) {
            std::optional<text_span> last{};
            while (auto found = find_marker_decl(text, marker, from)) {
                last = found;
                from = found->end;
            }
            return last;
        }

        // Replace every START..(last END) span; returns false when no span was found.
        static bool replace_marker_spans(std::string& text, const include_probe& probe) {
            bool replaced = false;
            size_t from = 0U;
            while (auto start = find_marker_decl(text, probe.start_marker, from)) {
                auto end = find_last_marker_decl(text, probe.end_marker, start->end);
                if (!end) {
                    break;
                }
                text.replace(start->begin, end->end - start->begin, probe.original_include);
                from = start->begin + probe.original_include.size();
                replaced = true;
            }
            return replaced;
        }

        static void erase_marker_decls(std::string& text, std::string_view marker) {
            size_t from = 0U;
            while (auto found = find_marker_decl(text, marker, from)) {
                text.erase(found->begin, found->end - found->begin);
                from = found->begin;
            }
        }

        static constexpr bool is_hex_digit(char c) noexcept {
            auto lower = static_cast<char>(c | 0x20);
            return (c >= '0' && c <= '9') || (lower >= 'a' && lower <= 'f');
        }

        static constexpr bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

        struct literal_token {
            bool negative{false};
            bool hex{false};
            std::string_view digits{};
        };

        // -?0x[0-9a-fA-F]+ | -?[0-9]+
        static std::optional<literal_token> match_literal(std::string_view text, size_t pos) {
            literal_token out{};
            if (pos < text.size() && text[pos] == '-') {
                out.negative = true;
                ++pos;
            }
            if (text.substr(pos, 2U) == "0x"sv && pos + 2U < text.size() && is_hex_digit(text[pos + 2U])) {
                auto begin = pos + 2U;
                auto end = begin;
                while (end < text.size() && is_hex_digit(text[end])) {
                    ++end;
                }
                out.hex = true;
                out.digits = text.substr(begin, end - begin);
                return out;
            }
            auto end = pos;
            while (end < text.size() && is_digit(text[end])) {
                ++end;
            }
            if (end == pos) {
                return std::nullopt;
            }
            out.digits = text.substr(pos, end - pos);
            return out;
        }

        // optional '(' then optional space before the literal
        static std::optional<literal_token> match_wrapped_literal(std::string_view text, size_t pos) {
            if (pos < text.size() && text[pos] == '(') {
                return match_literal(text, skip_spaces(text, pos + 1U));
            }
            return match_literal(text, skip_spaces(text, pos));
        }

        static std::optional<literal_token> match_probe_assignment(std::string_view text, size_t pos) {
            pos = skip_spaces(text, pos);
            if (pos >= text.size() || text[pos] != '=') {
                return std::nullopt;
            }
            pos = skip_spaces(text, pos + 1U);

            // a leading parenthesized group is first taken as a cast, e.g. `(int)(42)`
            if (pos < text.size() && text[pos] == '(') {
                if (auto close = text.find(')', pos + 1U); close != std::string_view::npos) {
                    if (auto token = match_wrapped_literal(text, skip_spaces(text, close + 1U))) {
                        return token;
                    }
                }
            }
            return match_wrapped_literal(text, pos);
        }

        static std::optional<probe_value_t> parse_literal(const literal_token& token) {
            // decimal literals may not carry leading zeros unless they are all zeros
            if (!token.hex && token.digits.size() > 1U && token.digits.front() == '0' &&
                token.digits.find_first_not_of('0') != std::string_view::npos) {
                return std::nullopt;
            }
            auto magnitude = utils::parse_arithmetic<unsigned long long>(token.digits, token.hex ? 16 : 10);
            if (!magnitude) {
                return std::nullopt;
            }
            constexpr auto max_positive = static_cast<unsigned long long>(std::numeric_limits<probe_value_t>::max());
            if (token.negative) {
                if (*magnitude > max_positive + 1ULL) {
                    return std::nullopt;
                }
                if (*magnitude == max_positive + 1ULL) {
                    return std::numeric_limits<probe_value_t>::min();
                }
                return -static_cast<probe_value_t>(*magnitude);
            }
            if (*magnitude > max_positive) {
                return std::nullopt;
            }
            return static_cast<probe_value_t>(*magnitude);
        }

    }  // namespace detail

    std::string encode_header_path(std::string_view header) {
        std::string encoded{};
        encoded.reserve(header.size() * 2U);
        for (auto c : header) {
            switch (c) {
                case '.':
                    encoded += "__PERIOD"sv;
                    break;
                case '/':
                    encoded += "__SLASH"sv;
                    break;
                case '\\':
                    encoded += "__BACKSLASH"sv;
                    break;
                default:
                    encoded.push_back(c);
                    break;
            }
        }
        return encoded;
    }

    std::string macro_probe_marker(std::string_view macro_name) {
        return "{}{}{}"_format(markers::macro_prefix, macro_name, markers::macro_suffix);
    }

    std::string inject_include_probes(std::string_view source, probe_set& probes) {
        probes.includes.clear();

        std::string out{};
        out.reserve(source.size() + 256U);
        size_t probe_counter = 1U;
        bool first_line = true;

        auto emit_line = [&](std::string_view line) {
            if (!first_line) {
                out.push_back('\n');
            }
            out.append(line);
            first_line = false;
        };

        for (auto line : utils::split_lines(source)) {
            auto directive = detail::match_include_line(line);
            if (!directive) {
                emit_line(line);
                continue;
            }

            auto kind = directive->open == '<' ? include_kind::system : include_kind::local;
            auto encoded = encode_header_path(directive->path);
            auto start_marker = "{}{}_{}_{}"_format(markers::include_start_prefix, probe_counter, kind, encoded);
            auto end_marker = "{}{}_{}_{}"_format(markers::include_end_prefix, probe_counter, kind, encoded);

            emit_line("{}void {}(void);"_format(directive->indent, start_marker));
            emit_line(line);
            emit_line("{}void {}(void);"_format(directive->indent, end_marker));

            probes.includes.push_back(include_probe{
                    .start_marker = std::move(start_marker),
                    .end_marker = std::move(end_marker),
                    .original_include =
                            "{}{}{}{}"_format(directive->directive, directive->open, directive->path, directive->close),
            });
            ++probe_counter;
        }

        debug_log("injected ", probes.includes.size(), " include probe(s)");
        return out;
    }

    std::string restore_includes(std::string_view preprocessed, const probe_set& probes) {
        std::string result{preprocessed};
        for (const auto& probe : probes.includes) {
            if (!detail::replace_marker_spans(result, probe)) {
                // the header did not expand (e.g. it failed to resolve); drop the dangling start marker
                detail::erase_marker_decls(result, probe.start_marker);
            }
        }
        return result;
    }

    std::string inject_macro_probe(std::string source, std::string_view macro_name, probe_set& probes) {
        if (std::ranges::find(probes.macros, macro_name) != probes.macros.end()) {
            return source;
        }
        probes.macros.emplace_back(macro_name);

        while (!source.empty() && source.back() == '\n') {
            source.pop_back();
        }
        source += "\nint {} = (int)({});\n"_format(macro_probe_marker(macro_name), macro_name);
        return source;
    }

    std::optional<probe_value_t> extract_probe(std::string_view text, std::string_view macro_name) {
        auto marker = macro_probe_marker(macro_name);
        for (auto at = text.find(marker); at != std::string_view::npos; at = text.find(marker, at + 1U)) {
            if (auto token = detail::match_probe_assignment(text, at + marker.size())) {
                return detail::parse_literal(*token);
            }
        }
        return std::nullopt;
    }

    void extract_macro_probes(std::string_view text, probe_set& probes) {
        probes.macro_values.clear();
        for (const auto& name : probes.macros) {
            if (auto value = extract_probe(text, name)) {
                probes.macro_values.insert_or_assign(name, *value);
            }
        }
    }

    outcome<probe_value_t> probe_value(const probe_set& probes, std::string_view macro_name) {
        if (auto it = probes.macro_values.find(std::string{macro_name}); it != probes.macro_values.end()) {
            return it->second;
        }
        return fail(
                failure_kind::usage,
                "no cached value for macro '{}'; was it probed and preprocessed?"_format(macro_name));
    }

    std::string strip_probe_lines(std::string_view text, const probe_set& probes) {
        if (probes.macros.empty()) {
            return std::string{text};
        }

        std::vector<std::string> probe_markers{};
        probe_markers.reserve(probes.macros.size());
        for (const auto& name : probes.macros) {
            probe_markers.push_back(macro_probe_marker(name));
        }

        std::string out{};
        out.reserve(text.size());
        bool first_line = true;
        for (auto line : utils::split_lines(text)) {
            auto is_probe = std::ranges::any_of(
                    probe_markers, [line](const std::string& marker) { return line.find(marker) != line.npos; });
            if (is_probe) {
                continue;
            }
            if (!first_line) {
                out.push_back('\n');
            }
            out.append(line);
            first_line = false;
        }
        return out;
    }

}  // namespace ccprobe
