#include "ccprobe/report.hpp"

#include "ccprobe/format.hpp"
#include "ccprobe/utils.hpp"

#include "internal/files.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <set>
#include <string>

using namespace ccprobe::literals;

namespace ccprobe {

    namespace detail {

        inline constexpr std::array<std::string_view, 4> footnote_markers{"*"sv, "**"sv, "***"sv, "****"sv};

        static size_t count_occurrences(std::string_view text, std::string_view needle) {
            size_t n = 0U;
            for (auto pos = text.find(needle); pos != std::string_view::npos;
                 pos = text.find(needle, pos + needle.size())) {
                ++n;
            }
            return n;
        }

        static size_t codepoints(std::string_view text) {
            return static_cast<size_t>(std::ranges::count_if(
                    text, [](char c) { return (static_cast<unsigned char>(c) & 0xC0U) != 0x80U; }));
        }

        struct footnote {
            std::string_view marker{};
            exec_mode mode{};
            std::string toolchain{};
        };

        // group -> variant -> result
        using group_lookup = std::map<std::string, std::map<std::string, const test_result*>>;
        // compiler display name -> group_lookup
        using result_lookup = std::map<std::string, group_lookup>;

        static result_lookup index_results(const std::vector<test_result>& results) {
            result_lookup lookup{};
            for (const auto& r : results) {
                lookup[r.compiler.display_name][r.group][r.variant] = &r;
            }
            return lookup;
        }

        static std::string local_toolchain_label(const compiler_target& c, const version_probe& probe) {
            const auto& command = c.mode() == exec_mode::local_compile ? c.compile_params()->compiler
                                                                       : c.assemble_params()->linker;
            if (probe) {
                if (auto id = probe(command)) {
                    return id->display();
                }
            }
            return command;
        }

        // compiler display name -> footnote
        static std::map<std::string, footnote> assign_footnotes(
                const std::vector<compiler_target>& compilers, const version_probe& probe) {
            std::map<std::pair<exec_mode, std::string>, std::string_view> markers_by_key{};
            std::map<std::string, footnote> out{};
            size_t next_marker = 0U;

            for (const auto& c : compilers) {
                if (c.mode() == exec_mode::remote_execute) {
                    continue;
                }
                auto label = local_toolchain_label(c, probe);
                auto key = std::make_pair(c.mode(), label);
                auto it = markers_by_key.find(key);
                if (it == markers_by_key.end()) {
                    if (next_marker >= footnote_markers.size()) {
                        continue;
                    }
                    it = markers_by_key.emplace(key, footnote_markers[next_marker++]).first;
                }
                out.insert_or_assign(c.display_name, footnote{it->second, c.mode(), std::move(label)});
            }
            return out;
        }

        static std::string footnote_text(const footnote& note) {
            auto escaped = "\\{}"_format(note.marker);
            if (note.mode == exec_mode::local_compile) {
                return "{} This compiler was only used for preprocessing and then "
                       "the result was compiled locally with {}.  "_format(escaped, note.toolchain);
            }
            return "{} This compiler outputted assembly which was then "
                   "assembled and run locally with {}.  "_format(escaped, note.toolchain);
        }

        static std::string format_row(const std::vector<std::string>& cells, const std::vector<size_t>& widths) {
            std::string line{"| "};
            for (size_t i = 0U; i < cells.size(); ++i) {
                if (i > 0U) {
                    line += " | ";
                }
                line += cells[i];
                line.append(widths[i] - visual_width(cells[i]), ' ');
            }
            line += " |";
            return line;
        }

    }  // namespace detail

    size_t visual_width(std::string_view cell) {
        size_t extras = 0U;
        for (auto emoji : {symbols::pass, symbols::fail, symbols::detected, symbols::runtime_fail, symbols::warnings}) {
            extras += detail::count_occurrences(cell, emoji);
        }
        return detail::codepoints(cell) + extras;
    }

    std::string status_icon(const test_result* result) {
        if (result == nullptr) {
            return std::string{symbols::no_result};
        }
        if (result->api_error) {
            return {};
        }

        std::string icon{};
        if (result->passed) {
            icon = symbols::pass;
        }
        else if (result->stage == job_stage::preprocessing || result->stage == job_stage::compilation) {
            icon = symbols::fail;
        }
        else {
            icon = symbols::runtime_fail;
        }
        if (result->passed && result->has_warnings) {
            icon += symbols::warnings;
        }
        return icon;
    }

    std::string build_markdown_table(
            const std::vector<test_result>& results,
            const std::vector<compiler_target>& compilers,
            const std::vector<test_variant>& tests,
            const version_probe& probe) {
        std::vector<const test_variant*> columns{};
        std::set<std::string> groups{};
        for (const auto& t : tests) {
            groups.insert(t.group);
            if (t.include_in_table && !t.is_auto) {
                columns.push_back(&t);
            }
        }
        bool multi_group = groups.size() > 1U;

        auto lookup = detail::index_results(results);
        auto footnotes = detail::assign_footnotes(compilers, probe);

        std::vector<std::string> header{"CC"};
        for (const auto* t : columns) {
            header.push_back(multi_group ? "{}:{}"_format(t->group, t->display_name) : t->display_name);
        }
        std::vector<std::vector<std::string>> rows{header};

        for (const auto& c : compilers) {
            const auto* groups_map = [&]() -> const detail::group_lookup* {
                auto it = lookup.find(c.display_name);
                return it == lookup.end() ? nullptr : &it->second;
            }();

            std::map<std::string, probe_value_t> auto_values{};
            if (groups_map != nullptr) {
                for (const auto& [group, variants] : *groups_map) {
                    for (const auto& [_, r] : variants) {
                        if (r->is_auto && r->impl_value) {
                            auto_values.insert_or_assign(group, *r->impl_value);
                        }
                    }
                }
            }

            auto& row = rows.emplace_back();
            if (auto note = footnotes.find(c.display_name); note != footnotes.end()) {
                row.push_back("{}{}"_format(c.display_name, note->second.marker));
            }
            else {
                row.push_back(c.display_name);
            }

            for (const auto* t : columns) {
                const test_result* result = nullptr;
                if (groups_map != nullptr) {
                    if (auto g = groups_map->find(t->group); g != groups_map->end()) {
                        if (auto v = g->second.find(t->variant); v != g->second.end()) {
                            result = v->second;
                        }
                    }
                }
                auto cell = status_icon(result);
                if (auto av = auto_values.find(t->group);
                    av != auto_values.end() && t->detect_value && *t->detect_value == av->second) {
                    cell = "{}{}"_format(symbols::detected, cell);
                }
                row.push_back(std::move(cell));
            }
        }

        std::vector<size_t> widths(header.size(), 0U);
        for (const auto& row : rows) {
            for (size_t i = 0U; i < row.size(); ++i) {
                widths[i] = std::max(widths[i], visual_width(row[i]));
            }
        }

        std::vector<std::string> lines{};
        lines.push_back(detail::format_row(rows.front(), widths));
        lines.push_back(
                "| {} |"_format(utils::join_with_separator(
                        widths | std::views::transform([](size_t w) { return std::string(w, '-'); }) |
                                std::ranges::to<std::vector<std::string>>(),
                        " | "sv)));
        for (size_t i = 1U; i < rows.size(); ++i) {
            lines.push_back(detail::format_row(rows[i], widths));
        }

        if (!footnotes.empty()) {
            lines.emplace_back();
            std::map<std::string_view, const detail::footnote*> seen{};
            for (const auto& c : compilers) {
                if (auto note = footnotes.find(c.display_name); note != footnotes.end()) {
                    seen.try_emplace(note->second.marker, &note->second);
                }
            }
            for (auto marker : detail::footnote_markers) {
                if (auto it = seen.find(marker); it != seen.end()) {
                    lines.push_back(detail::footnote_text(*it->second));
                }
            }
        }

        return utils::join_with_separator(lines, "\n"sv) + "\n";
    }

    outcome<void> write_markdown_table(
            const std::filesystem::path& path,
            const std::vector<test_result>& results,
            const std::vector<compiler_target>& compilers,
            const std::vector<test_variant>& tests,
            const version_probe& probe) {
        return internal::files::write_text(path, build_markdown_table(results, compilers, tests, probe));
    }

}  // namespace ccprobe
