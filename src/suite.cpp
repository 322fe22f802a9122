#include "ccprobe/suite.hpp"

#include "ccprobe/format.hpp"
#include "ccprobe/utils.hpp"

#include "internal/files.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>

using namespace ccprobe::literals;
namespace fs = std::filesystem;

namespace ccprobe {

    namespace detail {

        namespace keys {
            inline constexpr auto compilers = "compilers";
            inline constexpr auto tests = "tests";
            inline constexpr auto variants = "variants";

            inline constexpr auto api_name = "api_name";
            inline constexpr auto display_name = "display_name";
            inline constexpr auto nickname = "nickname";
            inline constexpr auto extra_flags = "extra_flags";
            inline constexpr auto local_asm = "local_asm";
            inline constexpr auto assembler = "assembler";
            inline constexpr auto assembler_args = "assembler_args";
            inline constexpr auto linker = "linker";
            inline constexpr auto local_linker_args = "local_linker_args";
            inline constexpr auto local_compile = "local_compile";
            inline constexpr auto local_compiler = "local_compiler";
            inline constexpr auto local_compiler_args = "local_compiler_args";

            inline constexpr auto group = "group";
            inline constexpr auto variant = "variant";
            inline constexpr auto name = "name";
            inline constexpr auto test_name = "test_name";
            inline constexpr auto file_name = "file_name";
            inline constexpr auto detect_macro = "detect_macro";
            inline constexpr auto detect_value = "detect_value";
            inline constexpr auto is_auto = "auto";
            inline constexpr auto include_in_table = "include_in_table";
            inline constexpr auto prepend_lines = "prepend_lines";
            inline constexpr auto additional_files = "additional_files";
            inline constexpr auto include_dirs = "include_dirs";
            inline constexpr auto include_directories = "include_directories";
        }  // namespace keys

        class config_error : public std::runtime_error {
          public:
            using std::runtime_error::runtime_error;
        };

        static bool has_value(const YAML::Node& node) {
            return node.IsDefined() && !node.IsNull();
        }

        static std::vector<std::string> as_string_list(const YAML::Node& node) {
            if (!has_value(node)) {
                return {};
            }
            if (node.IsScalar()) {
                return {node.as<std::string>()};
            }
            return node.as<std::vector<std::string>>();
        }

        static std::optional<std::string> as_nonempty_string(const YAML::Node& node) {
            if (!has_value(node)) {
                return std::nullopt;
            }
            auto value = node.as<std::string>();
            if (value.empty()) {
                return std::nullopt;
            }
            return value;
        }

        template <typename T>
        static T value_or(const YAML::Node& node, T fallback) {
            return has_value(node) ? node.as<T>() : std::move(fallback);
        }

        static compiler_target parse_compiler(const YAML::Node& node, size_t index) {
            if (!node.IsMap()) {
                throw config_error{"compilers[{}] must be a mapping"_format(index)};
            }
            compiler_target out{};
            auto api_name = as_nonempty_string(node[keys::api_name]);
            if (!api_name) {
                throw config_error{"compilers[{}] is missing api_name"_format(index)};
            }
            out.api_name = std::move(*api_name);
            out.display_name = value_or<std::string>(node[keys::display_name], out.api_name);
            out.nickname = as_nonempty_string(node[keys::nickname]);
            out.extra_flags = as_string_list(node[keys::extra_flags]);

            auto local_asm = value_or(node[keys::local_asm], false);
            auto local_compile = value_or(node[keys::local_compile], false);
            if (local_asm && local_compile) {
                throw config_error{
                        "compiler '{}' enables both local_asm and local_compile; pick one"_format(out.display_name)};
            }
            if (local_asm) {
                out.fallback = local_assemble_params{
                        .assembler = value_or<std::string>(node[keys::assembler], "as"),
                        .assembler_args = as_string_list(node[keys::assembler_args]),
                        .linker = value_or<std::string>(node[keys::linker], "gcc"),
                        .linker_args = as_string_list(node[keys::local_linker_args]),
                };
            }
            else if (local_compile) {
                out.fallback = local_compile_params{
                        .compiler = value_or<std::string>(node[keys::local_compiler], "gcc"),
                        .compiler_args = as_string_list(node[keys::local_compiler_args]),
                };
            }
            return out;
        }

        // Variant-level keys shadow group-level keys.
        struct layered_entry {
            const YAML::Node& variant;
            const YAML::Node* group{};

            YAML::Node operator[](const char* key) const {
                if (!variant[key] && group != nullptr && (*group)[key]) {
                    return (*group)[key];
                }
                return variant[key];
            }

            // group items copied as-is, then variant items not already present
            std::vector<std::string> merged_list(std::initializer_list<const char*> list_keys) const {
                std::vector<std::string> out{};
                if (group != nullptr) {
                    for (const auto* key : list_keys) {
                        for (auto& item : as_string_list((*group)[key])) {
                            out.push_back(std::move(item));
                        }
                    }
                }
                for (const auto* key : list_keys) {
                    for (auto& item : as_string_list(variant[key])) {
                        if (group != nullptr) {
                            utils::append_unique(out, std::move(item));
                        }
                        else {
                            out.push_back(std::move(item));
                        }
                    }
                }
                return out;
            }
        };

        static test_variant parse_variant(const layered_entry& entry, std::string group_name) {
            test_variant out{};
            out.group = std::move(group_name);

            const auto& v = entry.variant;
            out.variant = as_nonempty_string(v[keys::variant])
                                  .or_else([&] { return as_nonempty_string(v[keys::name]); })
                                  .or_else([&] { return as_nonempty_string(v[keys::test_name]); })
                                  .value_or(std::string{});
            out.test_name = as_nonempty_string(v[keys::test_name]).value_or("{}_{}"_format(out.group, out.variant));

            out.is_auto = value_or(entry[keys::is_auto], false);
            out.file_name = value_or<std::string>(entry[keys::file_name], std::string{});
            out.display_name = value_or<std::string>(entry[keys::display_name], out.variant);
            out.detect_macro = as_nonempty_string(entry[keys::detect_macro]);
            if (auto dv = entry[keys::detect_value]; has_value(dv)) {
                out.detect_value = dv.as<std::int64_t>();
            }
            out.include_in_table = value_or(entry[keys::include_in_table], !out.is_auto);

            out.prepend_lines = entry.merged_list({keys::prepend_lines});
            for (auto& name : entry.merged_list({keys::additional_files})) {
                out.additional_files.push_back(aux_file_ref{.logical_name = name, .path = name});
            }
            for (auto& dir : entry.merged_list({keys::include_dirs, keys::include_directories})) {
                out.include_dirs.emplace_back(std::move(dir));
            }
            return out;
        }

        static void parse_test_entry(const YAML::Node& entry, size_t index, std::vector<test_variant>& out) {
            if (!entry.IsMap()) {
                throw config_error{"tests[{}] must be a mapping"_format(index)};
            }
            auto group_name = as_nonempty_string(entry[keys::group]).value_or("default");

            if (!entry[keys::variants]) {
                out.push_back(parse_variant(layered_entry{.variant = entry, .group = nullptr}, std::move(group_name)));
                return;
            }

            const auto variants = entry[keys::variants];
            if (!variants.IsSequence()) {
                throw config_error{"tests[{}].variants must be a list"_format(index)};
            }
            for (const auto& variant : variants) {
                if (!variant.IsMap()) {
                    throw config_error{"tests[{}].variants entries must be mappings"_format(index)};
                }
                out.push_back(parse_variant(layered_entry{.variant = variant, .group = &entry}, group_name));
            }
        }

        static void validate_auto_variants(const std::vector<test_variant>& tests) {
            std::map<std::string, size_t> auto_counts{};
            for (const auto& t : tests) {
                if (t.is_auto && ++auto_counts[t.group] > 1U) {
                    throw config_error{"group '{}' declares more than one auto variant"_format(t.group)};
                }
            }
        }

        static suite parse_root(const YAML::Node& root) {
            suite out{};
            if (!has_value(root)) {
                return out;
            }
            if (!root.IsMap()) {
                throw config_error{"suite root must be a mapping"};
            }

            if (auto compilers = root[keys::compilers]; has_value(compilers)) {
                size_t i = 0U;
                for (const auto& node : compilers) {
                    out.compilers.push_back(parse_compiler(node, i++));
                }
            }
            if (auto tests = root[keys::tests]; has_value(tests)) {
                size_t i = 0U;
                for (const auto& node : tests) {
                    parse_test_entry(node, i++, out.tests);
                }
            }
            validate_auto_variants(out.tests);
            return out;
        }

        static outcome<suite> guarded_parse(std::string_view origin, auto&& load) {
            try {
                return parse_root(load());
            } catch (const config_error& e) {
                return fail(failure_kind::config, "{}: {}"_format(origin, e.what()));
            } catch (const YAML::BadFile& e) {
                return fail(failure_kind::config, "{}: cannot read file: {}"_format(origin, e.what()));
            } catch (const YAML::ParserException& e) {
                return fail(failure_kind::config, "{}: invalid YAML: {}"_format(origin, e.what()));
            } catch (const YAML::Exception& e) {
                return fail(failure_kind::config, "{}: {}"_format(origin, e.what()));
            }
        }

        static fs::path absolute_against(const fs::path& p, const fs::path& base) {
            if (p.is_absolute()) {
                return p;
            }
            return (base / p).lexically_normal();
        }

        static bool is_regular_file(const fs::path& p) {
            std::error_code ec{};
            return fs::is_regular_file(p, ec);
        }

        static std::optional<fs::path> resolve_additional_file(
                const aux_file_ref& ref, const std::vector<fs::path>& include_dirs) {
            if (is_regular_file(ref.path)) {
                return ref.path;
            }
            auto base_name = fs::path{ref.logical_name}.filename();
            for (const auto& dir : include_dirs) {
                if (auto full = dir / ref.logical_name; is_regular_file(full)) {
                    return full;
                }
                if (auto by_base = dir / base_name; is_regular_file(by_base)) {
                    return by_base;
                }
            }
            return std::nullopt;
        }

    }  // namespace detail

    outcome<suite> parse_suite(std::string_view yaml_text) {
        return detail::guarded_parse("<inline>"sv, [&] { return YAML::Load(std::string{yaml_text}); });
    }

    outcome<suite> load_suite(const fs::path& config_file) {
        auto origin = config_file.string();
        return detail::guarded_parse(origin, [&] { return YAML::LoadFile(origin); });
    }

    void resolve_file_paths(std::vector<test_variant>& tests, const fs::path& base_dir) {
        for (auto& t : tests) {
            t.file_name = detail::absolute_against(t.file_name, base_dir);
            for (auto& ref : t.additional_files) {
                ref.path = detail::absolute_against(ref.path, base_dir);
            }
            for (auto& dir : t.include_dirs) {
                dir = detail::absolute_against(dir, base_dir);
            }
        }
    }

    loaded_files load_test_files(const test_variant& test) {
        loaded_files out{};
        std::set<std::string> seen{};

        for (const auto& ref : test.additional_files) {
            if (seen.contains(ref.logical_name)) {
                continue;
            }
            auto resolved = detail::resolve_additional_file(ref, test.include_dirs);
            if (!resolved) {
                out.warnings.push_back(
                        "Could not read file {} (also not found in include directories)"_format(ref.path.string()));
                continue;
            }
            auto contents = internal::files::read_text(*resolved);
            if (!contents) {
                out.warnings.push_back(contents.error().message);
                continue;
            }
            out.files.push_back(source_file{ref.logical_name, std::move(*contents)});
            seen.insert(ref.logical_name);
        }

        for (const auto& dir : test.include_dirs) {
            std::error_code ec{};
            if (!fs::is_directory(dir, ec)) {
                out.warnings.push_back("Include directory does not exist: {}"_format(dir.string()));
                continue;
            }

            std::vector<fs::path> entries{};
            for (fs::directory_iterator it{dir, ec}, end{}; !ec && it != end; it.increment(ec)) {
                if (detail::is_regular_file(it->path())) {
                    entries.push_back(it->path());
                }
            }
            if (ec) {
                out.warnings.push_back("Could not list directory {}: {}"_format(dir.string(), ec.message()));
                continue;
            }
            std::ranges::sort(entries);

            for (const auto& path : entries) {
                auto name = path.filename().string();
                if (seen.contains(name)) {
                    continue;
                }
                auto contents = internal::files::read_text(path);
                if (!contents) {
                    out.warnings.push_back(contents.error().message);
                    continue;
                }
                out.files.push_back(source_file{name, std::move(*contents)});
                seen.insert(std::move(name));
            }
        }
        return out;
    }

    outcome<suite> apply_filters(suite s, const run_options& opts) {
        auto joined = [](const std::vector<std::string>& values) { return utils::join_with_separator(values, ", "sv); };
        auto listed = [](const std::vector<std::string>& values, const std::string& v) {
            return std::ranges::find(values, v) != values.end();
        };

        if (!opts.compiler_filter.empty()) {
            std::erase_if(s.compilers, [&](const compiler_target& c) {
                return !c.nickname || !listed(opts.compiler_filter, *c.nickname);
            });
            if (s.compilers.empty()) {
                return fail(failure_kind::usage, "No compilers matching: {}"_format(joined(opts.compiler_filter)));
            }
        }
        if (!opts.test_filter.empty()) {
            std::erase_if(s.tests, [&](const test_variant& t) {
                return !listed(opts.test_filter, t.test_name) && !listed(opts.test_filter, t.variant);
            });
            if (s.tests.empty()) {
                return fail(failure_kind::usage, "No tests matching: {}"_format(joined(opts.test_filter)));
            }
        }
        if (!opts.group_filter.empty()) {
            std::erase_if(s.tests, [&](const test_variant& t) { return !listed(opts.group_filter, t.group); });
            if (s.tests.empty()) {
                return fail(failure_kind::usage, "No tests matching groups: {}"_format(joined(opts.group_filter)));
            }
        }
        return s;
    }

    std::vector<test_variant> select_runnable(std::vector<test_variant> tests, bool run_all, bool explicit_tests) {
        if (run_all || explicit_tests) {
            return tests;
        }
        std::set<std::string> groups_with_auto{};
        for (const auto& t : tests) {
            if (t.is_auto) {
                groups_with_auto.insert(t.group);
            }
        }
        std::erase_if(tests, [&](const test_variant& t) { return !t.is_auto && groups_with_auto.contains(t.group); });
        return tests;
    }

}  // namespace ccprobe
