#pragma once

#include "config.hpp"
#include "outcome.hpp"
#include "remote.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace ccprobe {

    struct suite {
        std::vector<compiler_target> compilers{};
        std::vector<test_variant> tests{};
    };

    /*
     * YAML suite loading.
     *
     * Tests come in two shapes:
     * - grouped: an entry with `variants:`; every other key of the entry is a default for its variants.
     *   Scalars are overridden by the variant; list keys (prepend_lines, additional_files,
     *   include_dirs/include_directories) concatenate group-first with duplicates dropped.
     * - flat: an entry without `variants:` is a single-variant group.
     *
     * Rejected with failure_kind::config: unreadable or malformed YAML, a compiler without api_name,
     * a compiler enabling both local_asm and local_compile, more than one auto variant in a group.
     */
    outcome<suite> parse_suite(std::string_view yaml_text);

    outcome<suite> load_suite(const std::filesystem::path& config_file);

    // Makes file_name, additional file paths and include dirs absolute against `base_dir`.
    void resolve_file_paths(std::vector<test_variant>& tests, const std::filesystem::path& base_dir);

    struct loaded_files {
        std::vector<source_file> files{};
        std::vector<std::string> warnings{};
    };

    /*
     * Auxiliary files for a test, keyed by the name the remote compiler sees.
     *
     * additional_files are looked up at their configured path, then under each include dir by
     * relative path, then by basename. Afterwards every regular file directly inside an include dir
     * is attached under its basename unless that name is taken. Unreadable files become warnings.
     */
    loaded_files load_test_files(const test_variant& test);

    // Applies --compiler/--test/--group filters; a filter that leaves nothing is a usage failure.
    outcome<suite> apply_filters(suite s, const run_options& opts);

    // Unless every variant was requested (or tests were named explicitly), keeps auto variants plus
    // every variant of groups without one.
    std::vector<test_variant> select_runnable(std::vector<test_variant> tests, bool run_all, bool explicit_tests);

}  // namespace ccprobe
