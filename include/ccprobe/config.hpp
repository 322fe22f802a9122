#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ccprobe {

    using namespace std::string_view_literals;

    /*
     * ccprobe Run Options
     *
     * Inputs
     * - config_file: YAML suite describing compilers and tests.
     * - api_url: Base URL of the remote compile endpoint ({api_url}/{compiler}/compile).
     * - language: Language id sent to the remote service ("c", "c++").
     *
     * Selection
     * - compiler_filter: Compiler nicknames to keep (empty keeps all).
     * - test_filter: Test names or variant names to keep (empty keeps all).
     * - group_filter: Test groups to keep (empty keeps all).
     * - run_all: Run every variant instead of only auto variants.
     * - table: Write the Markdown summary table (implies run_all).
     * - preprocess_only: Stop each job after preprocessing.
     *
     * Output
     * - results_dir: Per-job artifacts, result.json files and summary.json.
     * - table_file: Markdown table path (defaults to {results_dir}/table.md).
     * - debug: Keep the raw remote response of every preprocess call.
     * - verbose: One progress line per (test, compiler) pair.
     *
     * Pacing and limits
     * - delay_ms: Pause after every remote call (rate limiting).
     * - http_timeout_ms: Budget for one remote request.
     * - tool_timeout_ms: Budget for local compile/assemble/link.
     * - run_timeout_ms: Budget for running a produced executable.
     * - version_timeout_ms: Budget for `<tool> --version` probes.
     */

    enum class exec_mode : uint8_t { remote_execute, local_assemble, local_compile };

    inline constexpr std::string_view to_string(exec_mode mode) {
        switch (mode) {
            case exec_mode::remote_execute:
                return "remote"sv;
            case exec_mode::local_assemble:
                return "local_asm"sv;
            case exec_mode::local_compile:
                return "local_compile"sv;
        }
        return "remote"sv;
    }

    inline constexpr bool try_parse_exec_mode(std::string_view text, exec_mode& out) {
        if (utils::str_case_eq(text, "remote"sv)) {
            out = exec_mode::remote_execute;
            return true;
        }
        if (utils::str_case_eq(text, "local_asm"sv)) {
            out = exec_mode::local_assemble;
            return true;
        }
        if (utils::str_case_eq(text, "local_compile"sv)) {
            out = exec_mode::local_compile;
            return true;
        }
        return false;
    }

    struct local_assemble_params {
        std::string assembler{"as"};
        std::vector<std::string> assembler_args{};
        std::string linker{"gcc"};
        std::vector<std::string> linker_args{};
    };

    struct local_compile_params {
        std::string compiler{"gcc"};
        std::vector<std::string> compiler_args{};
    };

    using local_fallback = std::variant<std::monostate, local_assemble_params, local_compile_params>;

    struct compiler_target {
        std::string api_name{};
        std::string display_name{};
        std::optional<std::string> nickname{};
        std::vector<std::string> extra_flags{};
        local_fallback fallback{};

        exec_mode mode() const {
            if (std::holds_alternative<local_assemble_params>(fallback)) {
                return exec_mode::local_assemble;
            }
            if (std::holds_alternative<local_compile_params>(fallback)) {
                return exec_mode::local_compile;
            }
            return exec_mode::remote_execute;
        }

        const local_assemble_params* assemble_params() const { return std::get_if<local_assemble_params>(&fallback); }
        const local_compile_params* compile_params() const { return std::get_if<local_compile_params>(&fallback); }
    };

    struct aux_file_ref {
        std::string logical_name{};
        std::filesystem::path path{};

        bool operator==(const aux_file_ref&) const = default;
    };

    struct test_variant {
        std::string test_name{};
        std::string variant{};
        std::string group{"default"};
        std::filesystem::path file_name{};
        std::string display_name{};
        std::vector<std::string> prepend_lines{};
        std::optional<std::string> detect_macro{};
        std::optional<std::int64_t> detect_value{};
        bool is_auto{false};
        bool include_in_table{true};
        std::vector<aux_file_ref> additional_files{};
        std::vector<std::filesystem::path> include_dirs{};
    };

    struct run_options {
        std::filesystem::path config_file{};
        std::string api_url{"https://godbolt.org/api/compiler"};
        std::string language{"c"};

        std::vector<std::string> compiler_filter{};
        std::vector<std::string> test_filter{};
        std::vector<std::string> group_filter{};
        bool run_all{false};
        bool table{false};
        bool preprocess_only{false};

        std::filesystem::path results_dir{"results"};
        std::optional<std::filesystem::path> table_file{};
        bool debug{false};
        bool verbose{false};

        int delay_ms{500};
        int http_timeout_ms{60'000};
        int tool_timeout_ms{30'000};
        int run_timeout_ms{10'000};
        int version_timeout_ms{5'000};

        bool print_config{false};
    };

}  // namespace ccprobe
