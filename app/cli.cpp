#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <cmath>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ccprobe::cli {

    namespace detail {

        static void print_list(std::string_view key, const std::vector<std::string>& values, std::ostream& os) {
            os << key << '=';
            if (values.empty()) {
                os << "<all>";
            }
            else {
                os << utils::join_with_separator(values, ","sv);
            }
            os << '\n';
        }

        static void print_config(const run_options& opts, std::ostream& os) {
            os << "config=" << opts.config_file.string() << '\n';
            os << "api_url=" << opts.api_url << '\n';
            os << "language=" << opts.language << '\n';
            print_list("compilers"sv, opts.compiler_filter, os);
            print_list("tests"sv, opts.test_filter, os);
            print_list("groups"sv, opts.group_filter, os);
            os << "all=" << (opts.run_all ? "true" : "false") << '\n';
            os << "table=" << (opts.table ? "true" : "false") << '\n';
            os << "preprocess_only=" << (opts.preprocess_only ? "true" : "false") << '\n';
            os << "results_dir=" << opts.results_dir.string() << '\n';
            os << "table_file=" << (opts.table_file ? opts.table_file->string() : "<results_dir>/table.md") << '\n';
            os << "delay_ms=" << opts.delay_ms << '\n';
            os << "http_timeout_ms=" << opts.http_timeout_ms << '\n';
            os << "tool_timeout_ms=" << opts.tool_timeout_ms << '\n';
            os << "run_timeout_ms=" << opts.run_timeout_ms << '\n';
        }

    }  // namespace detail

    int run(const run_options& opts) {
        auto endpoint = parse_endpoint(opts.api_url);
        if (!endpoint) {
            std::cerr << "invalid --api-url value: " << endpoint.error().message << '\n';
            return 2;
        }

        godbolt_client client{std::move(*endpoint), opts.http_timeout_ms};
        return run_suite(opts, client, std::cout, std::cerr);
    }

    std::optional<int> parse_cli(int argc, char** argv, run_options& opts) {
        CLI::App app{"ccprobe: C compiler conformance matrix"};

        bool show_version = false;
        std::string config_arg{};
        std::string results_arg{opts.results_dir.string()};
        std::string table_file_arg{};
        double delay_seconds = static_cast<double>(opts.delay_ms) / 1000.0;

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("config", config_arg, "YAML suite describing compilers and tests");
        app.add_option("-o,--results-dir", results_arg, "Directory for per-job artifacts");
        app.add_flag("-d,--debug", opts.debug, "Save raw remote responses");
        app.add_option("-c,--compiler", opts.compiler_filter, "Only run compilers with this nickname")
                ->allow_extra_args(false);
        app.add_option("-t,--test", opts.test_filter, "Only run this test or variant")
                ->allow_extra_args(false);
        app.add_option("-g,--group", opts.group_filter, "Only run tests in this group")
                ->allow_extra_args(false);
        app.add_flag("-a,--all", opts.run_all, "Run every variant, not just auto variants");
        app.add_flag("-T,--table", opts.table, "Write a Markdown result table (implies --all)");
        app.add_option("--table-file", table_file_arg, "Markdown table path (default: <results-dir>/table.md)");
        app.add_option("--delay", delay_seconds, "Seconds to wait after each remote call")
                ->check(CLI::NonNegativeNumber);
        app.add_option("--language", opts.language, "Language id sent to the remote compiler");
        app.add_flag("-P,--preprocess-only", opts.preprocess_only, "Stop every job after preprocessing");
        app.add_option("--api-url", opts.api_url, "Remote compiler API base URL");
        app.add_option("--http-timeout-ms", opts.http_timeout_ms, "Remote request timeout")
                ->check(CLI::PositiveNumber);
        app.add_option("--tool-timeout-ms", opts.tool_timeout_ms, "Local compile/assemble/link timeout")
                ->check(CLI::PositiveNumber);
        app.add_option("--run-timeout-ms", opts.run_timeout_ms, "Program execution timeout")
                ->check(CLI::PositiveNumber);
        app.add_flag("--print-config", opts.print_config, "Print resolved options and exit");
        app.add_flag("--verbose", opts.verbose, "Print one progress line per job");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (show_version) {
            std::cout << "ccprobe 0.1.0\n";
            return std::optional<int>{0};
        }

        if (config_arg.empty()) {
            std::cerr << "missing CONFIG argument\n" << app.help();
            return std::optional<int>{2};
        }

        opts.config_file = config_arg;
        opts.results_dir = results_arg;
        if (!table_file_arg.empty()) {
            opts.table_file = std::filesystem::path{table_file_arg};
        }
        opts.delay_ms = static_cast<int>(std::lround(delay_seconds * 1000.0));
        if (opts.table) {
            opts.run_all = true;
        }

        if (opts.print_config) {
            detail::print_config(opts, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace ccprobe::cli
