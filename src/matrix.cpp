#include "ccprobe/matrix.hpp"

#include "ccprobe/dispatch.hpp"
#include "ccprobe/format.hpp"
#include "ccprobe/project.hpp"
#include "ccprobe/report.hpp"
#include "ccprobe/suite.hpp"
#include "ccprobe/toolchain.hpp"
#include "ccprobe/utils.hpp"

#include "internal/files.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <chrono>
#include <ostream>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <utility>

using namespace ccprobe::literals;
namespace fs = std::filesystem;

namespace ccprobe {

    namespace detail {

        // ── result.json / summary.json ──────────────────────────────────

        struct compiler_record {
            std::optional<std::string> nickname{};
            std::string display_name{};
            std::string api_name{};
            struct glaze {
                using T = compiler_record;
                static constexpr auto value = glz::object(&T::nickname, &T::display_name, &T::api_name);
            };
        };

        struct stage_log_record {
            std::string preprocess{};
            std::string compile{};
            std::string run{};
            struct glaze {
                using T = stage_log_record;
                static constexpr auto value = glz::object(&T::preprocess, &T::compile, &T::run);
            };
        };

        struct result_record {
            std::string test_name{};
            std::string group{};
            std::string variant{};
            std::string variant_display{};
            bool is_auto{};
            std::optional<probe_value_t> detect_value{};
            compiler_record compiler{};
            std::string stage{};
            bool passed{};
            bool warnings{};
            bool errors{};
            bool api_error{};
            std::optional<probe_value_t> impl_value{};
            std::map<std::string, std::string> files{};
            stage_log_record stderr_log{};
            struct glaze {
                using T = result_record;
                static constexpr auto value = glz::object(
                        &T::test_name,
                        &T::group,
                        &T::variant,
                        &T::variant_display,
                        &T::is_auto,
                        &T::detect_value,
                        &T::compiler,
                        &T::stage,
                        &T::passed,
                        &T::warnings,
                        &T::errors,
                        &T::api_error,
                        &T::impl_value,
                        &T::files,
                        "stderr",
                        &T::stderr_log);
            };
        };

        static result_record to_record(const test_result& r) {
            return result_record{
                    .test_name = r.test_name,
                    .group = r.group,
                    .variant = r.variant,
                    .variant_display = r.variant_display,
                    .is_auto = r.is_auto,
                    .detect_value = r.detect_value,
                    .compiler =
                            compiler_record{
                                    .nickname = r.compiler.nickname,
                                    .display_name = r.compiler.display_name,
                                    .api_name = r.compiler.api_name},
                    .stage = std::string{to_string(r.stage)},
                    .passed = r.passed,
                    .warnings = r.has_warnings,
                    .errors = r.has_errors,
                    .api_error = r.api_error,
                    .impl_value = r.impl_value,
                    .files = r.files,
                    .stderr_log =
                            stage_log_record{
                                    .preprocess = r.stderr_log.preprocess,
                                    .compile = r.stderr_log.compile,
                                    .run = r.stderr_log.run},
            };
        }

        // null members are kept so every record has the same keys
        inline constexpr glz::opts record_opts{.skip_null_members = false, .prettify = true};

        template <typename T>
        static outcome<std::string> encode_records(const T& value) {
            std::string json{};
            if (auto ec = glz::write<record_opts>(value, json); ec) {
                return fail(failure_kind::io, "failed to serialize result json");
            }
            json.push_back('\n');
            return json;
        }

        namespace artifact {
            inline constexpr auto preprocessed = "preprocessed";
            inline constexpr auto preprocess_err = "preprocess_err";
            inline constexpr auto compile_err = "compile_err";
            inline constexpr auto run_stdout = "run_stdout";
            inline constexpr auto run_stderr = "run_stderr";
            inline constexpr auto assembly = "assembly";
            inline constexpr auto debug_response = "debug_response";
            inline constexpr auto result = "result";
        }  // namespace artifact

        static std::string prepend(const std::vector<std::string>& lines, std::string source) {
            if (lines.empty()) {
                return source;
            }
            return utils::join_with_separator(lines, "\n"sv) + "\n" + source;
        }

        static std::string join_flags(const std::vector<std::string>& flags) {
            return utils::join_with_separator(flags, " "sv);
        }

        // (compiler display name, group) -> impl_value -> auto result
        using auto_cache = std::map<std::pair<std::string, std::string>, std::map<probe_value_t, test_result>>;

    }  // namespace detail

    std::string safe_compiler_name(std::string_view display_name) {
        std::string out{display_name};
        std::ranges::replace(out, ' ', '_');
        std::ranges::replace(out, '/', '_');
        return out;
    }

    test_result reuse_result(const test_result& source, const test_variant& variant) {
        auto copy = source;
        copy.test_name = variant.test_name;
        copy.variant = variant.variant;
        copy.variant_display = variant.display_name;
        copy.is_auto = false;
        copy.detect_value = variant.detect_value;
        return copy;
    }

    outcome<std::string> encode_result(const test_result& result) {
        return detail::encode_records(detail::to_record(result));
    }

    outcome<std::string> encode_summary(const std::vector<test_result>& results) {
        std::vector<detail::result_record> records{};
        records.reserve(results.size());
        for (const auto& r : results) {
            records.push_back(detail::to_record(r));
        }
        return detail::encode_records(records);
    }

    struct matrix_runner::job {
        fs::path dir{};
        test_result result{};

        std::string artifact(const char* key) const { return result.files.at(key); }
    };

    matrix_runner::matrix_runner(const run_options& opts, remote_service& service, std::ostream& out, std::ostream& err)
            : opts_{opts}, service_{service}, out_{out}, err_{err} {}

    void matrix_runner::pace() const {
        if (opts_.delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds{opts_.delay_ms});
        }
    }

    void matrix_runner::save_text(const fs::path& path, std::string_view text) const {
        if (auto written = internal::files::write_text(path, text); !written) {
            err_ << "Warning: " << written.error().message << '\n';
        }
    }

    test_result matrix_runner::finish(job& j) const {
        debug_log(j.result.test_name, " on ", j.result.compiler.display_name, " -> ", to_string(j.result.stage));
        if (auto json = encode_result(j.result)) {
            save_text(j.artifact(detail::artifact::result), *json);
        }
        else {
            err_ << "Warning: " << json.error().message << '\n';
        }
        return std::move(j.result);
    }

    namespace detail {

        struct job_seed {
            fs::path dir{};
            std::map<std::string, std::string> files{};
        };

        static job_seed seed_job(
                const run_options& opts, const test_variant& test, const compiler_target& compiler, bool full_run) {
            job_seed seed{};
            seed.dir = opts.results_dir / "{}_{}"_format(test.test_name, safe_compiler_name(compiler.display_name));
            auto path_of = [&](std::string_view file) { return (seed.dir / file).string(); };

            seed.files[artifact::preprocessed] = path_of("preprocessed.c");
            seed.files[artifact::preprocess_err] = path_of("preprocess_err.txt");
            if (full_run) {
                seed.files[artifact::compile_err] = path_of("compile_err.txt");
                seed.files[artifact::run_stdout] = path_of("run_stdout.txt");
                seed.files[artifact::run_stderr] = path_of("run_stderr.txt");
            }
            seed.files[artifact::result] = path_of("result.json");
            if (opts.debug) {
                seed.files[artifact::debug_response] = path_of("debug_response.json");
            }
            return seed;
        }

        static test_result blank_result(const test_variant& test, const compiler_target& compiler) {
            return test_result{
                    .test_name = test.test_name,
                    .group = test.group,
                    .variant = test.variant,
                    .variant_display = test.display_name,
                    .is_auto = test.is_auto,
                    .detect_value = test.detect_value,
                    .compiler =
                            compiler_identity{
                                    .nickname = compiler.nickname,
                                    .display_name = compiler.display_name,
                                    .api_name = compiler.api_name},
            };
        }

    }  // namespace detail

    test_result matrix_runner::run_test(const test_variant& test, const compiler_target& compiler) {
        auto seed = detail::seed_job(opts_, test, compiler, true);
        job j{.dir = seed.dir, .result = detail::blank_result(test, compiler)};
        j.result.files = std::move(seed.files);
        auto& r = j.result;

        auto source = internal::files::read_text(test.file_name);
        if (!source) {
            r.api_error = true;
            r.stderr_log.preprocess = "Failed to read source: {}"_format(source.error().message);
            return finish(j);
        }

        compilation_unit unit{
                service_,
                detail::prepend(test.prepend_lines, std::move(*source)),
                compiler.api_name,
                opts_.language,
                detail::join_flags(remote_flags(compiler))};

        auto aux = load_test_files(test);
        for (const auto& w : aux.warnings) {
            err_ << "Warning: " << w << '\n';
        }
        for (auto& f : aux.files) {
            unit.add_file(std::move(f.filename), std::move(f.contents));
        }
        if (test.detect_macro) {
            unit.inject_macro_probe(*test.detect_macro);
        }

        // ── preprocessing ──
        auto pp = unit.preprocess(preprocess_options{.filter_headers = true, .trim = true, .restore_includes = true});
        pace();
        if (!pp) {
            r.api_error = true;
            r.stderr_log.preprocess = pp.error().message;
            save_text(j.artifact(detail::artifact::preprocess_err), pp.error().message);
            return finish(j);
        }
        if (opts_.debug && unit.response()) {
            save_text(j.artifact(detail::artifact::debug_response), unit.response()->raw_body);
        }

        r.stderr_log.preprocess = unit.compiler_stderr();
        r.has_warnings = unit.has_warnings();
        if (unit.has_errors()) {
            r.has_errors = true;
            save_text(j.artifact(detail::artifact::preprocess_err), r.stderr_log.preprocess);
            return finish(j);
        }

        auto preprocessed = unit.preprocessed().value_or(std::string{});
        if (utils::trim_view(preprocessed).empty()) {
            save_text(j.artifact(detail::artifact::preprocess_err), "No preprocessed output");
            return finish(j);
        }
        save_text(j.artifact(detail::artifact::preprocessed), preprocessed);

        if (test.detect_macro) {
            if (auto value = unit.macro_value(*test.detect_macro)) {
                r.impl_value = *value;
            }
        }

        // ── compilation / execution ──
        r.stage = job_stage::compilation;
        dispatch_limits limits{.tool_timeout_ms = opts_.tool_timeout_ms, .run_timeout_ms = opts_.run_timeout_ms};
        auto dispatched = dispatch(unit, compiler, limits);
        if (compiler.mode() != exec_mode::local_compile) {
            pace();
        }

        if (compiler.mode() == exec_mode::local_assemble) {
            // a local toolchain failure means the remote compile already produced the assembly
            std::optional<std::string> assembly{};
            if (dispatched) {
                assembly = dispatched->assembly;
            }
            else if (dispatched.error().kind == failure_kind::toolchain ||
                     dispatched.error().kind == failure_kind::timeout) {
                if (auto text = unit.assembly()) {
                    assembly = std::move(*text);
                }
            }
            if (assembly && !assembly->empty()) {
                auto asm_path = (j.dir / "output.s").string();
                r.files[detail::artifact::assembly] = asm_path;
                save_text(asm_path, *assembly);
            }
        }

        r.has_warnings = r.has_warnings || unit.has_warnings();
        if (!dispatched) {
            const auto& f = dispatched.error();
            r.stderr_log.compile = f.message;
            r.api_error = f.kind == failure_kind::transport;
            r.has_errors = f.kind == failure_kind::compiler;
            save_text(j.artifact(detail::artifact::compile_err), f.message);
            return finish(j);
        }

        const auto& run = dispatched->run;
        save_text(j.artifact(detail::artifact::run_stdout), run.stdout_text);
        save_text(j.artifact(detail::artifact::run_stderr), run.stderr_text);
        r.stderr_log.run = run.stderr_text;
        r.has_warnings = r.has_warnings || !run.stderr_text.empty();

        if (run.exit_code != 0) {
            r.stage = job_stage::runtime;
            return finish(j);
        }
        r.stage = job_stage::success;
        r.passed = true;
        return finish(j);
    }

    test_result matrix_runner::run_preprocess_only(const test_variant& test, const compiler_target& compiler) {
        auto seed = detail::seed_job(opts_, test, compiler, false);
        job j{.dir = seed.dir, .result = detail::blank_result(test, compiler)};
        j.result.files = std::move(seed.files);
        auto& r = j.result;

        auto source = internal::files::read_text(test.file_name);
        if (!source) {
            r.api_error = true;
            r.stderr_log.preprocess = "Failed to read source: {}"_format(source.error().message);
            return finish(j);
        }

        // no execution happens, so no local-assemble flag adjustments
        compilation_unit unit{
                service_,
                detail::prepend(test.prepend_lines, std::move(*source)),
                compiler.api_name,
                opts_.language,
                detail::join_flags(compiler.extra_flags)};

        auto aux = load_test_files(test);
        for (const auto& w : aux.warnings) {
            err_ << "Warning: " << w << '\n';
        }
        for (auto& f : aux.files) {
            unit.add_file(std::move(f.filename), std::move(f.contents));
        }
        if (test.detect_macro) {
            unit.inject_macro_probe(*test.detect_macro);
        }

        auto pp = unit.preprocess(preprocess_options{.filter_headers = true, .trim = true, .restore_includes = true});
        pace();
        if (!pp) {
            r.api_error = true;
            r.stderr_log.preprocess = pp.error().message;
            save_text(j.artifact(detail::artifact::preprocess_err), pp.error().message);
            return finish(j);
        }
        if (opts_.debug && unit.response()) {
            save_text(j.artifact(detail::artifact::debug_response), unit.response()->raw_body);
        }

        r.stderr_log.preprocess = unit.compiler_stderr();
        r.has_warnings = unit.has_warnings();
        bool errors = unit.has_errors();
        if (errors) {
            save_text(j.artifact(detail::artifact::preprocess_err), r.stderr_log.preprocess);
        }

        auto preprocessed = unit.preprocessed().value_or(std::string{});
        if (utils::trim_view(preprocessed).empty()) {
            save_text(j.artifact(detail::artifact::preprocess_err), "No preprocessed output");
            return finish(j);
        }
        save_text(j.artifact(detail::artifact::preprocessed), preprocessed);

        if (test.detect_macro) {
            if (auto value = unit.macro_value(*test.detect_macro)) {
                r.impl_value = *value;
            }
        }

        r.has_errors = errors;
        r.passed = !errors;
        return finish(j);
    }

    matrix_summary matrix_runner::run(const std::vector<test_variant>& tests, const std::vector<compiler_target>& compilers) {
        matrix_summary summary{};
        bool run_all = opts_.run_all || opts_.table;
        bool has_non_auto = std::ranges::any_of(tests, [](const test_variant& t) { return !t.is_auto; });
        // in all-variants mode auto variants only seed reuse; their matching variants carry the count
        bool auto_uncounted = run_all && has_non_auto;

        auto non_auto_count = static_cast<size_t>(std::ranges::count_if(tests, [](const test_variant& t) {
            return !t.is_auto;
        }));
        summary.effective_total = (auto_uncounted ? non_auto_count : tests.size()) * compilers.size();

        detail::auto_cache cache{};
        size_t progress = 0U;

        for (const auto& test : tests) {
            for (const auto& compiler : compilers) {
                auto key = std::make_pair(compiler.display_name, test.group);

                if (!test.is_auto && test.detect_value) {
                    if (auto slot = cache.find(key); slot != cache.end()) {
                        if (auto hit = slot->second.find(*test.detect_value);
                            hit != slot->second.end() && hit->second.impl_value == test.detect_value) {
                            auto reused = reuse_result(hit->second, test);
                            if (reused.passed) {
                                ++summary.passed;
                            }
                            ++summary.reused_results;
                            ++progress;
                            if (opts_.verbose) {
                                out_ << "[{}/{}] {} on {}: reused auto result ({})\n"_format(
                                        progress,
                                        summary.effective_total,
                                        test.test_name,
                                        compiler.display_name,
                                        reused.stage);
                            }
                            summary.results.push_back(std::move(reused));
                            continue;
                        }
                    }
                }

                auto result = opts_.preprocess_only ? run_preprocess_only(test, compiler) : run_test(test, compiler);
                ++summary.executed_jobs;

                if (test.is_auto && result.impl_value) {
                    cache[key].insert_or_assign(*result.impl_value, result);
                }

                bool counted = !(auto_uncounted && test.is_auto);
                if (counted && result.passed) {
                    ++summary.passed;
                }
                if (!result.passed) {
                    out_ << "✗ {} on {} (stage: {})\n"_format(test.test_name, compiler.display_name, result.stage);
                }
                if (counted) {
                    ++progress;
                }
                if (opts_.verbose) {
                    out_ << "[{}/{}] {} on {}: {}{}\n"_format(
                            progress,
                            summary.effective_total,
                            test.test_name,
                            compiler.display_name,
                            result.stage,
                            result.passed ? "" : " (failed)");
                }
                summary.results.push_back(std::move(result));
            }
        }
        return summary;
    }

    int run_suite(const run_options& opts, remote_service& service, std::ostream& out, std::ostream& err) {
        auto loaded = load_suite(opts.config_file);
        if (!loaded) {
            err << "Error loading config: " << loaded.error().message << '\n';
            return 1;
        }
        resolve_file_paths(loaded->tests, fs::current_path());

        auto filtered = apply_filters(std::move(*loaded), opts);
        if (!filtered) {
            err << "Error: " << filtered.error().message << '\n';
            return 1;
        }
        auto& s = *filtered;

        bool run_all = opts.run_all || opts.table;
        s.tests = select_runnable(std::move(s.tests), run_all, !opts.test_filter.empty());
        if (s.compilers.empty() || s.tests.empty()) {
            err << "Error: No compilers or tests to run.\n";
            return 1;
        }

        std::error_code ec{};
        fs::remove_all(opts.results_dir, ec);
        fs::create_directories(opts.results_dir, ec);
        if (ec) {
            err << "Error: cannot prepare results directory {}: {}\n"_format(opts.results_dir.string(), ec.message());
            return 1;
        }

        matrix_runner runner{opts, service, out, err};
        auto summary = runner.run(s.tests, s.compilers);

        if (auto json = encode_summary(summary.results)) {
            if (auto written = internal::files::write_text(opts.results_dir / "summary.json", *json); !written) {
                err << "Warning: " << written.error().message << '\n';
            }
        }
        else {
            err << "Warning: " << json.error().message << '\n';
        }

        out << "\nResults: {}/{} passed\n"_format(summary.passed, summary.effective_total);
        if (summary.all_passed()) {
            out << "All tests passed!\n";
        }

        if (opts.table) {
            auto table_path = opts.table_file.value_or(opts.results_dir / "table.md");
            version_probe probe = [timeout = opts.version_timeout_ms](const std::string& command) {
                return detect_toolchain(command, timeout);
            };
            if (auto written = write_markdown_table(table_path, summary.results, s.compilers, s.tests, probe);
                !written) {
                err << "Error: " << written.error().message << '\n';
                return 1;
            }
            out << "Table written to: {}\n"_format(table_path.string());
        }

        return summary.all_passed() ? 0 : 1;
    }

}  // namespace ccprobe
