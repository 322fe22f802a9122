#include "ccprobe/remote.hpp"

#include "ccprobe/format.hpp"
#include "ccprobe/utils.hpp"

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace ccprobe::literals;

namespace ccprobe {

    namespace detail {

        // ── request wire types ──────────────────────────────────────────

        struct wire_file {
            std::string filename{};
            std::string contents{};
            struct glaze {
                using T = wire_file;
                static constexpr auto value = glz::object(&T::filename, &T::contents);
            };
        };

        struct wire_library {
            std::string id{};
            std::string version{};
            struct glaze {
                using T = wire_library;
                static constexpr auto value = glz::object(&T::id, &T::version);
            };
        };

        struct wire_execute_parameters {
            std::vector<std::string> args{};
            std::string stdin_text{};
            std::vector<std::string> runtime_tools{};
            struct glaze {
                using T = wire_execute_parameters;
                static constexpr auto value =
                        glz::object(&T::args, "stdin", &T::stdin_text, "runtimeTools", &T::runtime_tools);
            };
        };

        struct wire_produce_pp {
            bool filter_headers{true};
            bool clang_format{false};
            struct glaze {
                using T = wire_produce_pp;
                static constexpr auto value =
                        glz::object("filter-headers", &T::filter_headers, "clang-format", &T::clang_format);
            };
        };

        struct wire_compiler_options {
            std::optional<wire_produce_pp> produce_pp{};
            std::optional<bool> skip_asm{};
            std::optional<bool> executor_request{};
            std::optional<std::vector<std::string>> overrides{};
            struct glaze {
                using T = wire_compiler_options;
                static constexpr auto value = glz::object(
                        "producePp",
                        &T::produce_pp,
                        "skipAsm",
                        &T::skip_asm,
                        "executorRequest",
                        &T::executor_request,
                        &T::overrides);
            };
        };

        struct wire_filters {
            std::optional<bool> binary_object{};
            std::optional<bool> binary{};
            std::optional<bool> execute{};
            std::optional<bool> intel{};
            std::optional<bool> demangle{};
            std::optional<bool> labels{};
            std::optional<bool> library_code{};
            std::optional<bool> directives{};
            std::optional<bool> comment_only{};
            std::optional<bool> trim{};
            std::optional<bool> debug_calls{};
            struct glaze {
                using T = wire_filters;
                static constexpr auto value = glz::object(
                        "binaryObject",
                        &T::binary_object,
                        &T::binary,
                        &T::execute,
                        &T::intel,
                        &T::demangle,
                        &T::labels,
                        "libraryCode",
                        &T::library_code,
                        &T::directives,
                        "commentOnly",
                        &T::comment_only,
                        &T::trim,
                        "debugCalls",
                        &T::debug_calls);
            };
        };

        struct wire_options {
            std::string user_arguments{};
            std::vector<std::string> tools{};
            std::vector<wire_library> libraries{};
            wire_execute_parameters execute_parameters{};
            wire_compiler_options compiler_options{};
            wire_filters filters{};
            struct glaze {
                using T = wire_options;
                static constexpr auto value = glz::object(
                        "userArguments",
                        &T::user_arguments,
                        &T::tools,
                        &T::libraries,
                        "executeParameters",
                        &T::execute_parameters,
                        "compilerOptions",
                        &T::compiler_options,
                        &T::filters);
            };
        };

        struct wire_request {
            std::string source{};
            std::string compiler{};
            std::string lang{};
            std::vector<wire_file> files{};
            bool bypass_cache{false};
            bool allow_store_code_debug{true};
            wire_options options{};
            struct glaze {
                using T = wire_request;
                static constexpr auto value = glz::object(
                        &T::source,
                        &T::compiler,
                        &T::lang,
                        &T::files,
                        "bypassCache",
                        &T::bypass_cache,
                        "allowStoreCodeDebug",
                        &T::allow_store_code_debug,
                        &T::options);
            };
        };

        // ── response wire types ─────────────────────────────────────────

        struct wire_text_line {
            std::optional<std::string> text{};
            struct glaze {
                using T = wire_text_line;
                static constexpr auto value = glz::object(&T::text);
            };
        };

        using wire_lines = std::vector<wire_text_line>;

        // the service reports execTime either as a number or as a numeric string
        using wire_exec_time = std::variant<double, std::string>;

        struct wire_pp_output {
            std::optional<std::string> output{};
            struct glaze {
                using T = wire_pp_output;
                static constexpr auto value = glz::object(&T::output);
            };
        };

        struct wire_build_result {
            std::optional<int> code{};
            std::optional<wire_lines> stdout_lines{};
            std::optional<wire_lines> stderr_lines{};
            std::optional<wire_exec_time> exec_time{};
            struct glaze {
                using T = wire_build_result;
                static constexpr auto value = glz::object(
                        &T::code, "stdout", &T::stdout_lines, "stderr", &T::stderr_lines, "execTime", &T::exec_time);
            };
        };

        struct wire_response {
            std::optional<int> code{};
            std::optional<wire_pp_output> pp_output{};
            std::optional<wire_lines> asm_lines{};
            std::optional<wire_lines> stdout_lines{};
            std::optional<wire_lines> stderr_lines{};
            std::optional<bool> did_execute{};
            std::optional<wire_exec_time> exec_time{};
            std::optional<wire_build_result> build_result{};
            struct glaze {
                using T = wire_response;
                static constexpr auto value = glz::object(
                        &T::code,
                        "ppOutput",
                        &T::pp_output,
                        "asm",
                        &T::asm_lines,
                        "stdout",
                        &T::stdout_lines,
                        "stderr",
                        &T::stderr_lines,
                        "didExecute",
                        &T::did_execute,
                        "execTime",
                        &T::exec_time,
                        "buildResult",
                        &T::build_result);
            };
        };

        static std::vector<std::string> collect_text(const wire_lines& lines) {
            std::vector<std::string> out{};
            out.reserve(lines.size());
            for (const auto& line : lines) {
                if (line.text) {
                    out.push_back(*line.text);
                }
            }
            return out;
        }

        static std::optional<std::vector<std::string>> collect_text(const std::optional<wire_lines>& lines) {
            if (!lines) {
                return std::nullopt;
            }
            return collect_text(*lines);
        }

        static std::optional<std::int64_t> to_exec_time(const std::optional<wire_exec_time>& value) {
            if (!value) {
                return std::nullopt;
            }
            if (const auto* number = std::get_if<double>(&*value)) {
                // [-2^63, 2^63) converts exactly; anything else is dropped
                if (!std::isfinite(*number) || *number < -0x1p63 || *number >= 0x1p63) {
                    return std::nullopt;
                }
                return static_cast<std::int64_t>(*number);
            }
            return utils::parse_arithmetic<std::int64_t>(utils::trim_view(std::get<std::string>(*value)));
        }

        static void apply_options(wire_options& out, const preprocess_request_options& opts) {
            out.compiler_options.produce_pp = wire_produce_pp{opts.filter_headers, opts.clang_format};
            out.compiler_options.overrides.emplace();
            out.filters = wire_filters{
                    .binary_object = false,
                    .binary = false,
                    .execute = false,
                    .intel = true,
                    .demangle = true,
                    .labels = true,
                    .library_code = true,
                    .directives = true,
                    .comment_only = true,
                    .trim = false,
                    .debug_calls = false,
            };
        }

        static void apply_options(wire_options& out, const compile_request_options& opts) {
            out.compiler_options.skip_asm = false;
            out.compiler_options.executor_request = false;
            out.compiler_options.overrides.emplace();
            out.filters = wire_filters{
                    .binary_object = false,
                    .binary = false,
                    .execute = false,
                    .intel = opts.intel_syntax,
                    .demangle = true,
                    .labels = opts.filter_labels,
                    .library_code = false,
                    .directives = opts.filter_directives,
                    .comment_only = opts.filter_comments,
                    .trim = false,
                    .debug_calls = false,
            };
        }

        static void apply_options(wire_options& out, const execute_request_options& opts) {
            out.execute_parameters.args = opts.args;
            out.execute_parameters.stdin_text = opts.stdin_text;
            out.compiler_options.executor_request = true;
            out.filters.execute = true;
        }

    }  // namespace detail

    outcome<std::string> encode_request(const remote_request& request) {
        detail::wire_request wire{};
        wire.source = request.source;
        wire.compiler = request.compiler;
        wire.lang = request.language;
        for (const auto& f : request.files) {
            wire.files.push_back(detail::wire_file{f.filename, f.contents});
        }
        wire.options.user_arguments = request.user_arguments;
        for (const auto& lib : request.libraries) {
            wire.options.libraries.push_back(detail::wire_library{lib.id, lib.version});
        }
        std::visit([&wire](const auto& opts) { detail::apply_options(wire.options, opts); }, request.options);

        std::string json{};
        if (auto ec = glz::write_json(wire, json); ec) {
            return fail(failure_kind::transport, "failed to serialize {} request"_format(request.kind()));
        }
        return json;
    }

    outcome<remote_response> decode_response(std::string body) {
        detail::wire_response wire{};
        if (auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(wire, body); ec) {
            return fail(failure_kind::transport, "Invalid JSON in response: {}"_format(glz::format_error(ec, body)));
        }

        remote_response out{};
        out.code = wire.code;
        if (wire.pp_output) {
            out.pp_output = std::move(wire.pp_output->output);
        }
        out.asm_lines = detail::collect_text(wire.asm_lines);
        out.stdout_lines = detail::collect_text(wire.stdout_lines).value_or(std::vector<std::string>{});
        out.stderr_lines = detail::collect_text(wire.stderr_lines).value_or(std::vector<std::string>{});
        out.did_execute = wire.did_execute;
        out.exec_time_ms = detail::to_exec_time(wire.exec_time);
        if (wire.build_result) {
            out.build = build_result{
                    .code = wire.build_result->code,
                    .stdout_lines = detail::collect_text(wire.build_result->stdout_lines),
                    .stderr_lines = detail::collect_text(wire.build_result->stderr_lines),
                    .exec_time_ms = detail::to_exec_time(wire.build_result->exec_time),
            };
        }
        out.raw_body = std::move(body);
        return out;
    }

}  // namespace ccprobe
