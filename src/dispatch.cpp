#include "ccprobe/dispatch.hpp"

#include "ccprobe/format.hpp"
#include "ccprobe/utils.hpp"

#include "internal/files.hpp"
#include "internal/process.hpp"

#include <algorithm>
#include <filesystem>

using namespace ccprobe::literals;
namespace fs = std::filesystem;

namespace ccprobe {

    namespace detail {

        using internal::process::run_subprocess;
        using internal::process::subprocess_request;

        static constexpr bool is_alpha_or_underscore(char c) noexcept {
            auto lower = static_cast<char>(c | 0x20);
            return (lower >= 'a' && lower <= 'z') || c == '_';
        }

        // `{ws}+ $ [.] [A-Za-z_]` starting at `pos`
        static bool matches_symbol_immediate(std::string_view text, size_t pos) {
            auto operand = utils::skip_spaces(text, pos);
            if (operand == pos || operand >= text.size() || text[operand] != '$') {
                return false;
            }
            ++operand;
            if (operand < text.size() && text[operand] == '.') {
                ++operand;
            }
            return operand < text.size() && is_alpha_or_underscore(text[operand]);
        }

        static bool matches_mnemonic(std::string_view text, size_t pos, std::string_view stem) {
            if (text.substr(pos, stem.size()) != stem) {
                return false;
            }
            auto end = pos + stem.size();
            if (matches_symbol_immediate(text, end)) {
                return true;
            }
            return end < text.size() && (text[end] == 'l' || text[end] == 'q') &&
                   matches_symbol_immediate(text, end + 1U);
        }

        static outcome<void> run_tool(
                std::string_view label,
                std::vector<std::string> args,
                std::optional<fs::path> cwd,
                int timeout_ms) {
            auto proc = run_subprocess({.args = std::move(args), .cwd = std::move(cwd), .timeout_ms = timeout_ms});
            if (proc.launch_failed) {
                return fail(failure_kind::toolchain, "Tool not found: {}"_format(proc.stderr_output));
            }
            if (proc.timed_out) {
                return fail(failure_kind::timeout, "{} timed out"_format(label));
            }
            if (proc.exit_code != 0) {
                return fail(failure_kind::toolchain, "{} failed:\n{}"_format(label, proc.stderr_output));
            }
            return {};
        }

        static outcome<run_output> run_program(const fs::path& exe, const dispatch_limits& limits) {
            std::vector<std::string> args{exe.string()};
            args.insert(args.end(), limits.program_args.begin(), limits.program_args.end());

            auto proc = run_subprocess(
                    {.args = std::move(args), .stdin_text = limits.stdin_text, .timeout_ms = limits.run_timeout_ms});
            if (proc.launch_failed) {
                return fail(failure_kind::toolchain, "Executable '{}' not found"_format(exe.string()));
            }
            if (proc.timed_out) {
                return fail(failure_kind::timeout, "Program execution timed out");
            }
            return run_output{
                    .stdout_text = std::move(proc.stdout_output),
                    .stderr_text = std::move(proc.stderr_output),
                    .exit_code = proc.exit_code,
            };
        }

        // Relative location inside the scratch dir; rejects names that would escape it.
        static std::optional<fs::path> scratch_relative(std::string_view filename) {
            auto rel = fs::path{filename}.relative_path().lexically_normal();
            if (rel.empty() || *rel.begin() == "..") {
                return std::nullopt;
            }
            return rel;
        }

        static std::string_view source_file_name(std::string_view language) {
            return utils::str_case_eq(language, "c++"sv) ? "source.cpp"sv : "source.c"sv;
        }

    }  // namespace detail

    bool needs_no_pie(std::string_view assembly) {
        for (size_t i = 0U; i < assembly.size(); ++i) {
            if (i > 0U && utils::is_identifier_char(assembly[i - 1U])) {
                continue;
            }
            if (detail::matches_mnemonic(assembly, i, "mov"sv) || detail::matches_mnemonic(assembly, i, "push"sv)) {
                return true;
            }
        }
        return false;
    }

    std::vector<std::string> remote_flags(const compiler_target& target) {
        auto flags = target.extra_flags;
        auto api_lower = target.api_name | std::views::transform(utils::char_tolower) | std::ranges::to<std::string>();
        if (target.mode() == exec_mode::local_assemble && api_lower.find("clang") != std::string::npos) {
            utils::append_unique(flags, "-fno-integrated-as");
        }
        return flags;
    }

    outcome<dispatch_output> run_remote_execute(compilation_unit& unit, const dispatch_limits& limits) {
        if (auto submitted = unit.execute(limits.program_args, limits.stdin_text); !submitted) {
            return std::unexpected{std::move(submitted.error())};
        }

        const auto& response = *unit.response();
        if (!response.did_execute.value_or(false) && unit.has_errors()) {
            return fail(failure_kind::compiler, unit.compiler_stderr());
        }

        return dispatch_output{
                .run =
                        run_output{
                                .stdout_text = unit.program_stdout().value_or(std::string{}),
                                .stderr_text = unit.program_stderr().value_or(std::string{}),
                                .exit_code = unit.exit_code().value_or(-1),
                        },
        };
    }

    outcome<dispatch_output> run_local_assemble(
            compilation_unit& unit, const local_assemble_params& params, const dispatch_limits& limits) {
        // keep directives, labels and comments: the local assembler needs .globl and friends
        auto compiled = unit.compile(compile_request_options{
                .intel_syntax = false, .filter_directives = false, .filter_labels = false, .filter_comments = false});
        if (!compiled) {
            return std::unexpected{std::move(compiled.error())};
        }
        if (unit.has_errors()) {
            return fail(failure_kind::compiler, unit.compiler_stderr());
        }

        auto assembly = unit.assembly();
        if (!assembly) {
            return std::unexpected{std::move(assembly.error())};
        }

        auto scratch = internal::files::make_temp_dir("ccprobe-asm"sv);
        if (!scratch) {
            return std::unexpected{std::move(scratch.error())};
        }
        const auto& dir = (*scratch)->path();
        auto asm_path = dir / "output.s";
        auto obj_path = dir / "output.o";
        auto exe_path = dir / "program";

        if (auto written = internal::files::write_text(asm_path, *assembly); !written) {
            return std::unexpected{std::move(written.error())};
        }

        std::vector<std::string> asm_cmd{params.assembler};
        asm_cmd.insert(asm_cmd.end(), params.assembler_args.begin(), params.assembler_args.end());
        asm_cmd.insert(asm_cmd.end(), {"-o", obj_path.string(), asm_path.string()});

        auto link_args = params.linker_args;
        if (needs_no_pie(*assembly)) {
            utils::append_unique(link_args, "-no-pie");
        }
        std::vector<std::string> link_cmd{params.linker};
        link_cmd.insert(link_cmd.end(), link_args.begin(), link_args.end());
        link_cmd.insert(link_cmd.end(), {"-o", exe_path.string(), obj_path.string()});

        return detail::run_tool("Assembly"sv, std::move(asm_cmd), std::nullopt, limits.tool_timeout_ms)
                .and_then([&] {
                    return detail::run_tool("Linking"sv, std::move(link_cmd), std::nullopt, limits.tool_timeout_ms);
                })
                .and_then([&] { return detail::run_program(exe_path, limits); })
                .transform([&](run_output run) {
                    return dispatch_output{.run = std::move(run), .assembly = std::move(*assembly)};
                });
    }

    outcome<dispatch_output> run_local_compile(
            compilation_unit& unit, const local_compile_params& params, const dispatch_limits& limits) {
        auto preprocessed = unit.preprocessed();
        if (!preprocessed) {
            if (auto pp = unit.preprocess(preprocess_options{.restore_includes = true}); !pp) {
                return std::unexpected{std::move(pp.error())};
            }
            preprocessed = unit.preprocessed();
            if (!preprocessed) {
                return std::unexpected{std::move(preprocessed.error())};
            }
        }

        auto scratch = internal::files::make_temp_dir("ccprobe-cc"sv);
        if (!scratch) {
            return std::unexpected{std::move(scratch.error())};
        }
        const auto& dir = (*scratch)->path();
        auto src_path = dir / detail::source_file_name(unit.language());
        auto exe_path = dir / "program";

        if (auto written = internal::files::write_text(src_path, *preprocessed); !written) {
            return std::unexpected{std::move(written.error())};
        }
        for (const auto& file : unit.files()) {
            auto rel = detail::scratch_relative(file.filename);
            if (!rel) {
                debug_log("skipping auxiliary file outside scratch dir: ", file.filename);
                continue;
            }
            if (auto written = internal::files::write_text(dir / *rel, file.contents); !written) {
                return std::unexpected{std::move(written.error())};
            }
        }

        std::vector<std::string> cc_cmd{params.compiler};
        cc_cmd.insert(cc_cmd.end(), params.compiler_args.begin(), params.compiler_args.end());
        cc_cmd.insert(cc_cmd.end(), {"-o", exe_path.string(), src_path.string()});

        return detail::run_tool("Local compilation"sv, std::move(cc_cmd), dir, limits.tool_timeout_ms)
                .and_then([&] { return detail::run_program(exe_path, limits); })
                .transform([](run_output run) { return dispatch_output{.run = std::move(run)}; });
    }

    outcome<dispatch_output> dispatch(
            compilation_unit& unit, const compiler_target& target, const dispatch_limits& limits) {
        debug_log("dispatch ", unit.compiler(), " via ", to_string(target.mode()));
        if (const auto* asm_params = target.assemble_params()) {
            return run_local_assemble(unit, *asm_params, limits);
        }
        if (const auto* cc_params = target.compile_params()) {
            return run_local_compile(unit, *cc_params, limits);
        }
        return run_remote_execute(unit, limits);
    }

}  // namespace ccprobe
