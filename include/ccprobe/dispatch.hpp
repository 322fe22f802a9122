#pragma once

#include "config.hpp"
#include "project.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ccprobe {

    struct run_output {
        std::string stdout_text{};
        std::string stderr_text{};
        int exit_code{-1};
    };

    struct dispatch_output {
        run_output run{};
        // local-assemble only
        std::optional<std::string> assembly{};
    };

    struct dispatch_limits {
        int tool_timeout_ms{30'000};
        int run_timeout_ms{10'000};
        std::vector<std::string> program_args{};
        std::string stdin_text{};
    };

    // Absolute (non-PIC) immediate symbol operands, e.g. `movl $.LC0, %eax` or `pushl $msg`.
    bool needs_no_pie(std::string_view assembly);

    // Flags sent to the remote compiler for `target`; clang in local-assemble mode gets
    // -fno-integrated-as so the output is GNU as compatible.
    std::vector<std::string> remote_flags(const compiler_target& target);

    /*
     * Execution pipelines. Each returns the program's stdout/stderr/exit code or a failure:
     *
     * - transport: the remote request failed
     * - compiler: the remote compiler reported a non-zero status (message is its stderr)
     * - toolchain / timeout: a local tool or the produced executable could not run to completion
     * - io: the scratch directory could not be prepared
     *
     * A non-zero program exit is not a failure.
     */
    outcome<dispatch_output> run_remote_execute(compilation_unit& unit, const dispatch_limits& limits);

    outcome<dispatch_output> run_local_assemble(
            compilation_unit& unit, const local_assemble_params& params, const dispatch_limits& limits);

    // Uses the unit's preprocessed output, preprocessing (with include restoration) first if there is none.
    outcome<dispatch_output> run_local_compile(
            compilation_unit& unit, const local_compile_params& params, const dispatch_limits& limits);

    outcome<dispatch_output> dispatch(
            compilation_unit& unit, const compiler_target& target, const dispatch_limits& limits);

}  // namespace ccprobe
