#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ccprobe::internal::process {

    struct subprocess_request {
        std::vector<std::string> args{};
        std::optional<std::filesystem::path> cwd{};
        std::string stdin_text{};
        int timeout_ms{30'000};
    };

    struct subprocess_result {
        int exit_code{};
        std::string stdout_output{};
        std::string stderr_output{};
        bool timed_out{false};
        // execvp failed in the child (tool not found / not executable); exit_code is 127
        bool launch_failed{false};
    };

    subprocess_result run_subprocess(const subprocess_request& request);

    // Joins argv for logs and error messages.
    std::string render_command(const std::vector<std::string>& args);

}  // namespace ccprobe::internal::process
