#pragma once

#include "remote.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ccprobe {

    // Compiler diagnostic streams of a response: buildResult for execute responses that carry
    // streams there, otherwise the top level.
    struct compiler_streams {
        const std::vector<std::string>* stderr_lines{};
        const std::vector<std::string>* stdout_lines{};
    };

    compiler_streams select_compiler_streams(const remote_response& response);

    std::vector<std::string> compiler_messages(const remote_response& response);

    // stderr lines joined by '\n', or stdout lines when stderr is empty
    std::string compiler_stderr(const remote_response& response);

    bool has_errors(const remote_response& response);

    bool has_warnings(const remote_response& response);

    size_t error_count(const remote_response& response);

    size_t warning_count(const remote_response& response);

}  // namespace ccprobe
