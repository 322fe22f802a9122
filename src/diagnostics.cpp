#include "ccprobe/diagnostics.hpp"

#include "ccprobe/utils.hpp"

namespace ccprobe {

    namespace detail {
        static const std::vector<std::string> no_lines{};

        static const std::vector<std::string>& lines_or_empty(const std::vector<std::string>* lines) {
            return lines ? *lines : no_lines;
        }
    }  // namespace detail

    compiler_streams select_compiler_streams(const remote_response& response) {
        if (response.build && (response.build->stderr_lines || response.build->stdout_lines)) {
            const auto& build = *response.build;
            return {
                    .stderr_lines = build.stderr_lines ? &*build.stderr_lines : nullptr,
                    .stdout_lines = build.stdout_lines ? &*build.stdout_lines : nullptr,
            };
        }
        return {.stderr_lines = &response.stderr_lines, .stdout_lines = &response.stdout_lines};
    }

    std::vector<std::string> compiler_messages(const remote_response& response) {
        auto streams = select_compiler_streams(response);
        std::vector<std::string> out{detail::lines_or_empty(streams.stderr_lines)};
        const auto& out_lines = detail::lines_or_empty(streams.stdout_lines);
        out.insert(out.end(), out_lines.begin(), out_lines.end());
        return out;
    }

    std::string compiler_stderr(const remote_response& response) {
        auto streams = select_compiler_streams(response);
        const auto& err_lines = detail::lines_or_empty(streams.stderr_lines);
        return utils::join_with_separator(
                err_lines.empty() ? detail::lines_or_empty(streams.stdout_lines) : err_lines, "\n"sv);
    }

    bool has_errors(const remote_response& response) {
        return response.code.has_value() && *response.code != 0;
    }

    bool has_warnings(const remote_response& response) {
        auto streams = select_compiler_streams(response);
        const auto& err_lines = detail::lines_or_empty(streams.stderr_lines);
        const auto& out_lines = detail::lines_or_empty(streams.stdout_lines);

        std::vector<std::string> chunks{};
        if (!err_lines.empty()) {
            chunks.push_back(utils::join_with_separator(err_lines, "\n"sv));
        }
        if (!out_lines.empty()) {
            chunks.push_back(utils::join_with_separator(out_lines, "\n"sv));
        }
        if (chunks.empty()) {
            return false;
        }
        return utils::contains_word_icase(utils::join_with_separator(chunks, "\n"sv), "warning"sv);
    }

    size_t error_count(const remote_response& response) {
        return utils::count_words_icase(compiler_stderr(response), "error:"sv);
    }

    size_t warning_count(const remote_response& response) {
        return utils::count_words_icase(compiler_stderr(response), "warning:"sv);
    }

}  // namespace ccprobe
