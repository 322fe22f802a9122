#pragma once

#include "ccprobe.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

#include "../src/internal/files.hpp"
#include "../src/internal/process.hpp"

extern "C" {
#include <sys/stat.h>
#include <unistd.h>
}

#include <algorithm>
#include <chrono>
#include <deque>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace ccprobe::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(const std::string& prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline void write_file(const fs::path& path, std::string_view contents) {
        fs::create_directories(path.parent_path());
        std::ofstream out{path};
        out << contents;
    }

    inline std::string read_file(const fs::path& path) {
        std::ifstream in{path};
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline void write_script(const fs::path& path, std::string_view body) {
        write_file(path, body);
        ::chmod(path.c_str(), 0755);
    }

    /*
     * remote_service double: records every request and answers from a queue of canned replies, or
     * from `responder` when the queue is empty.
     */
    struct fake_remote_service final : remote_service {
        std::vector<remote_request> requests{};
        std::deque<outcome<remote_response>> replies{};
        std::function<outcome<remote_response>(const remote_request&)> responder{};

        outcome<remote_response> submit(const remote_request& request) override {
            requests.push_back(request);
            if (!replies.empty()) {
                auto next = std::move(replies.front());
                replies.pop_front();
                return next;
            }
            if (responder) {
                return responder(request);
            }
            return fail(failure_kind::transport, "no canned reply");
        }

        size_t count(request_kind kind) const {
            return static_cast<size_t>(
                    std::ranges::count_if(requests, [kind](const remote_request& r) { return r.kind() == kind; }));
        }
    };

    inline remote_response pp_response(std::string output, int code = 0, std::vector<std::string> stderr_lines = {}) {
        remote_response r{};
        r.code = code;
        r.pp_output = std::move(output);
        r.stderr_lines = std::move(stderr_lines);
        return r;
    }

    inline remote_response exec_response(
            std::string program_stdout, int exit_code = 0, std::vector<std::string> program_stderr = {}) {
        remote_response r{};
        r.code = exit_code;
        r.did_execute = true;
        r.stdout_lines = {std::move(program_stdout)};
        r.stderr_lines = std::move(program_stderr);
        r.build = build_result{
                .code = 0, .stdout_lines = std::vector<std::string>{}, .stderr_lines = std::vector<std::string>{}};
        return r;
    }

    inline remote_response build_failure(std::vector<std::string> diagnostics) {
        remote_response r{};
        r.code = -1;
        r.did_execute = false;
        r.build = build_result{.code = 1, .stderr_lines = std::move(diagnostics)};
        return r;
    }

    // Echoes the macro probe back with `value` substituted, the way a preprocessor would.
    inline std::string expanded_probe(std::string_view macro, probe_value_t value) {
        return std::format("int {} = (int)({});", macro_probe_marker(macro), value);
    }

}  // namespace ccprobe::test::detail
