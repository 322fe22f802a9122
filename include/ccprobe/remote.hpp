#pragma once

#include "outcome.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ccprobe {

    enum class request_kind : uint8_t { preprocess, compile, execute };

    inline constexpr std::string_view to_string(request_kind kind) {
        switch (kind) {
            case request_kind::preprocess:
                return "preprocess"sv;
            case request_kind::compile:
                return "compile"sv;
            case request_kind::execute:
                return "execute"sv;
        }
        return "compile"sv;
    }

    struct preprocess_request_options {
        bool filter_headers{true};
        bool clang_format{false};
    };

    struct compile_request_options {
        bool intel_syntax{false};
        bool filter_directives{true};
        bool filter_labels{true};
        bool filter_comments{true};
    };

    struct execute_request_options {
        std::vector<std::string> args{};
        std::string stdin_text{};
    };

    using request_options =
            std::variant<preprocess_request_options, compile_request_options, execute_request_options>;

    struct source_file {
        std::string filename{};
        std::string contents{};

        bool operator==(const source_file&) const = default;
    };

    struct library_ref {
        std::string id{};
        std::string version{};

        bool operator==(const library_ref&) const = default;
    };

    struct remote_request {
        std::string compiler{};
        std::string language{"c"};
        std::string source{};
        std::string user_arguments{};
        std::vector<source_file> files{};
        std::vector<library_ref> libraries{};
        request_options options{};

        request_kind kind() const { return static_cast<request_kind>(options.index()); }
    };

    // Compiler diagnostics of an execute request; present only when the service built the program.
    struct build_result {
        std::optional<int> code{};
        std::optional<std::vector<std::string>> stdout_lines{};
        std::optional<std::vector<std::string>> stderr_lines{};
        std::optional<std::int64_t> exec_time_ms{};
    };

    /*
     * Normalized payload of one compile-endpoint response.
     *
     * Which members are populated depends on the request kind:
     * - preprocess: pp_output, code, stdout/stderr (compiler diagnostics)
     * - compile: asm_lines, code, stdout/stderr (compiler diagnostics)
     * - execute: stdout/stderr (program output), code (program exit), did_execute, build
     *
     * `raw_body` keeps the undecoded JSON for debug artifacts.
     */
    struct remote_response {
        std::optional<int> code{};
        std::optional<std::string> pp_output{};
        std::optional<std::vector<std::string>> asm_lines{};
        std::vector<std::string> stdout_lines{};
        std::vector<std::string> stderr_lines{};
        std::optional<bool> did_execute{};
        std::optional<std::int64_t> exec_time_ms{};
        std::optional<build_result> build{};
        std::string raw_body{};
    };

    outcome<std::string> encode_request(const remote_request& request);

    outcome<remote_response> decode_response(std::string body);

    class remote_service {
      public:
        virtual ~remote_service() = default;

        virtual outcome<remote_response> submit(const remote_request& request) = 0;
    };

    struct http_endpoint {
        bool tls{true};
        std::string host{};
        std::string port{};
        std::string base_target{};
    };

    // Accepts `http://host[:port][/path]` and `https://host[:port][/path]`.
    outcome<http_endpoint> parse_endpoint(std::string_view url);

    /// HTTP/1.1 client for the `{base}/{compiler}/compile` endpoint. Each submit opens a fresh
    /// connection; there are no retries.
    class godbolt_client final : public remote_service {
      public:
        explicit godbolt_client(http_endpoint endpoint, int timeout_ms = 60'000);

        outcome<remote_response> submit(const remote_request& request) override;

        const http_endpoint& endpoint() const { return endpoint_; }

      private:
        http_endpoint endpoint_;
        int timeout_ms_;
    };

}  // namespace ccprobe
