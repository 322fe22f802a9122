#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace ccprobe {

    using namespace std::string_view_literals;

    enum class failure_kind : uint8_t {
        transport,
        compiler,
        toolchain,
        timeout,
        io,
        config,
        usage,
    };

    inline constexpr std::string_view to_string(failure_kind kind) {
        switch (kind) {
            case failure_kind::transport:
                return "transport"sv;
            case failure_kind::compiler:
                return "compiler"sv;
            case failure_kind::toolchain:
                return "toolchain"sv;
            case failure_kind::timeout:
                return "timeout"sv;
            case failure_kind::io:
                return "io"sv;
            case failure_kind::config:
                return "config"sv;
            case failure_kind::usage:
                return "usage"sv;
        }
        return "usage"sv;
    }

    struct failure {
        failure_kind kind{failure_kind::usage};
        std::string message{};
        std::optional<int> status_code{};
    };

    /*
     * Every fallible operation in the instrumentation, dispatch and orchestration layers returns an
     * outcome. Chaining goes through the std::expected monadic members:
     *
     *   unit.preprocess(opts)
     *       .and_then([&] { return unit.preprocessed(); })
     *       .transform([](const std::string& text) { return text.size(); })
     *       .value_or(0U);
     */
    template <typename T>
    using outcome = std::expected<T, failure>;

    inline std::unexpected<failure> fail(failure_kind kind, std::string message) {
        return std::unexpected<failure>{failure{kind, std::move(message), std::nullopt}};
    }

    inline std::unexpected<failure> fail_http(int status_code, std::string message) {
        return std::unexpected<failure>{failure{failure_kind::transport, std::move(message), status_code}};
    }

    inline bool is_toolchain_failure(const failure& f) {
        return f.kind == failure_kind::toolchain || f.kind == failure_kind::timeout;
    }

}  // namespace ccprobe
