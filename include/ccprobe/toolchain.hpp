#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ccprobe {

    struct toolchain_identity {
        std::string name{};
        std::string version{};

        // "gcc 15.2.1"
        std::string display() const { return name + ' ' + version; }

        bool operator==(const toolchain_identity&) const = default;
    };

    /*
     * Recognizes `--version` banners:
     *   gcc:   "gcc (GCC) 15.2.1", "gcc version 15.2.1" (first X.Y[.Z] after "gcc")
     *   clang: "clang version 21.1.6"
     *   tcc:   "tcc version 0.9.28rc"
     * Matching is case-insensitive and tried in that order.
     */
    std::optional<toolchain_identity> parse_version_banner(std::string_view banner);

    // Runs `{command} --version`; empty when the tool is missing, times out or is unrecognized.
    std::optional<toolchain_identity> detect_toolchain(const std::string& command, int timeout_ms = 5'000);

}  // namespace ccprobe
