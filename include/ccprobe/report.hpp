#pragma once

#include "config.hpp"
#include "matrix.hpp"
#include "toolchain.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ccprobe {

    namespace symbols {
        inline constexpr auto pass = "✅"sv;
        inline constexpr auto fail = "❌"sv;
        inline constexpr auto runtime_fail = "⚠️"sv;
        inline constexpr auto warnings = "ℹ️"sv;
        inline constexpr auto detected = "⭐"sv;
        inline constexpr auto no_result = "—"sv;
    }  // namespace symbols

    // Local toolchain lookup used for footnotes; defaults to detect_toolchain.
    using version_probe = std::function<std::optional<toolchain_identity>(const std::string& command)>;

    // Codepoints plus one per emoji occurrence (they render two columns wide).
    size_t visual_width(std::string_view cell);

    // `nullptr` means no result for the pair.
    std::string status_icon(const test_result* result);

    /*
     * Markdown matrix: one row per compiler (configured order), one column per non-auto variant with
     * include_in_table. Compilers running through a local fallback get a `*`..`****` suffix keyed by
     * (mode, local toolchain identity) and a footnote after a blank line.
     */
    std::string build_markdown_table(
            const std::vector<test_result>& results,
            const std::vector<compiler_target>& compilers,
            const std::vector<test_variant>& tests,
            const version_probe& probe);

    outcome<void> write_markdown_table(
            const std::filesystem::path& path,
            const std::vector<test_result>& results,
            const std::vector<compiler_target>& compilers,
            const std::vector<test_variant>& tests,
            const version_probe& probe);

}  // namespace ccprobe
