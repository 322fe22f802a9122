#pragma once

#include "outcome.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ccprobe {

    using probe_value_t = std::int64_t;

    enum class include_kind : uint8_t { system, local };

    inline constexpr std::string_view to_string(include_kind kind) {
        switch (kind) {
            case include_kind::system:
                return "system"sv;
            case include_kind::local:
                return "local"sv;
        }
        return "local"sv;
    }

    struct include_probe {
        std::string start_marker{};
        std::string end_marker{};
        std::string original_include{};
    };

    /*
     * Probe state for one compilation unit.
     *
     * - includes: (start, end, original) triples in declaration order, rebuilt by every
     *   inject_include_probes call.
     * - macros: registered macro names in injection order.
     * - macro_values: values extracted by the most recent preprocess cycle.
     */
    struct probe_set {
        std::vector<include_probe> includes{};
        std::vector<std::string> macros{};
        std::unordered_map<std::string, probe_value_t> macro_values{};

        void clear_macros() {
            macros.clear();
            macro_values.clear();
        }
    };

    namespace markers {
        inline constexpr auto include_start_prefix = "__godbolt_start_probe"sv;
        inline constexpr auto include_end_prefix = "__godbolt_end_probe"sv;
        inline constexpr auto macro_prefix = "__GODBOLT_MACRO_PROBE_"sv;
        inline constexpr auto macro_suffix = "__"sv;
    }  // namespace markers

    // "dir/x.h" -> "dir__SLASHx__PERIODh"
    std::string encode_header_path(std::string_view header);

    std::string macro_probe_marker(std::string_view macro_name);

    std::string inject_include_probes(std::string_view source, probe_set& probes);

    std::string restore_includes(std::string_view preprocessed, const probe_set& probes);

    // No-op when `macro_name` is already registered.
    std::string inject_macro_probe(std::string source, std::string_view macro_name, probe_set& probes);

    std::optional<probe_value_t> extract_probe(std::string_view text, std::string_view macro_name);

    // Replaces the value cache; names whose literal is missing or malformed get no entry.
    void extract_macro_probes(std::string_view text, probe_set& probes);

    outcome<probe_value_t> probe_value(const probe_set& probes, std::string_view macro_name);

    std::string strip_probe_lines(std::string_view text, const probe_set& probes);

}  // namespace ccprobe
