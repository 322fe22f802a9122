#pragma once

#include "ccprobe.hpp"

#include <optional>

namespace ccprobe::cli {

    std::optional<int> parse_cli(int argc, char** argv, run_options& opts);
    int run(const run_options& opts);

}  // namespace ccprobe::cli
