#include "cli.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        ccprobe::run_options opts{};
        if (auto cli_result = ccprobe::cli::parse_cli(argc, argv, opts)) {
            return *cli_result;
        }

        return ccprobe::cli::run(opts);
    } catch (std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    } catch (...) {
        std::cerr << "fatal: unknown exception\n";
        return 1;
    }
}
