#pragma once

#include "ccprobe/format.hpp"
#include "ccprobe/outcome.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>

namespace ccprobe::internal::files {
    namespace fs = std::filesystem;
    using namespace ccprobe::literals;

    inline outcome<std::string> read_text(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        if (!in) {
            return fail(failure_kind::io, "Failed to read {}: cannot open file"_format(path.string()));
        }
        std::ostringstream ss{};
        ss << in.rdbuf();
        if (in.bad()) {
            return fail(failure_kind::io, "Failed to read {}: read error"_format(path.string()));
        }
        return ss.str();
    }

    // Creates missing parent directories.
    inline outcome<void> write_text(const fs::path& path, std::string_view contents) {
        std::error_code ec{};
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                return fail(
                        failure_kind::io,
                        "Failed to create {}: {}"_format(path.parent_path().string(), ec.message()));
            }
        }
        std::ofstream out{path, std::ios::binary | std::ios::trunc};
        if (!out) {
            return fail(failure_kind::io, "Failed to open {} for writing"_format(path.string()));
        }
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        if (!out) {
            return fail(failure_kind::io, "Failed to write {}"_format(path.string()));
        }
        return {};
    }

    /// Owns a freshly created directory under the system temp dir; removes it recursively on destruction.
    class scoped_temp_dir {
      public:
        explicit scoped_temp_dir(std::string_view prefix = "ccprobe"sv) {
            auto base = fs::temp_directory_path() / "{}-XXXXXX"_format(prefix);
            auto pattern = base.string();
            if (::mkdtemp(pattern.data()) == nullptr) {
                throw std::system_error{errno, std::generic_category(), "mkdtemp failed for " + base.string()};
            }
            path_ = pattern;
        }

        scoped_temp_dir(const scoped_temp_dir&) = delete;
        scoped_temp_dir& operator=(const scoped_temp_dir&) = delete;

        ~scoped_temp_dir() {
            std::error_code ec{};
            fs::remove_all(path_, ec);
        }

        const fs::path& path() const { return path_; }

      private:
        fs::path path_{};
    };

    // Creates a scoped_temp_dir, reporting failure as an outcome.
    inline outcome<std::unique_ptr<scoped_temp_dir>> make_temp_dir(std::string_view prefix = "ccprobe"sv) {
        try {
            return std::make_unique<scoped_temp_dir>(prefix);
        } catch (const std::exception& e) {
            return fail(failure_kind::io, "Failed to create temporary directory: {}"_format(e.what()));
        }
    }

}  // namespace ccprobe::internal::files
