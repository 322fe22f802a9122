#pragma once

#include "instrument.hpp"
#include "remote.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ccprobe {

    struct preprocess_options {
        bool filter_headers{true};
        bool clang_format{false};
        bool trim{true};
        bool restore_includes{false};
    };

    /*
     * One source file plus the compiler, auxiliary files and probe state needed to submit it to a
     * remote_service. Every submit replaces the stored response; the accessors below read from it and
     * fail with failure_kind::usage when the data they need has not been produced yet.
     *
     * The unit does not own the service; it must outlive the unit.
     */
    class compilation_unit {
      public:
        compilation_unit(
                remote_service& service,
                std::string source,
                std::string compiler,
                std::string language = "c",
                std::string compiler_args = {});

        compilation_unit& set_source(std::string source);
        outcome<void> load_source(const std::filesystem::path& path);

        compilation_unit& add_file(std::string filename, std::string contents);
        // `filename` defaults to the basename of `path`
        outcome<void> add_file_from_path(
                const std::filesystem::path& path, std::optional<std::string> filename = std::nullopt);
        compilation_unit& add_library(std::string id, std::string version);
        compilation_unit& clear_files();
        compilation_unit& clear_libraries();
        compilation_unit& set_compiler_args(std::string args);

        compilation_unit& inject_macro_probe(std::string_view macro_name);
        compilation_unit& clear_macro_probes();
        outcome<probe_value_t> macro_value(std::string_view macro_name) const;

        outcome<void> preprocess(const preprocess_options& opts = {});
        outcome<void> compile(const compile_request_options& opts = {});
        outcome<void> execute(std::vector<std::string> program_args = {}, std::string stdin_text = {});

        const std::optional<remote_response>& response() const { return last_response_; }

        outcome<std::string> preprocessed() const;
        outcome<std::string> assembly() const;
        outcome<std::string> program_stdout() const;
        outcome<std::string> program_stderr() const;
        outcome<int> exit_code() const;
        outcome<std::int64_t> exec_time() const;

        bool compilation_succeeded() const;
        bool execution_succeeded() const;

        std::vector<std::string> compiler_messages() const;
        std::string compiler_stderr() const;
        bool has_errors() const;
        bool has_warnings() const;
        size_t error_count() const;
        size_t warning_count() const;

        const std::string& source() const { return source_; }
        const std::string& compiler() const { return compiler_; }
        const std::string& language() const { return language_; }
        const std::string& compiler_args() const { return compiler_args_; }
        const std::vector<source_file>& files() const { return files_; }
        const probe_set& probes() const { return probes_; }

      private:
        remote_service& service_;
        std::string source_;
        std::string compiler_;
        std::string language_;
        std::string compiler_args_;
        std::vector<source_file> files_{};
        std::vector<library_ref> libraries_{};
        probe_set probes_{};
        std::optional<remote_response> last_response_{};

        remote_request make_request(std::string source, request_options options) const;
        outcome<void> submit(const remote_request& request);
        outcome<const remote_response*> require_response(std::string_view call_first) const;
    };

}  // namespace ccprobe
