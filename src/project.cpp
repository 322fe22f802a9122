#include "ccprobe/project.hpp"

#include "ccprobe/diagnostics.hpp"
#include "ccprobe/format.hpp"
#include "ccprobe/utils.hpp"

#include "internal/files.hpp"

#include <utility>

using namespace ccprobe::literals;

namespace ccprobe {

    namespace detail {
        static std::string join_lines(const std::vector<std::string>& lines) {
            return utils::join_with_separator(lines, "\n"sv);
        }
    }  // namespace detail

    compilation_unit::compilation_unit(
            remote_service& service,
            std::string source,
            std::string compiler,
            std::string language,
            std::string compiler_args)
            : service_{service},
              source_{std::move(source)},
              compiler_{std::move(compiler)},
              language_{std::move(language)},
              compiler_args_{std::move(compiler_args)} {}

    compilation_unit& compilation_unit::set_source(std::string source) {
        source_ = std::move(source);
        return *this;
    }

    outcome<void> compilation_unit::load_source(const std::filesystem::path& path) {
        return internal::files::read_text(path).transform([this](std::string text) { source_ = std::move(text); });
    }

    compilation_unit& compilation_unit::add_file(std::string filename, std::string contents) {
        files_.push_back(source_file{std::move(filename), std::move(contents)});
        return *this;
    }

    outcome<void> compilation_unit::add_file_from_path(
            const std::filesystem::path& path, std::optional<std::string> filename) {
        auto name = filename ? std::move(*filename) : path.filename().string();
        return internal::files::read_text(path).transform(
                [this, &name](std::string text) { add_file(std::move(name), std::move(text)); });
    }

    compilation_unit& compilation_unit::add_library(std::string id, std::string version) {
        libraries_.push_back(library_ref{std::move(id), std::move(version)});
        return *this;
    }

    compilation_unit& compilation_unit::clear_files() {
        files_.clear();
        return *this;
    }

    compilation_unit& compilation_unit::clear_libraries() {
        libraries_.clear();
        return *this;
    }

    compilation_unit& compilation_unit::set_compiler_args(std::string args) {
        compiler_args_ = std::move(args);
        return *this;
    }

    compilation_unit& compilation_unit::inject_macro_probe(std::string_view macro_name) {
        source_ = ccprobe::inject_macro_probe(std::move(source_), macro_name, probes_);
        return *this;
    }

    compilation_unit& compilation_unit::clear_macro_probes() {
        probes_.clear_macros();
        return *this;
    }

    outcome<probe_value_t> compilation_unit::macro_value(std::string_view macro_name) const {
        return probe_value(probes_, macro_name);
    }

    remote_request compilation_unit::make_request(std::string source, request_options options) const {
        return remote_request{
                .compiler = compiler_,
                .language = language_,
                .source = std::move(source),
                .user_arguments = compiler_args_,
                .files = files_,
                .libraries = libraries_,
                .options = std::move(options),
        };
    }

    outcome<void> compilation_unit::submit(const remote_request& request) {
        return service_.submit(request).transform([this](remote_response response) {
            last_response_ = std::move(response);
        });
    }

    outcome<void> compilation_unit::preprocess(const preprocess_options& opts) {
        // the stored source is never replaced by its instrumented form
        auto payload = opts.restore_includes ? inject_include_probes(source_, probes_) : source_;

        auto submitted = submit(make_request(
                std::move(payload),
                preprocess_request_options{.filter_headers = opts.filter_headers, .clang_format = opts.clang_format}));
        if (!submitted) {
            return submitted;
        }

        // macro values live for one preprocess cycle
        probes_.macro_values.clear();

        auto& pp = last_response_->pp_output;
        if (!pp) {
            return {};
        }
        if (opts.restore_includes) {
            *pp = restore_includes(*pp, probes_);
        }
        if (!probes_.macros.empty()) {
            extract_macro_probes(*pp, probes_);
            *pp = strip_probe_lines(*pp, probes_);
        }
        if (opts.trim) {
            *pp = std::string{utils::trim_view(*pp)};
        }
        return {};
    }

    outcome<void> compilation_unit::compile(const compile_request_options& opts) {
        return submit(make_request(source_, opts));
    }

    outcome<void> compilation_unit::execute(std::vector<std::string> program_args, std::string stdin_text) {
        return submit(make_request(
                source_, execute_request_options{.args = std::move(program_args), .stdin_text = std::move(stdin_text)}));
    }

    outcome<const remote_response*> compilation_unit::require_response(std::string_view call_first) const {
        if (!last_response_) {
            return fail(failure_kind::usage, "No response available; call {}() first"_format(call_first));
        }
        return &*last_response_;
    }

    outcome<std::string> compilation_unit::preprocessed() const {
        return require_response("preprocess"sv).and_then([](const remote_response* r) -> outcome<std::string> {
            if (!r->pp_output) {
                return fail(failure_kind::usage, "No preprocessed output in last response");
            }
            return *r->pp_output;
        });
    }

    outcome<std::string> compilation_unit::assembly() const {
        return require_response("compile"sv).transform([](const remote_response* r) {
            return r->asm_lines ? detail::join_lines(*r->asm_lines) : std::string{};
        });
    }

    outcome<std::string> compilation_unit::program_stdout() const {
        return require_response("execute"sv).transform(
                [](const remote_response* r) { return detail::join_lines(r->stdout_lines); });
    }

    outcome<std::string> compilation_unit::program_stderr() const {
        return require_response("execute"sv).transform(
                [](const remote_response* r) { return detail::join_lines(r->stderr_lines); });
    }

    outcome<int> compilation_unit::exit_code() const {
        return require_response("execute"sv).and_then([](const remote_response* r) -> outcome<int> {
            if (!r->code) {
                return fail(failure_kind::usage, "No exit code present in last response");
            }
            return *r->code;
        });
    }

    outcome<std::int64_t> compilation_unit::exec_time() const {
        return require_response("execute"sv).and_then([](const remote_response* r) -> outcome<std::int64_t> {
            if (!r->exec_time_ms) {
                return fail(failure_kind::usage, "No execTime present in last response");
            }
            return *r->exec_time_ms;
        });
    }

    bool compilation_unit::compilation_succeeded() const {
        return last_response_ && last_response_->code.value_or(-1) == 0;
    }

    bool compilation_unit::execution_succeeded() const {
        return last_response_ && last_response_->did_execute.value_or(false) && last_response_->code.value_or(-1) == 0;
    }

    std::vector<std::string> compilation_unit::compiler_messages() const {
        return last_response_ ? ccprobe::compiler_messages(*last_response_) : std::vector<std::string>{};
    }

    std::string compilation_unit::compiler_stderr() const {
        return last_response_ ? ccprobe::compiler_stderr(*last_response_) : std::string{};
    }

    bool compilation_unit::has_errors() const {
        return last_response_ && ccprobe::has_errors(*last_response_);
    }

    bool compilation_unit::has_warnings() const {
        return last_response_ && ccprobe::has_warnings(*last_response_);
    }

    size_t compilation_unit::error_count() const {
        return last_response_ ? ccprobe::error_count(*last_response_) : 0U;
    }

    size_t compilation_unit::warning_count() const {
        return last_response_ ? ccprobe::warning_count(*last_response_) : 0U;
    }

}  // namespace ccprobe
