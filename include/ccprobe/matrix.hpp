#pragma once

#include "config.hpp"
#include "instrument.hpp"
#include "remote.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ccprobe {

    // Furthest stage a job reached; `success` is the only passing terminal stage outside
    // preprocess-only runs.
    enum class job_stage : uint8_t { preprocessing, compilation, runtime, success };

    inline constexpr std::string_view to_string(job_stage stage) {
        switch (stage) {
            case job_stage::preprocessing:
                return "preprocessing"sv;
            case job_stage::compilation:
                return "compilation"sv;
            case job_stage::runtime:
                return "runtime"sv;
            case job_stage::success:
                return "success"sv;
        }
        return "preprocessing"sv;
    }

    inline constexpr bool try_parse_job_stage(std::string_view text, job_stage& out) {
        for (auto stage : {job_stage::preprocessing, job_stage::compilation, job_stage::runtime, job_stage::success}) {
            if (text == to_string(stage)) {
                out = stage;
                return true;
            }
        }
        return false;
    }

    struct compiler_identity {
        std::optional<std::string> nickname{};
        std::string display_name{};
        std::string api_name{};

        bool operator==(const compiler_identity&) const = default;
    };

    struct stage_log {
        std::string preprocess{};
        std::string compile{};
        std::string run{};

        bool operator==(const stage_log&) const = default;
    };

    struct test_result {
        std::string test_name{};
        std::string group{};
        std::string variant{};
        std::string variant_display{};
        bool is_auto{false};
        std::optional<probe_value_t> detect_value{};
        compiler_identity compiler{};
        job_stage stage{job_stage::preprocessing};
        bool passed{false};
        bool has_warnings{false};
        bool has_errors{false};
        bool api_error{false};
        std::optional<probe_value_t> impl_value{};
        // artifact key ("preprocessed", "compile_err", "result", ...) -> path
        std::map<std::string, std::string> files{};
        stage_log stderr_log{};

        bool operator==(const test_result&) const = default;
    };

    // Copy of `source` standing in for `variant`: identity fields replaced, is_auto cleared.
    test_result reuse_result(const test_result& source, const test_variant& variant);

    outcome<std::string> encode_result(const test_result& result);
    outcome<std::string> encode_summary(const std::vector<test_result>& results);

    struct matrix_summary {
        std::vector<test_result> results{};
        size_t passed{};
        size_t effective_total{};
        size_t executed_jobs{};
        size_t reused_results{};

        bool all_passed() const { return passed == effective_total; }
    };

    /*
     * Runs the (test x compiler) matrix sequentially, test-major, pausing `delay_ms` after every
     * remote call. Artifacts for each executed pair go under
     * `{results_dir}/{test_name}_{compiler display with ' ' and '/' replaced by '_'}`.
     *
     * Reuse: a non-auto variant declaring detect_value k takes a copy of the result of its group's
     * auto variant on the same compiler when that run extracted exactly k.
     */
    class matrix_runner {
      public:
        matrix_runner(const run_options& opts, remote_service& service, std::ostream& out, std::ostream& err);

        test_result run_test(const test_variant& test, const compiler_target& compiler);
        test_result run_preprocess_only(const test_variant& test, const compiler_target& compiler);

        matrix_summary run(const std::vector<test_variant>& tests, const std::vector<compiler_target>& compilers);

      private:
        const run_options& opts_;
        remote_service& service_;
        std::ostream& out_;
        std::ostream& err_;

        struct job;

        void pace() const;
        void save_text(const std::filesystem::path& path, std::string_view text) const;
        test_result finish(job& j) const;
    };

    std::string safe_compiler_name(std::string_view display_name);

    // Whole run: load, filter, execute, summarize, optional table. Returns the process exit code.
    int run_suite(const run_options& opts, remote_service& service, std::ostream& out, std::ostream& err);

}  // namespace ccprobe
