#include "utils.hpp"

namespace ccprobe::test { namespace detail {
    inline constexpr auto grouped_suite = R"(
compilers:
  - api_name: cg152
    display_name: GCC 15.2
    nickname: gcc
    extra_flags: [-O1]
  - api_name: cc65_trunk
    display_name: cc65 trunk
    nickname: cc65
    local_asm: true
    assembler: ca65
    local_linker_args: [-static]
  - api_name: tcc0928
    nickname: tcc
    local_compile: true
    local_compiler: clang
    local_compiler_args: [-w]

tests:
  - group: char_signedness
    file_name: tests/char_sign.c
    detect_macro: CHAR_SIGNED
    prepend_lines: ["#include <limits.h>"]
    include_dirs: [inc]
    variants:
      - variant: auto
        auto: true
      - variant: signed
        display_name: Signed
        detect_value: 1
        prepend_lines: ["#define EXPECT_SIGNED 1", "#include <limits.h>"]
      - variant: unsigned
        detect_value: 0
        file_name: tests/char_unsigned.c
        include_directories: [more_inc]
  - test_name: hello
    file_name: tests/hello.c
)";
}}  // namespace ccprobe::test::detail

namespace ccprobe::test {
    using namespace std::string_view_literals;

    TEST_CASE("007: compilers parse with their local fallbacks", "[007][suite]") {
        auto parsed = parse_suite(detail::grouped_suite);
        REQUIRE(parsed);
        REQUIRE(parsed->compilers.size() == 3U);

        const auto& gcc = parsed->compilers[0];
        CHECK(gcc.api_name == "cg152");
        CHECK(gcc.display_name == "GCC 15.2");
        CHECK(gcc.nickname == "gcc");
        CHECK(gcc.extra_flags == std::vector<std::string>{"-O1"});
        CHECK(gcc.mode() == exec_mode::remote_execute);

        const auto& cc65 = parsed->compilers[1];
        CHECK(cc65.mode() == exec_mode::local_assemble);
        REQUIRE(cc65.assemble_params());
        CHECK(cc65.assemble_params()->assembler == "ca65");
        CHECK(cc65.assemble_params()->linker == "gcc");
        CHECK(cc65.assemble_params()->linker_args == std::vector<std::string>{"-static"});

        const auto& tcc = parsed->compilers[2];
        CHECK(tcc.display_name == "tcc0928");
        CHECK(tcc.mode() == exec_mode::local_compile);
        REQUIRE(tcc.compile_params());
        CHECK(tcc.compile_params()->compiler == "clang");
        CHECK(tcc.compile_params()->compiler_args == std::vector<std::string>{"-w"});
    }

    TEST_CASE("007: variants inherit group defaults", "[007][suite]") {
        auto parsed = parse_suite(detail::grouped_suite);
        REQUIRE(parsed);
        REQUIRE(parsed->tests.size() == 4U);

        const auto& autov = parsed->tests[0];
        CHECK(autov.group == "char_signedness");
        CHECK(autov.variant == "auto");
        CHECK(autov.test_name == "char_signedness_auto");
        CHECK(autov.is_auto);
        CHECK_FALSE(autov.include_in_table);
        CHECK(autov.detect_macro == "CHAR_SIGNED");
        CHECK(autov.file_name == "tests/char_sign.c");

        const auto& signedv = parsed->tests[1];
        CHECK_FALSE(signedv.is_auto);
        CHECK(signedv.include_in_table);
        CHECK(signedv.display_name == "Signed");
        CHECK(signedv.detect_value == 1);
        // group lines first, duplicates dropped
        CHECK(signedv.prepend_lines == std::vector<std::string>{"#include <limits.h>", "#define EXPECT_SIGNED 1"});
        CHECK(signedv.include_dirs == std::vector<std::filesystem::path>{"inc"});

        const auto& unsignedv = parsed->tests[2];
        CHECK(unsignedv.display_name == "unsigned");
        CHECK(unsignedv.detect_value == 0);
        CHECK(unsignedv.file_name == "tests/char_unsigned.c");
        CHECK(unsignedv.include_dirs == std::vector<std::filesystem::path>{"inc", "more_inc"});

        const auto& flat = parsed->tests[3];
        CHECK(flat.group == "default");
        CHECK(flat.test_name == "hello");
        CHECK(flat.variant == "hello");
        CHECK_FALSE(flat.is_auto);
        CHECK_FALSE(flat.detect_macro);
    }

    TEST_CASE("007: group lists are copied as written before variant items", "[007][suite]") {
        auto parsed = parse_suite(R"(
tests:
  - group: g
    prepend_lines: ["#define A 1", "#define A 1", "#define B 2"]
    variants:
      - variant: v
        prepend_lines: ["#define B 2", "#define C 3", "#define C 3"]
  - test_name: flat
    prepend_lines: ["#define X 1", "#define X 1"]
)");
        REQUIRE(parsed);
        REQUIRE(parsed->tests.size() == 2U);
        CHECK(parsed->tests[0].prepend_lines ==
              std::vector<std::string>{"#define A 1", "#define A 1", "#define B 2", "#define C 3"});
        CHECK(parsed->tests[1].prepend_lines == std::vector<std::string>{"#define X 1", "#define X 1"});
    }

    TEST_CASE("007: invalid suites are configuration failures", "[007][suite]") {
        auto two_autos = parse_suite(R"(
tests:
  - group: g
    variants:
      - {variant: a, auto: true}
      - {variant: b, auto: true}
)");
        REQUIRE_FALSE(two_autos);
        CHECK(two_autos.error().kind == failure_kind::config);
        CHECK(two_autos.error().message.find("more than one auto variant") != std::string::npos);

        auto both_modes = parse_suite(R"(
compilers:
  - {api_name: x, local_asm: true, local_compile: true}
)");
        REQUIRE_FALSE(both_modes);
        CHECK(both_modes.error().kind == failure_kind::config);

        auto no_api = parse_suite("compilers:\n  - {display_name: nameless}\n");
        REQUIRE_FALSE(no_api);
        CHECK(no_api.error().message.find("api_name") != std::string::npos);

        auto malformed = parse_suite("tests: [ {group: g\n");
        REQUIRE_FALSE(malformed);
        CHECK(malformed.error().kind == failure_kind::config);

        auto missing = load_suite("/nonexistent/ccprobe/suite.yaml");
        REQUIRE_FALSE(missing);
        CHECK(missing.error().kind == failure_kind::config);

        auto empty = parse_suite("");
        REQUIRE(empty);
        CHECK(empty->compilers.empty());
        CHECK(empty->tests.empty());
    }

    TEST_CASE("007: filters and run selection", "[007][suite]") {
        auto parsed = parse_suite(detail::grouped_suite);
        REQUIRE(parsed);

        run_options opts{};
        opts.compiler_filter = {"tcc", "gcc"};
        auto by_compiler = apply_filters(*parsed, opts);
        REQUIRE(by_compiler);
        REQUIRE(by_compiler->compilers.size() == 2U);
        CHECK(by_compiler->compilers[0].api_name == "cg152");
        CHECK(by_compiler->compilers[1].api_name == "tcc0928");

        opts = run_options{};
        opts.test_filter = {"signed", "hello"};
        auto by_test = apply_filters(*parsed, opts);
        REQUIRE(by_test);
        CHECK(by_test->tests.size() == 2U);

        opts = run_options{};
        opts.group_filter = {"default"};
        auto by_group = apply_filters(*parsed, opts);
        REQUIRE(by_group);
        REQUIRE(by_group->tests.size() == 1U);
        CHECK(by_group->tests[0].test_name == "hello");

        opts = run_options{};
        opts.compiler_filter = {"msvc"};
        auto none = apply_filters(*parsed, opts);
        REQUIRE_FALSE(none);
        CHECK(none.error().kind == failure_kind::usage);
        CHECK(none.error().message == "No compilers matching: msvc");

        auto autos_only = select_runnable(parsed->tests, false, false);
        REQUIRE(autos_only.size() == 2U);
        CHECK(autos_only[0].variant == "auto");
        CHECK(autos_only[1].test_name == "hello");

        CHECK(select_runnable(parsed->tests, true, false).size() == 4U);
        CHECK(select_runnable(parsed->tests, false, true).size() == 4U);
    }

    TEST_CASE("007: auxiliary files resolve through include dirs", "[007][suite]") {
        detail::temp_dir tmp{"ccprobe_007_files"};
        detail::write_file(tmp.path / "inc" / "config.h", "#define CONFIG 1\n");
        detail::write_file(tmp.path / "inc" / "alpha.h", "#define ALPHA 1\n");
        detail::write_file(tmp.path / "extra" / "data.h", "#define DATA 1\n");

        test_variant test{
                .test_name = "t",
                .file_name = "main.c",
                .additional_files =
                        {aux_file_ref{"extra/data.h", "extra/data.h"},
                         aux_file_ref{"sub/config.h", "sub/config.h"},
                         aux_file_ref{"gone.h", "gone.h"}},
                .include_dirs = {"inc", "missing_dir"}};
        std::vector<test_variant> tests{test};
        resolve_file_paths(tests, tmp.path);
        CHECK(tests[0].file_name == tmp.path / "main.c");
        CHECK(tests[0].include_dirs[0] == tmp.path / "inc");

        auto loaded = load_test_files(tests[0]);
        std::vector<std::string> names{};
        for (const auto& f : loaded.files) {
            names.push_back(f.filename);
        }
        CHECK(names == std::vector<std::string>{"extra/data.h", "sub/config.h", "alpha.h", "config.h"});
        CHECK(loaded.files[1].contents == "#define CONFIG 1\n");
        REQUIRE(loaded.warnings.size() == 2U);
        CHECK(loaded.warnings[0].find("gone.h") != std::string::npos);
        CHECK(loaded.warnings[1].find("missing_dir") != std::string::npos);
    }
}  // namespace ccprobe::test
