#include "utils.hpp"

namespace ccprobe::test {
    using namespace std::string_view_literals;

    TEST_CASE("003: header paths encode into identifier-safe names", "[003][instrument]") {
        CHECK(encode_header_path("stdio.h"sv) == "stdio__PERIODh");
        CHECK(encode_header_path("sys/types.h"sv) == "sys__SLASHtypes__PERIODh");
        CHECK(encode_header_path("win\\conio.h"sv) == "win__BACKSLASHconio__PERIODh");
        CHECK(encode_header_path("limits"sv) == "limits");
    }

    TEST_CASE("003: include probes bracket every include directive", "[003][instrument]") {
        probe_set probes{};
        auto instrumented = inject_include_probes("#include <stdio.h>\n  # include \"local.h\"\nint x;"sv, probes);

        REQUIRE(probes.includes.size() == 2U);
        CHECK(probes.includes[0].start_marker == "__godbolt_start_probe1_system_stdio__PERIODh");
        CHECK(probes.includes[0].end_marker == "__godbolt_end_probe1_system_stdio__PERIODh");
        CHECK(probes.includes[0].original_include == "#include <stdio.h>");
        CHECK(probes.includes[1].start_marker == "__godbolt_start_probe2_local_local__PERIODh");
        CHECK(probes.includes[1].original_include == "# include \"local.h\"");

        CHECK(instrumented ==
              "void __godbolt_start_probe1_system_stdio__PERIODh(void);\n"
              "#include <stdio.h>\n"
              "void __godbolt_end_probe1_system_stdio__PERIODh(void);\n"
              "  void __godbolt_start_probe2_local_local__PERIODh(void);\n"
              "  # include \"local.h\"\n"
              "  void __godbolt_end_probe2_local_local__PERIODh(void);\n"
              "int x;");

        inject_include_probes("int main(void) { return 0; }"sv, probes);
        CHECK(probes.includes.empty());
    }

    TEST_CASE("003: restore collapses expanded headers back to the directive", "[003][instrument]") {
        probe_set probes{};
        inject_include_probes("#include <stdio.h>\nint main(void) { return 0; }"sv, probes);

        // what a preprocessor produces: the start marker, the header body, the end marker
        auto expanded =
                "void __godbolt_start_probe1_system_stdio__PERIODh(void);\n"
                "typedef struct _IO_FILE FILE;\n"
                "extern int printf(const char *, ...);\n"
                "void __godbolt_end_probe1_system_stdio__PERIODh (void) ;\n"
                "int main(void) { return 0; }"sv;

        CHECK(restore_includes(expanded, probes) == "#include <stdio.h>\nint main(void) { return 0; }");
    }

    TEST_CASE("003: include round trip with several directives", "[003][instrument]") {
        auto src =
                "#include <sys/types.h>\n"
                "typedef int word;\n"
                "  #  include \"a/b.c.h\"\n"
                "static word w;\n"
                "#include <stdio.h>\n"
                "int main(void) { return 0; }"sv;

        probe_set probes{};
        auto instrumented = inject_include_probes(src, probes);
        REQUIRE(probes.includes.size() == 3U);
        CHECK(restore_includes(instrumented, probes) == src);

        // each header expanded between its own markers, the way a preprocessor emits them
        auto expanded =
                "void __godbolt_start_probe1_system_sys__SLASHtypes__PERIODh(void);\n"
                "typedef unsigned long size_t;\n"
                "void __godbolt_end_probe1_system_sys__SLASHtypes__PERIODh(void);\n"
                "typedef int word;\n"
                "  void __godbolt_start_probe2_local_a__SLASHb__PERIODc__PERIODh ( void ) ;\n"
                "extern int b_value;\n"
                "  void __godbolt_end_probe2_local_a__SLASHb__PERIODc__PERIODh();\n"
                "static word w;\n"
                "void __godbolt_start_probe3_system_stdio__PERIODh(void);\n"
                "extern int printf(const char *, ...);\n"
                "void __godbolt_end_probe3_system_stdio__PERIODh(void);\n"
                "int main(void) { return 0; }"sv;
        CHECK(restore_includes(expanded, probes) ==
              "#include <sys/types.h>\n"
              "typedef int word;\n"
              "  #  include \"a/b.c.h\"\n"
              "static word w;\n"
              "#include <stdio.h>\n"
              "int main(void) { return 0; }");
    }

    TEST_CASE("003: a header included twice restores at both positions", "[003][instrument]") {
        auto src = "#include \"cfg.h\"\nint a;\n#include \"cfg.h\"\nint b;"sv;

        probe_set probes{};
        auto instrumented = inject_include_probes(src, probes);
        REQUIRE(probes.includes.size() == 2U);
        CHECK(probes.includes[0].start_marker != probes.includes[1].start_marker);
        CHECK(restore_includes(instrumented, probes) == src);

        // the include guard leaves the second expansion empty
        auto expanded =
                "void __godbolt_start_probe1_local_cfg__PERIODh(void);\n"
                "enum { CFG = 1 };\n"
                "void __godbolt_end_probe1_local_cfg__PERIODh(void);\n"
                "int a;\n"
                "void __godbolt_start_probe2_local_cfg__PERIODh(void);\n"
                "void __godbolt_end_probe2_local_cfg__PERIODh(void);\n"
                "int b;"sv;
        CHECK(restore_includes(expanded, probes) == src);
    }

    TEST_CASE("003: restore drops a dangling start marker", "[003][instrument]") {
        probe_set probes{};
        inject_include_probes("#include \"missing.h\"\nint y;"sv, probes);

        auto text = "void __godbolt_start_probe1_local_missing__PERIODh();\nint y;"sv;
        CHECK(restore_includes(text, probes) == "\nint y;");
    }

    TEST_CASE("003: restore without probes is identity", "[003][instrument]") {
        probe_set probes{};
        CHECK(restore_includes("int a;\nint b;"sv, probes) == "int a;\nint b;");
    }

    TEST_CASE("003: macro probe injection is idempotent", "[003][instrument]") {
        probe_set probes{};
        auto once = inject_macro_probe("int main(void) { return 0; }\n\n", "CHAR_BIT"sv, probes);
        CHECK(once == "int main(void) { return 0; }\nint __GODBOLT_MACRO_PROBE_CHAR_BIT__ = (int)(CHAR_BIT);\n");

        auto twice = inject_macro_probe(once, "CHAR_BIT"sv, probes);
        CHECK(twice == once);
        CHECK(probes.macros == std::vector<std::string>{"CHAR_BIT"});

        probes.clear_macros();
        CHECK(probes.macros.empty());
        CHECK(probes.macro_values.empty());
    }

    TEST_CASE("003: probe literals are extracted from expanded text", "[003][instrument]") {
        auto marker = macro_probe_marker("M"sv);
        CHECK(marker == "__GODBOLT_MACRO_PROBE_M__");

        CHECK(extract_probe(std::format("int {} = (int)(42);", marker), "M"sv) == 42);
        CHECK(extract_probe(std::format("int {} = (int)(0x2A);", marker), "M"sv) == 42);
        CHECK(extract_probe(std::format("int {} = (int)(-1);", marker), "M"sv) == -1);
        CHECK(extract_probe(std::format("int {} = 7;", marker), "M"sv) == 7);
        CHECK(extract_probe(std::format("int {} = ( 0 );", marker), "M"sv) == 0);
        CHECK(extract_probe(std::format("int {} = (int)(-9223372036854775808);", marker), "M"sv) ==
              std::numeric_limits<probe_value_t>::min());

        CHECK_FALSE(extract_probe("int x = 3;"sv, "M"sv));
        CHECK_FALSE(extract_probe(std::format("int {} = (int)(sizeof(long));", marker), "M"sv));
        CHECK_FALSE(extract_probe(std::format("int {} = (int)(012);", marker), "M"sv));
        CHECK_FALSE(extract_probe(std::format("int {} = (int)(99999999999999999999);", marker), "M"sv));
    }

    TEST_CASE("003: probe values cache per preprocess cycle", "[003][instrument]") {
        probe_set probes{};
        inject_macro_probe("", "A"sv, probes);
        inject_macro_probe("", "B"sv, probes);

        extract_macro_probes(detail::expanded_probe("A"sv, 8), probes);
        REQUIRE(probe_value(probes, "A"sv));
        CHECK(*probe_value(probes, "A"sv) == 8);

        auto missing = probe_value(probes, "B"sv);
        REQUIRE_FALSE(missing);
        CHECK(missing.error().kind == failure_kind::usage);

        extract_macro_probes("nothing here"sv, probes);
        CHECK_FALSE(probe_value(probes, "A"sv));
    }

    TEST_CASE("003: probe lines are stripped from output", "[003][instrument]") {
        probe_set probes{};
        inject_macro_probe("", "EOF"sv, probes);

        auto text = std::format("int main(void) {{ return 0; }}\n{}\nint tail;", detail::expanded_probe("EOF"sv, -1));
        CHECK(strip_probe_lines(text, probes) == "int main(void) { return 0; }\nint tail;");

        probe_set empty{};
        CHECK(strip_probe_lines(text, empty) == text);
    }
}  // namespace ccprobe::test
