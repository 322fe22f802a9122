#include "utils.hpp"

namespace ccprobe::test {
    using namespace std::string_view_literals;

    TEST_CASE("005: preprocess restores includes and reads the macro probe", "[005][project]") {
        detail::fake_remote_service service{};
        compilation_unit unit{service, "#include <stdio.h>\nint main(void) { return 0; }\n", "cg152", "c", "-O1"};
        unit.inject_macro_probe("EOF"sv);

        service.responder = [](const remote_request& req) -> outcome<remote_response> {
            // expand the header between its markers and the probe the way gcc -E would
            std::string expanded{};
            for (auto line : utils::split_lines(req.source)) {
                if (line == "#include <stdio.h>"sv) {
                    expanded += "typedef struct _IO_FILE FILE;\nextern int printf(const char *, ...);\n";
                }
                else if (line.find(macro_probe_marker("EOF"sv)) != std::string_view::npos) {
                    expanded += detail::expanded_probe("EOF"sv, -1) + "\n";
                }
                else {
                    expanded += std::string{line} + "\n";
                }
            }
            return detail::pp_response("\n\n" + expanded + "\n");
        };

        auto pp = unit.preprocess(preprocess_options{.restore_includes = true});
        REQUIRE(pp);

        REQUIRE(service.requests.size() == 1U);
        const auto& sent = service.requests.front();
        CHECK(sent.kind() == request_kind::preprocess);
        CHECK(sent.compiler == "cg152");
        CHECK(sent.user_arguments == "-O1");
        CHECK(sent.source.find("__godbolt_start_probe1_system_stdio__PERIODh") != std::string::npos);

        // the stored source keeps its original include line
        CHECK(unit.source().starts_with("#include <stdio.h>\n"));

        auto text = unit.preprocessed();
        REQUIRE(text);
        CHECK(*text == "#include <stdio.h>\nint main(void) { return 0; }");

        auto value = unit.macro_value("EOF"sv);
        REQUIRE(value);
        CHECK(*value == -1);
    }

    TEST_CASE("005: macro values do not outlive their preprocess cycle", "[005][project]") {
        detail::fake_remote_service service{};
        compilation_unit unit{service, "int main(void) { return 0; }", "cg152"};
        unit.inject_macro_probe("CHAR_BIT"sv);

        service.replies.push_back(detail::pp_response(detail::expanded_probe("CHAR_BIT"sv, 8)));
        REQUIRE(unit.preprocess());
        REQUIRE(unit.macro_value("CHAR_BIT"sv));
        CHECK(*unit.macro_value("CHAR_BIT"sv) == 8);

        // a response without ppOutput
        remote_response rejected{};
        rejected.code = 1;
        rejected.stderr_lines = {"<source>:1:1: error: unsupported option"};
        service.replies.push_back(rejected);
        REQUIRE(unit.preprocess());
        CHECK_FALSE(unit.macro_value("CHAR_BIT"sv));
    }

    TEST_CASE("005: accessors fail before the data exists", "[005][project]") {
        detail::fake_remote_service service{};
        compilation_unit unit{service, "int main(void) { return 0; }", "cg152"};

        auto pp = unit.preprocessed();
        REQUIRE_FALSE(pp);
        CHECK(pp.error().kind == failure_kind::usage);
        CHECK_FALSE(unit.assembly());
        CHECK_FALSE(unit.exit_code());
        CHECK_FALSE(unit.macro_value("CHAR_BIT"sv));
        CHECK_FALSE(unit.compilation_succeeded());
        CHECK_FALSE(unit.has_errors());
        CHECK(unit.compiler_messages().empty());

        service.replies.push_back(detail::exec_response("42"));
        REQUIRE(unit.execute());
        auto missing_pp = unit.preprocessed();
        REQUIRE_FALSE(missing_pp);
        CHECK(missing_pp.error().kind == failure_kind::usage);
    }

    TEST_CASE("005: execute exposes program output", "[005][project]") {
        detail::fake_remote_service service{};
        compilation_unit unit{service, "int main(void) { return 3; }", "cg152"};

        auto reply = detail::exec_response("done", 3, {"bye"});
        reply.exec_time_ms = 12;
        service.replies.push_back(std::move(reply));

        REQUIRE(unit.execute({"--flag"}, "stdin text"));
        const auto& opts = std::get<execute_request_options>(service.requests.front().options);
        CHECK(opts.args == std::vector<std::string>{"--flag"});
        CHECK(opts.stdin_text == "stdin text");

        CHECK(unit.program_stdout() == "done");
        CHECK(unit.program_stderr() == "bye");
        CHECK(unit.exit_code() == 3);
        CHECK(unit.exec_time() == 12);
        CHECK_FALSE(unit.execution_succeeded());
        CHECK_FALSE(unit.has_warnings());
    }

    TEST_CASE("005: compile output and file management", "[005][project]") {
        detail::fake_remote_service service{};
        compilation_unit unit{service, "int f(void) { return 1; }", "clang2110"};
        unit.add_file("a.h", "#define A 1").add_file("b.h", "#define B 2").add_library("fmt", "trunk");

        remote_response reply{};
        reply.code = 0;
        reply.asm_lines = std::vector<std::string>{"f:", "  movl $1, %eax", "  ret"};
        service.replies.push_back(reply);

        REQUIRE(unit.compile());
        CHECK(service.requests.back().files.size() == 2U);
        CHECK(service.requests.back().libraries.size() == 1U);
        CHECK(unit.assembly() == "f:\n  movl $1, %eax\n  ret");
        CHECK(unit.compilation_succeeded());

        unit.clear_files().clear_libraries().set_compiler_args("-O2");
        service.replies.push_back(reply);
        REQUIRE(unit.compile());
        CHECK(service.requests.back().files.empty());
        CHECK(service.requests.back().libraries.empty());
        CHECK(service.requests.back().user_arguments == "-O2");
    }

    TEST_CASE("005: transport failures propagate and keep the previous response", "[005][project]") {
        detail::fake_remote_service service{};
        compilation_unit unit{service, "int main(void) { return 0; }", "cg152"};

        service.replies.push_back(detail::pp_response("int main(void) { return 0; }"));
        REQUIRE(unit.preprocess());

        service.replies.push_back(fail_http(500, "HTTP 500: Internal Server Error"));
        auto failed = unit.compile();
        REQUIRE_FALSE(failed);
        CHECK(failed.error().kind == failure_kind::transport);
        CHECK(failed.error().status_code == 500);
        CHECK(unit.preprocessed() == "int main(void) { return 0; }");
    }

    TEST_CASE("005: diagnostics prefer build streams and count markers", "[005][diagnostics]") {
        auto failure = detail::build_failure({"<source>:3:5: error: expected ';'", "<source>:4:1: Error: bad"});
        failure.stderr_lines = {"program output"};

        auto streams = select_compiler_streams(failure);
        REQUIRE(streams.stderr_lines != nullptr);
        CHECK(streams.stderr_lines->size() == 2U);
        CHECK(streams.stdout_lines == nullptr);

        CHECK(has_errors(failure));
        CHECK(error_count(failure) == 2U);
        CHECK(warning_count(failure) == 0U);
        CHECK_FALSE(has_warnings(failure));
        CHECK(compiler_stderr(failure) == "<source>:3:5: error: expected ';'\n<source>:4:1: Error: bad");

        remote_response top{};
        top.code = 0;
        top.stdout_lines = {"<source>:1:1: Warning: implicit int"};
        CHECK_FALSE(has_errors(top));
        CHECK(has_warnings(top));
        CHECK(warning_count(top) == 1U);
        CHECK(compiler_stderr(top) == "<source>:1:1: Warning: implicit int");
        CHECK(compiler_messages(top) == std::vector<std::string>{"<source>:1:1: Warning: implicit int"});

        remote_response mention{};
        mention.stderr_lines = {"-Wno-warnings-as-errors ignored"};
        CHECK_FALSE(has_errors(mention));
    }
}  // namespace ccprobe::test
