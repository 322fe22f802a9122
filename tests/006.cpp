#include "utils.hpp"

namespace ccprobe::test { namespace detail {
    // Stand-in toolchain driver: writes a shell program to the path following `-o` and logs its argv.
    inline constexpr auto fake_tool_script = R"(#!/bin/sh
log="$(dirname "$0")/calls.log"
echo "$(basename "$0") $*" >> "$log"
out=""
while [ $# -gt 0 ]; do
    if [ "$1" = "-o" ]; then out="$2"; fi
    shift
done
printf '#!/bin/sh\necho "local says hi"\necho "to stderr" >&2\nexit 0\n' > "$out"
chmod +x "$out"
)";

    inline constexpr auto failing_tool_script = R"(#!/bin/sh
echo "fatal: cannot assemble" >&2
exit 1
)";
}}  // namespace ccprobe::test::detail

namespace ccprobe::test {
    using namespace std::string_view_literals;

    TEST_CASE("006: absolute symbol immediates require -no-pie", "[006][dispatch]") {
        CHECK(needs_no_pie("\tmovl $.LC0, %edi\n"sv));
        CHECK(needs_no_pie("  pushl $msg\n"sv));
        CHECK(needs_no_pie("  movq   $_start, %rax"sv));
        CHECK(needs_no_pie("  push $.str"sv));

        CHECK_FALSE(needs_no_pie("  movl $1, %eax\n  leaq .LC0(%rip), %rdi\n"sv));
        CHECK_FALSE(needs_no_pie("  cmovl $sym, %eax"sv));
        CHECK_FALSE(needs_no_pie("  movl$sym, %eax"sv));
        CHECK_FALSE(needs_no_pie(""sv));
    }

    TEST_CASE("006: remote flags for local assembly with clang", "[006][dispatch]") {
        compiler_target clang_asm{
                .api_name = "Clang2110", .extra_flags = {"-O1"}, .fallback = local_assemble_params{}};
        CHECK(remote_flags(clang_asm) == std::vector<std::string>{"-O1", "-fno-integrated-as"});

        compiler_target already{
                .api_name = "clang_trunk",
                .extra_flags = {"-fno-integrated-as"},
                .fallback = local_assemble_params{}};
        CHECK(remote_flags(already) == std::vector<std::string>{"-fno-integrated-as"});

        compiler_target gcc_asm{.api_name = "cg152", .extra_flags = {"-O1"}, .fallback = local_assemble_params{}};
        CHECK(remote_flags(gcc_asm) == std::vector<std::string>{"-O1"});

        compiler_target clang_remote{.api_name = "clang2110", .extra_flags = {"-std=c89"}};
        CHECK(remote_flags(clang_remote) == std::vector<std::string>{"-std=c89"});
    }

    TEST_CASE("006: remote execution results and build failures", "[006][dispatch]") {
        detail::fake_remote_service service{};
        compilation_unit unit{service, "int main(void) { return 0; }", "cg152"};
        compiler_target target{.api_name = "cg152"};

        service.replies.push_back(detail::exec_response("out", 2, {"err"}));
        auto ran = dispatch(unit, target, dispatch_limits{});
        REQUIRE(ran);
        CHECK(ran->run.stdout_text == "out");
        CHECK(ran->run.stderr_text == "err");
        CHECK(ran->run.exit_code == 2);
        CHECK_FALSE(ran->assembly);

        service.replies.push_back(detail::build_failure({"<source>:1:1: error: unknown type name 'in'"}));
        auto broken = dispatch(unit, target, dispatch_limits{});
        REQUIRE_FALSE(broken);
        CHECK(broken.error().kind == failure_kind::compiler);
        CHECK(broken.error().message == "<source>:1:1: error: unknown type name 'in'");

        service.replies.push_back(fail(failure_kind::transport, "Network error: connection refused"));
        auto offline = dispatch(unit, target, dispatch_limits{});
        REQUIRE_FALSE(offline);
        CHECK(offline.error().kind == failure_kind::transport);
    }

    TEST_CASE("006: local assembly pipeline assembles links and runs", "[006][dispatch][local]") {
        detail::temp_dir tmp{"ccprobe_006_asm"};
        auto tool = tmp.path / "tool.sh";
        detail::write_script(tool, detail::fake_tool_script);

        detail::fake_remote_service service{};
        compilation_unit unit{service, "int main(void) { return 0; }", "cc65"};

        remote_response compiled{};
        compiled.code = 0;
        compiled.asm_lines = std::vector<std::string>{"main:", "\tmovl $.LC0, %edi", "\tret"};
        service.replies.push_back(compiled);

        local_assemble_params params{
                .assembler = "/bin/sh",
                .assembler_args = {tool.string()},
                .linker = "/bin/sh",
                .linker_args = {tool.string()}};
        compiler_target target{.api_name = "cc65", .fallback = params};

        auto ran = dispatch(unit, target, dispatch_limits{.tool_timeout_ms = 5'000, .run_timeout_ms = 5'000});
        REQUIRE(ran);
        CHECK(ran->run.stdout_text == "local says hi\n");
        CHECK(ran->run.stderr_text == "to stderr\n");
        CHECK(ran->run.exit_code == 0);
        REQUIRE(ran->assembly);
        CHECK(*ran->assembly == "main:\n\tmovl $.LC0, %edi\n\tret");

        const auto& opts = std::get<compile_request_options>(service.requests.front().options);
        CHECK_FALSE(opts.filter_directives);
        CHECK_FALSE(opts.filter_labels);

        auto calls = detail::read_file(tmp.path / "calls.log");
        auto lines = utils::split_lines(calls);
        REQUIRE(lines.size() >= 2U);
        CHECK(lines[0].find("-no-pie") == std::string_view::npos);
        CHECK(lines[1].find("-no-pie") != std::string_view::npos);
    }

    TEST_CASE("006: local assembly failures carry the tool stderr", "[006][dispatch][local]") {
        detail::temp_dir tmp{"ccprobe_006_asm_fail"};
        auto tool = tmp.path / "bad.sh";
        detail::write_script(tool, detail::failing_tool_script);

        detail::fake_remote_service service{};
        compilation_unit unit{service, "int main(void) { return 0; }", "cc65"};
        remote_response compiled{};
        compiled.code = 0;
        compiled.asm_lines = std::vector<std::string>{"main:", "\tret"};
        service.replies.push_back(compiled);

        compiler_target target{
                .api_name = "cc65",
                .fallback = local_assemble_params{.assembler = "/bin/sh", .assembler_args = {tool.string()}}};
        auto ran = dispatch(unit, target, dispatch_limits{.tool_timeout_ms = 5'000});
        REQUIRE_FALSE(ran);
        CHECK(ran.error().kind == failure_kind::toolchain);
        CHECK(ran.error().message.starts_with("Assembly failed:\n"));
        CHECK(ran.error().message.find("fatal: cannot assemble") != std::string::npos);

        service.replies.push_back(compiled);
        compiler_target missing{
                .api_name = "cc65",
                .fallback = local_assemble_params{.assembler = "ccprobe-no-such-assembler"}};
        auto absent = dispatch(unit, missing, dispatch_limits{.tool_timeout_ms = 5'000});
        REQUIRE_FALSE(absent);
        CHECK(absent.error().kind == failure_kind::toolchain);
        CHECK(absent.error().message.starts_with("Tool not found: "));
    }

    TEST_CASE("006: local compile builds from the preprocessed text", "[006][dispatch][local]") {
        detail::temp_dir tmp{"ccprobe_006_cc"};
        auto tool = tmp.path / "cc.sh";
        detail::write_script(tool, detail::fake_tool_script);

        detail::fake_remote_service service{};
        compilation_unit unit{service, "#include \"cfg.h\"\nint main(void) { return 0; }", "tcc"};
        unit.add_file("cfg.h", "#define CFG 1").add_file("../escape.h", "#define BAD 1");

        // no preprocessed text yet, so dispatch preprocesses with include restoration first
        service.responder = [](const remote_request& req) -> outcome<remote_response> {
            return detail::pp_response(req.source);
        };

        compiler_target target{
                .api_name = "tcc", .fallback = local_compile_params{.compiler = "/bin/sh", .compiler_args = {tool.string()}}};
        auto ran = dispatch(unit, target, dispatch_limits{.tool_timeout_ms = 5'000, .run_timeout_ms = 5'000});
        REQUIRE(ran);
        CHECK(ran->run.stdout_text == "local says hi\n");
        CHECK(ran->run.exit_code == 0);

        REQUIRE(service.requests.size() == 1U);
        CHECK(service.requests.front().kind() == request_kind::preprocess);
        CHECK(unit.preprocessed() == "#include \"cfg.h\"\nint main(void) { return 0; }");

        auto calls = detail::read_file(tmp.path / "calls.log");
        CHECK(calls.find("source.c") != std::string::npos);
    }

    TEST_CASE("006: program timeouts are reported", "[006][dispatch][local]") {
        detail::temp_dir tmp{"ccprobe_006_timeout"};
        auto tool = tmp.path / "cc.sh";
        detail::write_script(
                tool,
                "#!/bin/sh\nout=\"\"\nwhile [ $# -gt 0 ]; do if [ \"$1\" = \"-o\" ]; then out=\"$2\"; fi; shift; done\n"
                "printf '#!/bin/sh\\nsleep 5\\n' > \"$out\"\nchmod +x \"$out\"\n");

        detail::fake_remote_service service{};
        compilation_unit unit{service, "int main(void) { for (;;); }", "tcc"};
        service.replies.push_back(detail::pp_response("int main(void) { for (;;); }"));
        REQUIRE(unit.preprocess());

        compiler_target target{
                .api_name = "tcc", .fallback = local_compile_params{.compiler = "/bin/sh", .compiler_args = {tool.string()}}};
        auto ran = dispatch(unit, target, dispatch_limits{.tool_timeout_ms = 5'000, .run_timeout_ms = 200});
        REQUIRE_FALSE(ran);
        CHECK(ran.error().kind == failure_kind::timeout);
        CHECK(ran.error().message == "Program execution timed out");
        CHECK(service.requests.size() == 1U);
    }
}  // namespace ccprobe::test
