#include <catch2/catch.hpp>
#include "compile.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <utility>

#include "compiler_error.hpp"
#include "format.hpp"
#include "guard.hpp"
#include "options.hpp"
#include "vm.hpp"

namespace
{

using lines_t = std::vector<std::string>;

lines_t compile_main(std::string_view source)
{
    return compile_source("Main.jack", source);
}

std::optional<error_kind_t> compile_error(std::string_view source)
{
    try
    {
        compile_main(source);
    }
    catch(compiler_error_t const& e)
    {
        return e.kind;
    }
    return std::nullopt;
}

} // end anon namespace

TEST_CASE("hello world", "[compiler]")
{
    lines_t const expected =
    {
        "function Main.main 0",
        "push constant 1",
        "call Output.printInt 1",
        "pop temp 0",
        "push constant 0",
        "return",
    };
    REQUIRE(compile_main("class Main { function void main() { do Output.printInt(1); return; } }") == expected);
}

TEST_CASE("constructor and method prologues", "[compiler]")
{
    lines_t const expected =
    {
        "function Point.new 0",
        "push constant 2",
        "call Memory.alloc 1",
        "pop pointer 0",
        "push argument 0",
        "pop this 0",
        "push argument 1",
        "pop this 1",
        "push pointer 0",
        "return",
        "function Point.getY 0",
        "push argument 0",
        "pop pointer 0",
        "push this 1",
        "return",
        "function Point.dist 1",
        "push argument 0",
        "pop pointer 0",
        "push argument 1",
        "push this 0",
        "sub",
        "pop local 0",
        "push local 0",
        "return",
    };

    REQUIRE(compile_source("Point.jack",
        "class Point {\n"
        "    field int x, y;\n"
        "    static int count;\n"
        "    constructor Point new(int ax, int ay) { let x = ax; let y = ay; return this; }\n"
        "    method int getY() { return y; }\n"
        "    method int dist(int ox) { var int d; let d = ox - x; return d; }\n"
        "}\n") == expected);
}

TEST_CASE("statics and locals", "[compiler]")
{
    lines_t const expected =
    {
        "function Main.inc 2",
        "push static 1",
        "push constant 1",
        "add",
        "pop static 1",
        "push argument 0",
        "pop local 1",
        "push constant 0",
        "return",
    };
    REQUIRE(compile_main(
        "class Main {\n"
        "    static int a, count;\n"
        "    function void inc(int n) { var int i, j; let count = count + 1; let j = n; return; }\n"
        "}\n") == expected);
}

TEST_CASE("field hides a local", "[compiler]")
{
    char const* const source =
        "class Main {\n"
        "    field int x;\n"
        "    method void set() { var int x; let x = 5; return; }\n"
        "}\n";

    lines_t const expected =
    {
        "function Main.set 1",
        "push argument 0",
        "pop pointer 0",
        "push constant 5",
        "pop this 0",
        "push constant 0",
        "return",
    };
    REQUIRE(compile_main(source) == expected);

    options_t const saved = _options;
    auto restore = make_scope_guard([&]{ _options = saved; });
    _options.werror = true;

    try
    {
        compile_main(source);
        FAIL("expected an error");
    }
    catch(compiler_error_t const& e)
    {
        REQUIRE(e.warning);
        REQUIRE(std::string(e.what()).find("hidden by the field") != std::string::npos);
    }
}

TEST_CASE("if and while labels", "[compiler]")
{
    lines_t const expected =
    {
        "function Main.f 1",
        "push argument 0",
        "not",
        "if-goto Main_1",
        "push constant 1",
        "pop local 0",
        "goto Main_0",
        "label Main_1",
        "push constant 2",
        "pop local 0",
        "label Main_0",
        "push local 0",
        "return",
        "function Main.g 1",
        "label Main_2",
        "push local 0",
        "push constant 10",
        "lt",
        "not",
        "if-goto Main_3",
        "push local 0",
        "push constant 1",
        "add",
        "pop local 0",
        "goto Main_2",
        "label Main_3",
        "push local 0",
        "return",
    };
    REQUIRE(compile_main(
        "class Main {\n"
        "    function int f(boolean b) { var int r; if(b) { let r = 1; } else { let r = 2; } return r; }\n"
        "    function int g() { var int i; while(i < 10) { let i = i + 1; } return i; }\n"
        "}\n") == expected);
}

TEST_CASE("if without else", "[compiler]")
{
    lines_t const expected =
    {
        "function Main.f 0",
        "push constant 0",
        "not",
        "if-goto Main_1",
        "goto Main_0",
        "label Main_1",
        "label Main_0",
        "push constant 0",
        "return",
    };
    REQUIRE(compile_main("class Main { function void f() { if(false) { } return; } }") == expected);
}

TEST_CASE("arrays", "[compiler]")
{
    lines_t const expected =
    {
        "function Main.f 1",
        "push constant 2",
        "push local 0",
        "add",
        "push constant 1",
        "push local 0",
        "add",
        "pop pointer 1",
        "push that 0",
        "pop temp 0",
        "pop pointer 1",
        "push temp 0",
        "pop that 0",
        "push constant 0",
        "return",
    };
    REQUIRE(compile_main(
        "class Main { function void f() { var Array a; let a[2] = a[1]; return; } }") == expected);
}

TEST_CASE("constants", "[compiler]")
{
    lines_t const expected =
    {
        "function Main.f 0",
        "push constant 2",
        "call String.new 1",
        "push constant 72",
        "call String.appendChar 2",
        "push constant 105",
        "call String.appendChar 2",
        "push constant 1",
        "neg",
        "push constant 0",
        "push constant 0",
        "push constant 32767",
        "call Main.g 5",
        "pop temp 0",
        "push constant 0",
        "return",
    };
    REQUIRE(compile_main(
        "class Main { function void f() { do Main.g(\"Hi\", true, false, null, 32767); return; } }") == expected);
}

TEST_CASE("unary and binary operators", "[compiler]")
{
    lines_t const expected =
    {
        "function Main.f 0",
        "push argument 0",
        "neg",
        "push argument 1",
        "call Math.multiply 2",
        "push argument 0",
        "push argument 1",
        "call Math.divide 2",
        "not",
        "and",
        "return",
    };
    REQUIRE(compile_main(
        "class Main { function int f(int a, int b) { return (-a * b) & ~(a / b); } }") == expected);
}

TEST_CASE("every binary operator", "[compiler]")
{
    std::pair<char const*, char const*> const ops[] =
    {
        { "+", "add" },
        { "-", "sub" },
        { "*", "call Math.multiply 2" },
        { "/", "call Math.divide 2" },
        { "&", "and" },
        { "|", "or" },
        { "<", "lt" },
        { ">", "gt" },
        { "=", "eq" },
    };

    for(auto const& op : ops)
    {
        INFO("op = " << op.first);
        lines_t const lines = compile_main(
            fmt("class Main { function int f() { return 7 % 8; } }", op.first));
        REQUIRE(lines.size() == 5);
        REQUIRE(lines[1] == "push constant 7");
        REQUIRE(lines[2] == "push constant 8");
        REQUIRE(lines[3] == op.second);
    }
}

TEST_CASE("operators apply left to right when chained", "[compiler]")
{
    options_t const saved = _options;
    auto restore = make_scope_guard([&]{ _options = saved; });
    _options.chain_operators = true;

    lines_t const expected =
    {
        "function Main.f 0",
        "push constant 1",
        "push constant 2",
        "add",
        "push constant 3",
        "call Math.multiply 2",
        "return",
    };
    REQUIRE(compile_main("class Main { function int f() { return 1 + 2 * 3; } }") == expected);
}

TEST_CASE("subroutine calls", "[compiler]")
{
    lines_t const expected =
    {
        "function Main.run 1",
        "push argument 0",
        "pop pointer 0",
        "push pointer 0",
        "call Main.draw 1",
        "pop temp 0",
        "push local 0",
        "push constant 1",
        "push constant 2",
        "call Point.move 3",
        "pop temp 0",
        "push this 0",
        "call Screen.clear 1",
        "pop temp 0",
        "call Keyboard.keyPressed 0",
        "pop temp 0",
        "push constant 3",
        "push constant 4",
        "call Point.new 2",
        "pop local 0",
        "push constant 0",
        "return",
    };
    REQUIRE(compile_main(
        "class Main {\n"
        "    field Screen screen;\n"
        "    method void run() {\n"
        "        var Point p;\n"
        "        do draw();\n"
        "        do p.move(1, 2);\n"
        "        do screen.clear();\n"
        "        do Keyboard.keyPressed();\n"
        "        let p = Point.new(3, 4);\n"
        "        return;\n"
        "    }\n"
        "}\n") == expected);
}

TEST_CASE("semantic errors", "[compiler]")
{
    REQUIRE(compile_error("class Main { function void f() { let y = 1; return; } }") == ERR_UNRESOLVED);
    REQUIRE(compile_error("class Main { function int f() { return y; } }") == ERR_UNRESOLVED);
    REQUIRE(compile_error("class Main { function int f() { return y[0]; } }") == ERR_UNRESOLVED);
    REQUIRE(compile_error("class Main { function void f() { var int n; do n.foo(); return; } }") == ERR_MALFORMED);
    REQUIRE(compile_error("class Main { function void f(boolean b) { do b.foo(); return; } }") == ERR_MALFORMED);
    REQUIRE(compile_error("class Main { function void f() { var Foo x; do x.foo(); return; } }") == std::nullopt);
}

TEST_CASE("locals don't leak between subroutines", "[compiler]")
{
    REQUIRE(compile_error(
        "class Main {\n"
        "    function void f() { var int x; let x = 1; return; }\n"
        "    function void g() { let x = 2; return; }\n"
        "}\n") == ERR_UNRESOLVED);
}

TEST_CASE("redeclared local gets a new slot", "[compiler]")
{
    lines_t const expected =
    {
        "function Main.f 2",
        "push constant 1",
        "pop local 1",
        "push constant 0",
        "return",
    };
    REQUIRE(compile_main("class Main { function void f() { var int x; var char x; let x = 1; return; } }") == expected);
}

TEST_CASE("vm_text indentation", "[compiler]")
{
    lines_t const lines = { "function Main.f 0", "label Main_0", "push constant 0", "return" };

    REQUIRE(vm_text(lines, true) == "function Main.f 0\nlabel Main_0\n    push constant 0\n    return");
    REQUIRE(vm_text(lines, false) == "function Main.f 0\nlabel Main_0\npush constant 0\nreturn");
    REQUIRE(vm_text({}, true).empty());
}

TEST_CASE("output_path", "[compiler]")
{
    options_t const saved = _options;
    auto restore = make_scope_guard([&]{ _options = saved; });

    _options.output_dir.clear();
    REQUIRE(output_path(fs::path("src") / "Main.jack") == fs::path("src") / "Main.vm");

    _options.output_dir = "out";
    REQUIRE(output_path(fs::path("src") / "Main.jack") == fs::path("out") / "Main.vm");
}

TEST_CASE("compile_all isolates failures", "[compiler]")
{
    fs::path const dir = fs::temp_directory_path() / "jackc_compile_all_test";
    fs::remove_all(dir);
    fs::create_directories(dir);
    auto cleanup = make_scope_guard([&]{ std::error_code ec; fs::remove_all(dir, ec); });

    std::ofstream(dir / "Bad.jack") << "class Bad { function void f() { let y = 1; return; } }";
    std::ofstream(dir / "Good.jack") << "class Good { function void f() { return; } }";
    std::ofstream(dir / "notes.txt") << "not jack";

    options_t const saved = _options;
    auto restore = make_scope_guard([&]{ _options = saved; });
    _options.source_names = jack_files_in(dir);
    _options.num_threads = 2;

    REQUIRE(_options.source_names.size() == 2);
    REQUIRE(compile_all() == 1);

    REQUIRE(!fs::exists(dir / "Bad.vm"));
    REQUIRE(fs::exists(dir / "Good.vm"));

    std::ifstream in(dir / "Good.vm");
    std::stringstream ss;
    ss << in.rdbuf();
    REQUIRE(ss.str() == "function Good.f 0\n    push constant 0\n    return");
}

TEST_CASE("a + b + c needs chain_operators", "[compiler]")
{
    char const* const source =
        "class Main { function int f(int a, int b, int c) { return a + b + c; } }";

    REQUIRE(compile_error(source) == ERR_SYNTAX);

    options_t const saved = _options;
    auto restore = make_scope_guard([&]{ _options = saved; });
    _options.chain_operators = true;

    lines_t const expected =
    {
        "function Main.f 0",
        "push argument 0",
        "push argument 1",
        "add",
        "push argument 2",
        "add",
        "return",
    };
    REQUIRE(compile_main(source) == expected);
}
