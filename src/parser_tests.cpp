#include <catch2/catch.hpp>
#include "parser.hpp"

#include <optional>
#include <variant>

#include "compiler_error.hpp"
#include "guard.hpp"
#include "lexer.hpp"
#include "options.hpp"

namespace
{

struct parsed_t
{
    file_contents_t file;
    class_t cls;

    std::string_view view(pstring_t pstring) const { return pstring.view(file.source()); }
};

parsed_t parse_source(std::string_view source)
{
    parsed_t parsed = { file_contents_t("Test.jack", source), {} };
    parsed.cls = parse(parsed.file, tokenize(parsed.file));
    return parsed;
}

std::optional<error_kind_t> parse_error(std::string_view source)
{
    try
    {
        parse_source(source);
    }
    catch(compiler_error_t const& e)
    {
        return e.kind;
    }
    return std::nullopt;
}

} // end anon namespace

TEST_CASE("parse declarations", "[parser]")
{
    parsed_t const p = parse_source(
        "class Point {\n"
        "    field int x, y;\n"
        "    static Point origin;\n"
        "    constructor Point new(int ax, int ay) { return this; }\n"
        "    method void move(int dx) { var int a, b; var boolean c; return; }\n"
        "    function char name() { return 0; }\n"
        "}\n");

    class_t const& cls = p.cls;
    REQUIRE(p.view(cls.name) == "Point");

    REQUIRE(cls.class_var_decs.size() == 2);
    REQUIRE(cls.class_var_decs[0].kind == CLASS_VAR_FIELD);
    REQUIRE(cls.class_var_decs[0].type.cls == TYPE_INT);
    REQUIRE(cls.class_var_decs[0].names.size() == 2);
    REQUIRE(p.view(cls.class_var_decs[0].names[1]) == "y");
    REQUIRE(cls.class_var_decs[1].kind == CLASS_VAR_STATIC);
    REQUIRE(cls.class_var_decs[1].type.cls == TYPE_CLASS);
    REQUIRE(p.view(cls.class_var_decs[1].type.pstring) == "Point");

    REQUIRE(cls.subroutine_decs.size() == 3);

    subroutine_dec_t const& ctor = cls.subroutine_decs[0];
    REQUIRE(ctor.kind == SUB_CONSTRUCTOR);
    REQUIRE(p.view(ctor.name) == "new");
    REQUIRE(ctor.params.size() == 2);
    REQUIRE(p.view(ctor.params[1].name) == "ay");

    subroutine_dec_t const& move = cls.subroutine_decs[1];
    REQUIRE(move.kind == SUB_METHOD);
    REQUIRE(move.return_type.cls == TYPE_VOID);
    REQUIRE(move.body.var_decs.size() == 2);
    REQUIRE(move.body.var_decs[0].names.size() == 2);
    REQUIRE(move.body.var_decs[1].type.cls == TYPE_BOOLEAN);
    REQUIRE(move.body.statements.size() == 1);

    subroutine_dec_t const& name = cls.subroutine_decs[2];
    REQUIRE(name.kind == SUB_FUNCTION);
    REQUIRE(name.return_type.cls == TYPE_CHAR);
    REQUIRE(name.params.empty());
}

TEST_CASE("parse statements", "[parser]")
{
    parsed_t const p = parse_source(
        "class Main {\n"
        "    function void main() {\n"
        "        let a[i] = b;\n"
        "        if(a) { do f(); } else { do Foo.g(1, 2); }\n"
        "        while(x) { }\n"
        "        return;\n"
        "    }\n"
        "}\n");

    stmts_t const& stmts = p.cls.subroutine_decs.at(0).body.statements;
    REQUIRE(stmts.size() == 4);

    let_stmt_t const& let = std::get<let_stmt_t>(stmts[0].value);
    REQUIRE(p.view(let.name) == "a");
    REQUIRE(let.index);
    REQUIRE(std::holds_alternative<var_ref_t>(let.value.head.value));
    REQUIRE(p.view(stmts[0].pstring) == "let a[i] = b;");

    if_stmt_t const& if_ = std::get<if_stmt_t>(stmts[1].value);
    REQUIRE(if_.then_branch.size() == 1);
    REQUIRE(if_.else_branch);
    do_stmt_t const& do_ = std::get<do_stmt_t>(if_.else_branch->at(0).value);
    class_call_t const& call = std::get<class_call_t>(do_.call);
    REQUIRE(p.view(call.target) == "Foo");
    REQUIRE(p.view(call.name) == "g");
    REQUIRE(call.args.size() == 2);

    REQUIRE(std::get<while_stmt_t>(stmts[2].value).body.empty());
    REQUIRE(!std::get<return_stmt_t>(stmts[3].value).value);
}

TEST_CASE("parse terms", "[parser]")
{
    parsed_t const p = parse_source(
        "class Main { function int f() { return -(a[1] + g(\"s\", true)); } }");

    return_stmt_t const& ret = std::get<return_stmt_t>(p.cls.subroutine_decs.at(0).body.statements.at(0).value);
    REQUIRE(ret.value);
    REQUIRE(ret.value->tail.empty());

    unary_t const& neg = std::get<unary_t>(ret.value->head.value);
    REQUIRE(neg.op == UNARY_NEG);

    paren_t const& paren = std::get<paren_t>(neg.term->value);
    expr_t const& inner = *paren.expr;
    REQUIRE(std::holds_alternative<array_ref_t>(inner.head.value));
    REQUIRE(inner.tail.size() == 1);
    REQUIRE(inner.tail[0].op == OP_ADD);

    call_t const& call = std::get<call_t>(std::get<subroutine_call_t>(inner.tail[0].term.value));
    REQUIRE(call.args.size() == 2);
    REQUIRE(p.view(std::get<string_const_t>(call.args[0].head.value).pstring) == "s");
    REQUIRE(std::get<keyword_const_t>(call.args[1].head.value) == KEYWORD_TRUE);
}

TEST_CASE("one operator per expression unless chained", "[parser]")
{
    char const* const source = "class Main { function int f() { return 1 + 2 * 3; } }";

    REQUIRE(parse_error(source) == ERR_SYNTAX);

    options_t const saved = _options;
    auto restore = make_scope_guard([&]{ _options = saved; });
    _options.chain_operators = true;

    parsed_t const p = parse_source(source);
    return_stmt_t const& ret = std::get<return_stmt_t>(p.cls.subroutine_decs.at(0).body.statements.at(0).value);
    REQUIRE(ret.value->tail.size() == 2);
    REQUIRE(ret.value->tail[0].op == OP_ADD);
    REQUIRE(ret.value->tail[1].op == OP_MUL);
}

TEST_CASE("syntax errors", "[parser]")
{
    REQUIRE(parse_error("class Main { }") == std::nullopt);
    REQUIRE(parse_error("") == ERR_SYNTAX);
    REQUIRE(parse_error("Main { }") == ERR_SYNTAX);
    REQUIRE(parse_error("class Main {") == ERR_SYNTAX);
    REQUIRE(parse_error("class Main { function void f() { let x = 1 } }") == ERR_SYNTAX);
    REQUIRE(parse_error("class Main { function void f() { let = 1; } }") == ERR_SYNTAX);
    REQUIRE(parse_error("class Main { function void f() { return ); } }") == ERR_SYNTAX);
    REQUIRE(parse_error("class Main { function void f() { var int x; let x = 1; var int y; } }") == ERR_SYNTAX);
    REQUIRE(parse_error("class Main { function void f() { } field int x; }") == ERR_SYNTAX);
    REQUIRE(parse_error("class Main { function f() { } }") == ERR_SYNTAX);
    REQUIRE(parse_error("class Main { function void f(int) { } }") == ERR_SYNTAX);
    REQUIRE(parse_error("class Main { function void f(int a,) { } }") == ERR_SYNTAX);
    REQUIRE(parse_error("class Main { function void f() { do x; } }") == ERR_SYNTAX);
}

TEST_CASE("syntax error names what was expected", "[parser]")
{
    try
    {
        parse_source("class Main {\n    function void f() { let x = 1 }\n}");
        FAIL("expected an error");
    }
    catch(compiler_error_t const& e)
    {
        std::string const what = e.what();
        INFO(what);
        REQUIRE(e.kind == ERR_SYNTAX);
        REQUIRE(what.find("Test.jack:2:35") != std::string::npos);
        REQUIRE(what.find("Expecting ;.") != std::string::npos);
    }
}

TEST_CASE("trailing tokens after the class", "[parser]")
{
    char const* const source = "class A { } class B { }";

    parsed_t const p = parse_source(source);
    REQUIRE(p.view(p.cls.name) == "A");

    options_t const saved = _options;
    auto restore = make_scope_guard([&]{ _options = saved; });
    _options.werror = true;

    try
    {
        parse_source(source);
        FAIL("expected an error");
    }
    catch(compiler_error_t const& e)
    {
        REQUIRE(e.warning);
    }
}
