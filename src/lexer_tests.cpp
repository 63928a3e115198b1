#include <catch2/catch.hpp>
#include "lexer.hpp"

#include <optional>
#include <vector>

#include "compiler_error.hpp"

using namespace lex;

namespace
{

std::vector<token_type_t> types_of(std::vector<token_t> const& tokens)
{
    std::vector<token_type_t> types;
    for(token_t const& token : tokens)
        types.push_back(token.type);
    return types;
}

std::optional<error_kind_t> lex_error(std::string_view source)
{
    file_contents_t const file("Test.jack", source);
    try
    {
        tokenize(file);
    }
    catch(compiler_error_t const& e)
    {
        return e.kind;
    }
    return std::nullopt;
}

} // end anon namespace

TEST_CASE("tokenize class header", "[lexer]")
{
    file_contents_t const file("Test.jack", "class Foo { field int x; }");
    std::vector<token_t> const tokens = tokenize(file);

    std::vector<token_type_t> const expected =
    {
        TOK_class, TOK_ident, TOK_lbrace, TOK_field, TOK_int,
        TOK_ident, TOK_semicolon, TOK_rbrace, TOK_eof
    };
    REQUIRE(types_of(tokens) == expected);

    REQUIRE(tokens[1].view(file.source()) == "Foo");
    REQUIRE(tokens[5].view(file.source()) == "x");
    REQUIRE(token_kind(tokens[0].type) == KIND_KEYWORD);
    REQUIRE(token_kind(tokens[2].type) == KIND_SYMBOL);
    REQUIRE(token_kind(tokens[1].type) == KIND_IDENTIFIER);
    REQUIRE(token_kind(tokens.back().type) == KIND_END);
}

TEST_CASE("tokenize every symbol", "[lexer]")
{
    file_contents_t const file("Test.jack", "{}()[].,;+-*/&|<>=~");
    std::vector<token_t> const tokens = tokenize(file);

    REQUIRE(tokens.size() == 20);
    for(unsigned i = 0; i < 19; ++i)
    {
        INFO("i = " << i);
        REQUIRE(is_symbol(tokens[i].type));
        REQUIRE(tokens[i].pstring.size == 1);
        REQUIRE(tokens[i].pstring.offset == i);
    }
    REQUIRE(tokens[8].type == TOK_semicolon);
    REQUIRE(tokens[12].type == TOK_fslash);
}

TEST_CASE("keywords need a word boundary", "[lexer]")
{
    file_contents_t const file("Test.jack", "classy class _if if1 while");
    std::vector<token_t> const tokens = tokenize(file);

    std::vector<token_type_t> const expected = { TOK_ident, TOK_class, TOK_ident, TOK_ident, TOK_while, TOK_eof };
    REQUIRE(types_of(tokens) == expected);
}

TEST_CASE("comments are skipped and lines counted", "[lexer]")
{
    file_contents_t const file("Test.jack",
        "// line comment\n"
        "/** doc\n"
        "    comment */ let\n"
        "/* x */ x = 1 / 2; // trailing");
    std::vector<token_t> const tokens = tokenize(file);

    std::vector<token_type_t> const expected =
        { TOK_let, TOK_ident, TOK_eq, TOK_integer, TOK_fslash, TOK_integer, TOK_semicolon, TOK_eof };
    REQUIRE(types_of(tokens) == expected);

    REQUIRE(tokens[0].line == 3);
    REQUIRE(tokens[1].line == 4);
    REQUIRE(tokens[1].view(file.source()) == "x");
}

TEST_CASE("integer and string constants", "[lexer]")
{
    file_contents_t const file("Test.jack", "0 32767 65535 \"Hello, world\" \"\"");
    std::vector<token_t> const tokens = tokenize(file);

    REQUIRE(tokens.size() == 6);
    REQUIRE(tokens[0].value == 0);
    REQUIRE(tokens[1].value == 32767);
    REQUIRE(tokens[2].value == 65535);
    REQUIRE(tokens[3].type == TOK_string);
    REQUIRE(tokens[3].view(file.source()) == "\"Hello, world\"");
    REQUIRE(token_kind(tokens[3].type) == KIND_STRING);
    REQUIRE(tokens[4].type == TOK_string);
    REQUIRE(tokens[4].pstring.size == 2);
}

TEST_CASE("empty source is a lone eof", "[lexer]")
{
    file_contents_t const file("Test.jack", "");
    std::vector<token_t> const tokens = tokenize(file);

    REQUIRE(tokens.size() == 1);
    REQUIRE(tokens[0].type == TOK_eof);
    REQUIRE(tokens[0].pstring.offset == 0);
}

TEST_CASE("lexical errors", "[lexer]")
{
    REQUIRE(lex_error("let x = 65536;") == ERR_LEXICAL);
    REQUIRE(lex_error("let x = 99999999999;") == ERR_LEXICAL);
    REQUIRE(lex_error("let s = \"unterminated") == ERR_LEXICAL);
    REQUIRE(lex_error("let s = \"split\nline\";") == ERR_LEXICAL);
    REQUIRE(lex_error("/* never closed") == ERR_LEXICAL);
    REQUIRE(lex_error("let x = #;") == ERR_LEXICAL);
    REQUIRE(lex_error("let x = 1;") == std::nullopt);
}

TEST_CASE("lexical error message points at the source", "[lexer]")
{
    file_contents_t const file("Bad.jack", "class Bad {\n  let x = @;\n}");
    try
    {
        tokenize(file);
        FAIL("expected an error");
    }
    catch(compiler_error_t const& e)
    {
        std::string const what = e.what();
        INFO(what);
        REQUIRE(e.kind == ERR_LEXICAL);
        REQUIRE(!e.warning);
        REQUIRE(what.find("Bad.jack:2:11") != std::string::npos);
        REQUIRE(what.find("lexical error") != std::string::npos);
        REQUIRE(what.find("Unexpected character '@'.") != std::string::npos);
    }
}
