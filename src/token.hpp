#ifndef TOKEN_HPP
#define TOKEN_HPP

#include <cstdint>
#include <string>

#include "lex_tables.hpp"
#include "pstring.hpp"

enum token_kind_t : char
{
    KIND_KEYWORD,
    KIND_SYMBOL,
    KIND_INTEGER,
    KIND_STRING,
    KIND_IDENTIFIER,
    KIND_END,
};

std::string_view to_string(token_kind_t kind);

struct token_t
{
    lex::token_type_t type = {};
    pstring_t pstring = {};
    std::uint32_t line = 0;
    std::uint32_t value = 0; // Integer constants only.

    // The lexeme; string constants keep their quotes.
    std::string_view view(char const* source) const { return pstring.view(source); }

    // Used for debugging and logging.
    std::string to_string(char const* source) const;
};

// lexer_gen emits the keywords and symbols as contiguous runs.
constexpr bool is_keyword(lex::token_type_t type)
    { return type >= lex::TOK_class && type <= lex::TOK_return; }

constexpr bool is_symbol(lex::token_type_t type)
    { return type >= lex::TOK_lbrace && type <= lex::TOK_tilde; }

constexpr bool is_binary_op(lex::token_type_t type)
    { return type >= lex::TOK_plus && type <= lex::TOK_eq; }

constexpr bool is_unary_op(lex::token_type_t type)
    { return type == lex::TOK_minus || type == lex::TOK_tilde; }

constexpr bool is_type_prefix(lex::token_type_t type)
    { return type == lex::TOK_int || type == lex::TOK_char || type == lex::TOK_boolean || type == lex::TOK_ident; }

constexpr bool is_keyword_constant(lex::token_type_t type)
    { return type >= lex::TOK_true && type <= lex::TOK_this; }

constexpr token_kind_t token_kind(lex::token_type_t type)
{
    if(is_keyword(type))
        return KIND_KEYWORD;
    if(is_symbol(type))
        return KIND_SYMBOL;
    switch(type)
    {
    case lex::TOK_integer: return KIND_INTEGER;
    case lex::TOK_string:  return KIND_STRING;
    case lex::TOK_ident:   return KIND_IDENTIFIER;
    default:               return KIND_END;
    }
}

#endif
