#ifndef PARSER_HPP
#define PARSER_HPP

// Parser overview:
// - Recursive descent over a token vector, with two tokens of lookahead.
// - Builds the AST in 'ast.hpp' for exactly one class per file.
// - Throws on error, which GREATLY simplifies the logic.
//   - Recovering from parse errors takes a lot of work and complexity. KISS!

#include <vector>

#include "ast.hpp"
#include "file.hpp"
#include "pstring.hpp"
#include "token.hpp"

class parser_t
{
public:
    parser_t() = delete;
    parser_t(file_contents_t const& file, std::vector<token_t> const& tokens);

    // Parses the first class and warns if anything follows it.
    class_t parse();

private:
    char const* source() const { return file.source(); }

    token_t const& token() const { return tokens[pos]; }
    token_t const& peek(unsigned n = 1) const;

    // From 'start' up to the end of the last consumed token.
    pstring_t span_from(pstring_t start) const { return concat(start, tokens[pos - 1].pstring); }

    [[gnu::noreturn]] void compiler_error(std::string const& what) const;
    [[gnu::noreturn]] void unexpected(std::string_view expecting) const;

    void expect_token(lex::token_type_t expecting) const;
    pstring_t parse_token(lex::token_type_t expecting);
    pstring_t parse_token();
    pstring_t parse_ident();

    // Parses comma-separated values until 'r'. Does not consume 'r'.
    template<typename Func>
    void parse_list(lex::token_type_t r, Func parse_func);

    class_t parse_class();
    class_var_dec_t parse_class_var_dec();
    subroutine_dec_t parse_subroutine_dec();
    std::vector<param_t> parse_params();
    var_dec_t parse_var_dec();
    type_name_t parse_type();
    type_name_t parse_return_type();

    stmts_t parse_statements();
    stmt_t parse_statement();
    stmts_t parse_block();
    let_stmt_t parse_let();
    if_stmt_t parse_if();
    while_stmt_t parse_while();
    do_stmt_t parse_do();
    return_stmt_t parse_return();

    expr_t parse_expr();
    term_t parse_term();
    subroutine_call_t parse_subroutine_call();
    std::vector<expr_t> parse_args();

    file_contents_t const& file;
    std::vector<token_t> const& tokens;
    std::size_t pos = 0;
};

// Convenience wrapper: builds a parser and runs it.
class_t parse(file_contents_t const& file, std::vector<token_t> const& tokens);

#endif
