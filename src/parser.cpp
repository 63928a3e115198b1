#include "parser.hpp"

#include <algorithm>

#include "compiler_error.hpp"
#include "format.hpp"
#include "options.hpp"

using namespace lex;

namespace
{
    std::string describe(token_t const& token, char const* source)
    {
        switch(token_kind(token.type))
        {
        case KIND_KEYWORD:
        case KIND_SYMBOL:
        case KIND_END:
            return std::string(token_string(token.type));
        default:
            return fmt("% %", token_string(token.type), token.view(source));
        }
    }

    binary_op_t to_binary_op(token_type_t type)
    {
        passert(is_binary_op(type), token_name(type));
        return binary_op_t(type - TOK_plus);
    }
} // end anon namespace

class_t parse(file_contents_t const& file, std::vector<token_t> const& tokens)
{
    return parser_t(file, tokens).parse();
}

parser_t::parser_t(file_contents_t const& file, std::vector<token_t> const& tokens)
: file(file)
, tokens(tokens)
{
    passert(!tokens.empty() && tokens.back().type == TOK_eof, tokens.size());
}

token_t const& parser_t::peek(unsigned n) const
{
    // Peeking past the end keeps returning the eof token.
    return tokens[std::min<std::size_t>(pos + n, tokens.size() - 1)];
}

void parser_t::compiler_error(std::string const& what) const
{
    ::compiler_error(file, token().pstring, what, ERR_SYNTAX);
}

void parser_t::unexpected(std::string_view expecting) const
{
    compiler_error(fmt("Unexpected %. Expecting %.", describe(token(), source()), expecting));
}

void parser_t::expect_token(token_type_t expecting) const
{
    if(token().type != expecting)
        unexpected(token_string(expecting));
}

pstring_t parser_t::parse_token(token_type_t expecting)
{
    expect_token(expecting);
    return parse_token();
}

pstring_t parser_t::parse_token()
{
    pstring_t const pstring = token().pstring;
    if(token().type != TOK_eof)
        ++pos;
    return pstring;
}

pstring_t parser_t::parse_ident()
{
    return parse_token(TOK_ident);
}

template<typename Func>
void parser_t::parse_list(token_type_t r, Func parse_func)
{
    if(token().type == r)
        return;

    while(true)
    {
        parse_func();
        if(token().type != TOK_comma)
            break;
        parse_token();
    }
}

class_t parser_t::parse()
{
    class_t cls = parse_class();

    if(token().type != TOK_eof)
    {
        compiler_warning(file, token().pstring,
                         fmt("Ignoring everything after class %. Only one class per file is compiled.",
                             cls.name.view(source())),
                         ERR_SYNTAX);
    }

    return cls;
}

//////////////////
// Declarations //
//////////////////

class_t parser_t::parse_class()
{
    class_t cls = {};
    parse_token(TOK_class);
    cls.name = parse_ident();
    parse_token(TOK_lbrace);

    // All class variables come before all subroutines.
    while(token().type == TOK_static || token().type == TOK_field)
        cls.class_var_decs.push_back(parse_class_var_dec());

    while(token().type == TOK_constructor || token().type == TOK_function || token().type == TOK_method)
        cls.subroutine_decs.push_back(parse_subroutine_dec());

    parse_token(TOK_rbrace);
    return cls;
}

class_var_dec_t parser_t::parse_class_var_dec()
{
    class_var_dec_t dec = {};
    dec.kind = token().type == TOK_static ? CLASS_VAR_STATIC : CLASS_VAR_FIELD;
    parse_token();
    dec.type = parse_type();

    dec.names.push_back(parse_ident());
    while(token().type == TOK_comma)
    {
        parse_token();
        dec.names.push_back(parse_ident());
    }

    parse_token(TOK_semicolon);
    return dec;
}

subroutine_dec_t parser_t::parse_subroutine_dec()
{
    subroutine_dec_t dec = {};

    switch(token().type)
    {
    case TOK_constructor: dec.kind = SUB_CONSTRUCTOR; break;
    case TOK_function:    dec.kind = SUB_FUNCTION; break;
    case TOK_method:      dec.kind = SUB_METHOD; break;
    default: unexpected("constructor, function or method");
    }
    parse_token();

    dec.return_type = parse_return_type();
    dec.name = parse_ident();

    parse_token(TOK_lparen);
    dec.params = parse_params();
    parse_token(TOK_rparen);

    parse_token(TOK_lbrace);
    while(token().type == TOK_var)
        dec.body.var_decs.push_back(parse_var_dec());
    dec.body.statements = parse_statements();
    parse_token(TOK_rbrace);

    return dec;
}

std::vector<param_t> parser_t::parse_params()
{
    std::vector<param_t> params;
    parse_list(TOK_rparen, [&]
    {
        type_name_t const type = parse_type();
        params.push_back({ type, parse_ident() });
    });
    return params;
}

var_dec_t parser_t::parse_var_dec()
{
    var_dec_t dec = {};
    parse_token(TOK_var);
    dec.type = parse_type();

    dec.names.push_back(parse_ident());
    while(token().type == TOK_comma)
    {
        parse_token();
        dec.names.push_back(parse_ident());
    }

    parse_token(TOK_semicolon);
    return dec;
}

type_name_t parser_t::parse_type()
{
    token_t const& t = token();
    switch(t.type)
    {
    case TOK_int:     parse_token(); return { TYPE_INT, t.pstring };
    case TOK_char:    parse_token(); return { TYPE_CHAR, t.pstring };
    case TOK_boolean: parse_token(); return { TYPE_BOOLEAN, t.pstring };
    case TOK_ident:   parse_token(); return { TYPE_CLASS, t.pstring };
    default: unexpected("type");
    }
}

type_name_t parser_t::parse_return_type()
{
    if(token().type == TOK_void)
        return { TYPE_VOID, parse_token() };
    return parse_type();
}

////////////////
// Statements //
////////////////

stmts_t parser_t::parse_statements()
{
    stmts_t stmts;
    while(true)
    {
        switch(token().type)
        {
        case TOK_let:
        case TOK_if:
        case TOK_while:
        case TOK_do:
        case TOK_return:
            stmts.push_back(parse_statement());
            break;
        default:
            return stmts;
        }
    }
}

stmt_t parser_t::parse_statement()
{
    pstring_t const start = token().pstring;
    switch(token().type)
    {
    case TOK_let:
        {
            let_stmt_t let = parse_let();
            return { span_from(start), std::move(let) };
        }
    case TOK_if:
        {
            if_stmt_t if_ = parse_if();
            return { span_from(start), std::move(if_) };
        }
    case TOK_while:
        {
            while_stmt_t while_ = parse_while();
            return { span_from(start), std::move(while_) };
        }
    case TOK_do:
        {
            do_stmt_t do_ = parse_do();
            return { span_from(start), std::move(do_) };
        }
    case TOK_return:
        {
            return_stmt_t return_ = parse_return();
            return { span_from(start), std::move(return_) };
        }
    default:
        unexpected("statement");
    }
}

stmts_t parser_t::parse_block()
{
    parse_token(TOK_lbrace);
    stmts_t stmts = parse_statements();
    parse_token(TOK_rbrace);
    return stmts;
}

let_stmt_t parser_t::parse_let()
{
    let_stmt_t let = {};
    parse_token(TOK_let);
    let.name = parse_ident();

    if(token().type == TOK_lbracket)
    {
        parse_token();
        let.index = parse_expr();
        parse_token(TOK_rbracket);
    }

    parse_token(TOK_eq);
    let.value = parse_expr();
    parse_token(TOK_semicolon);
    return let;
}

if_stmt_t parser_t::parse_if()
{
    if_stmt_t if_ = {};
    parse_token(TOK_if);
    parse_token(TOK_lparen);
    if_.condition = parse_expr();
    parse_token(TOK_rparen);
    if_.then_branch = parse_block();

    if(token().type == TOK_else)
    {
        parse_token();
        if_.else_branch = parse_block();
    }

    return if_;
}

while_stmt_t parser_t::parse_while()
{
    while_stmt_t while_ = {};
    parse_token(TOK_while);
    parse_token(TOK_lparen);
    while_.condition = parse_expr();
    parse_token(TOK_rparen);
    while_.body = parse_block();
    return while_;
}

do_stmt_t parser_t::parse_do()
{
    parse_token(TOK_do);
    do_stmt_t do_ = { parse_subroutine_call() };
    parse_token(TOK_semicolon);
    return do_;
}

return_stmt_t parser_t::parse_return()
{
    return_stmt_t return_ = {};
    parse_token(TOK_return);
    if(token().type != TOK_semicolon)
        return_.value = parse_expr();
    parse_token(TOK_semicolon);
    return return_;
}

/////////////////
// Expressions //
/////////////////

expr_t parser_t::parse_expr()
{
    expr_t expr = { parse_term() };

    // Without chain_operators, only one operator is consumed. Whatever
    // follows is left for the enclosing construct, which then errors.
    while(is_binary_op(token().type))
    {
        token_t const& op = token();
        parse_token();
        expr.tail.push_back(binary_t{ to_binary_op(op.type), op.pstring, parse_term() });

        if(!compiler_options().chain_operators)
            break;
    }

    return expr;
}

term_t parser_t::parse_term()
{
    token_t const& t = token();
    switch(t.type)
    {
    case TOK_integer:
        parse_token();
        return { t.pstring, int_const_t{ std::uint16_t(t.value) } };

    case TOK_string:
        parse_token();
        return { t.pstring, string_const_t{ trim(t.pstring) } };

    case TOK_true:  parse_token(); return { t.pstring, KEYWORD_TRUE };
    case TOK_false: parse_token(); return { t.pstring, KEYWORD_FALSE };
    case TOK_null:  parse_token(); return { t.pstring, KEYWORD_NULL };
    case TOK_this:  parse_token(); return { t.pstring, KEYWORD_THIS };

    case TOK_minus:
    case TOK_tilde:
        {
            unary_op_t const op = t.type == TOK_minus ? UNARY_NEG : UNARY_NOT;
            parse_token();
            auto term = std::make_unique<term_t>(parse_term());
            return { span_from(t.pstring), unary_t{ op, std::move(term) } };
        }

    case TOK_lparen:
        {
            parse_token();
            auto expr = std::make_unique<expr_t>(parse_expr());
            parse_token(TOK_rparen);
            return { span_from(t.pstring), paren_t{ std::move(expr) } };
        }

    case TOK_ident:
        switch(peek().type)
        {
        case TOK_lbracket:
            {
                pstring_t const name = parse_ident();
                parse_token();
                auto index = std::make_unique<expr_t>(parse_expr());
                parse_token(TOK_rbracket);
                return { span_from(t.pstring), array_ref_t{ name, std::move(index) } };
            }
        case TOK_lparen:
        case TOK_period:
            {
                subroutine_call_t call = parse_subroutine_call();
                return { span_from(t.pstring), std::move(call) };
            }
        default:
            parse_token();
            return { t.pstring, var_ref_t{ t.pstring } };
        }

    default:
        unexpected("expression");
    }
}

subroutine_call_t parser_t::parse_subroutine_call()
{
    pstring_t const first = parse_ident();

    if(token().type == TOK_period)
    {
        parse_token();
        pstring_t const name = parse_ident();
        return class_call_t{ first, name, parse_args() };
    }

    return call_t{ first, parse_args() };
}

std::vector<expr_t> parser_t::parse_args()
{
    std::vector<expr_t> args;
    parse_token(TOK_lparen);
    parse_list(TOK_rparen, [&]{ args.push_back(parse_expr()); });
    parse_token(TOK_rparen);
    return args;
}
