#ifndef AST_HPP
#define AST_HPP

// The tree built by the parser for one class.
// Identifiers are pstrings into the source buffer, so the file_contents_t
// the class was parsed from must outlive the tree.

#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include <boost/container/small_vector.hpp>

#include "pstring.hpp"

namespace bc = boost::container;

struct expr_t;
struct term_t;
struct stmt_t;

enum type_class_t : char
{
    TYPE_VOID,
    TYPE_INT,
    TYPE_CHAR,
    TYPE_BOOLEAN,
    TYPE_CLASS,
};

struct type_name_t
{
    type_class_t cls;
    pstring_t pstring; // For TYPE_CLASS, the class name.
};

/////////////////
// Expressions //
/////////////////

enum keyword_const_t : char
{
    KEYWORD_TRUE,
    KEYWORD_FALSE,
    KEYWORD_NULL,
    KEYWORD_THIS,
};

// Numbered like the operator tokens, from TOK_plus to TOK_eq.
enum binary_op_t : char
{
    OP_ADD, // '+'
    OP_SUB, // '-'
    OP_MUL, // '*'
    OP_DIV, // '/'
    OP_AND, // '&'
    OP_OR,  // '|'
    OP_LT,  // '<'
    OP_GT,  // '>'
    OP_EQ,  // '='
};

enum unary_op_t : char
{
    UNARY_NEG, // '-'
    UNARY_NOT, // '~'
};

struct int_const_t { std::uint16_t value; };
struct string_const_t { pstring_t pstring; }; // Excludes the quotes.
struct var_ref_t { pstring_t name; };
struct array_ref_t { pstring_t name; std::unique_ptr<expr_t> index; };
struct paren_t { std::unique_ptr<expr_t> expr; };
struct unary_t { unary_op_t op; std::unique_ptr<term_t> term; };

// 'name(args)', called on the current object.
struct call_t
{
    pstring_t name;
    std::vector<expr_t> args;
};

// 'target.name(args)', where 'target' is either a variable or a class.
struct class_call_t
{
    pstring_t target;
    pstring_t name;
    std::vector<expr_t> args;
};

using subroutine_call_t = std::variant<call_t, class_call_t>;

struct term_t
{
    pstring_t pstring;
    std::variant<int_const_t, string_const_t, keyword_const_t, var_ref_t,
                 array_ref_t, paren_t, unary_t, subroutine_call_t> value;
};

struct binary_t
{
    binary_op_t op;
    pstring_t pstring;
    term_t term;
};

// Without 'chain_operators', 'tail' holds at most one element.
struct expr_t
{
    term_t head;
    bc::small_vector<binary_t, 1> tail;
};

////////////////
// Statements //
////////////////

using stmts_t = std::vector<stmt_t>;

struct let_stmt_t
{
    pstring_t name;
    std::optional<expr_t> index;
    expr_t value;
};

struct if_stmt_t
{
    expr_t condition;
    stmts_t then_branch;
    std::optional<stmts_t> else_branch;
};

struct while_stmt_t
{
    expr_t condition;
    stmts_t body;
};

struct do_stmt_t { subroutine_call_t call; };
struct return_stmt_t { std::optional<expr_t> value; };

struct stmt_t
{
    pstring_t pstring;
    std::variant<let_stmt_t, if_stmt_t, while_stmt_t, do_stmt_t, return_stmt_t> value;
};

//////////////////
// Declarations //
//////////////////

enum class_var_kind_t : char
{
    CLASS_VAR_STATIC,
    CLASS_VAR_FIELD,
};

enum subroutine_kind_t : char
{
    SUB_CONSTRUCTOR,
    SUB_FUNCTION,
    SUB_METHOD,
};

struct class_var_dec_t
{
    class_var_kind_t kind;
    type_name_t type;
    std::vector<pstring_t> names;
};

struct var_dec_t
{
    type_name_t type;
    std::vector<pstring_t> names;
};

struct param_t
{
    type_name_t type;
    pstring_t name;
};

struct subroutine_body_t
{
    std::vector<var_dec_t> var_decs;
    stmts_t statements;
};

struct subroutine_dec_t
{
    subroutine_kind_t kind;
    type_name_t return_type;
    pstring_t name;
    std::vector<param_t> params;
    subroutine_body_t body;
};

struct class_t
{
    pstring_t name;
    std::vector<class_var_dec_t> class_var_decs;
    std::vector<subroutine_dec_t> subroutine_decs;
};

#endif
