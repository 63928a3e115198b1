#ifndef SUBROUTINE_COMPILER_HPP
#define SUBROUTINE_COMPILER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ast.hpp"
#include "compiler_error.hpp"
#include "symbol_table.hpp"
#include "vm.hpp"

class class_compiler_t;

// Where a variable lives at run time.
struct var_location_t
{
    vm_segment_t segment;
    unsigned index;
    type_name_t type;
};

// Translates one constructor, function or method.
// Owns the argument and local table; reads the class's table and takes
// labels from the class compiler.
class subroutine_compiler_t
{
public:
    subroutine_compiler_t(class_compiler_t& cls, subroutine_dec_t const& dec);

    std::vector<std::string> compile();

    subroutine_symbol_table_t const& symbols() const { return m_symbols; }

    // Probes fields, then locals, then arguments, then statics.
    // A local with the same name as a field is therefore unreachable.
    std::optional<var_location_t> search_var(pstring_t name) const;

private:
    std::string_view view(pstring_t pstring) const;

    [[gnu::noreturn]] void compiler_error(pstring_t at, std::string const& what, error_kind_t kind) const;

    var_location_t resolve_var(pstring_t name) const;
    void declare(var_kind_t kind, pstring_t name, type_name_t type);

    void emit(std::string line) { m_lines.push_back(std::move(line)); }

    void compile_header();
    void compile_statements(stmts_t const& stmts);

    void compile(let_stmt_t const& let);
    void compile(if_stmt_t const& if_);
    void compile(while_stmt_t const& while_);
    void compile(do_stmt_t const& do_);
    void compile(return_stmt_t const& return_);

    void compile_expr(expr_t const& expr);
    void compile_term(term_t const& term);
    void compile_op(binary_op_t op);

    void compile(int_const_t const& i);
    void compile(string_const_t const& str);
    void compile(keyword_const_t k);
    void compile(var_ref_t const& var);
    void compile(array_ref_t const& array);
    void compile(paren_t const& paren);
    void compile(unary_t const& unary);
    void compile(subroutine_call_t const& call);

    void compile_call(call_t const& call);
    void compile_call(class_call_t const& call);
    void compile_args(std::vector<expr_t> const& args);

    class_compiler_t& m_class;
    subroutine_dec_t const& m_dec;
    subroutine_symbol_table_t m_symbols;
    std::vector<std::string> m_lines;
};

#endif
