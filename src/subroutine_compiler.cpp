#include "subroutine_compiler.hpp"

#include <variant>

#include "class_compiler.hpp"
#include "debug_print.hpp"
#include "format.hpp"

subroutine_compiler_t::subroutine_compiler_t(class_compiler_t& cls, subroutine_dec_t const& dec)
: m_class(cls)
, m_dec(dec)
{}

std::string_view subroutine_compiler_t::view(pstring_t pstring) const
{
    return m_class.view(pstring);
}

void subroutine_compiler_t::compiler_error(pstring_t at, std::string const& what, error_kind_t kind) const
{
    ::compiler_error(m_class.file(), at, what, kind);
}

std::vector<std::string> subroutine_compiler_t::compile()
{
    dprint(trace_log(), "COMPILE", fmt("%.%", m_class.class_name(), view(m_dec.name)));

    compile_header();

    for(param_t const& param : m_dec.params)
        declare(VAR_ARGUMENT, param.name, param.type);

    for(var_dec_t const& dec : m_dec.body.var_decs)
        for(pstring_t name : dec.names)
            declare(VAR_LOCAL, name, dec.type);

    compile_statements(m_dec.body.statements);
    return std::move(m_lines);
}

void subroutine_compiler_t::compile_header()
{
    unsigned num_locals = 0;
    for(var_dec_t const& dec : m_dec.body.var_decs)
        num_locals += dec.names.size();

    emit(vm_function(m_class.class_name(), view(m_dec.name), num_locals));

    switch(m_dec.kind)
    {
    case SUB_CONSTRUCTOR:
        emit(vm_push(SEG_CONSTANT, m_class.symbols().num_fields()));
        emit(vm_call("Memory", "alloc", 1));
        emit(vm_pop(SEG_POINTER, 0));
        break;

    case SUB_METHOD:
        // The receiver is argument 0; user parameters start at 1.
        m_symbols.insert_argument("this", { TYPE_CLASS, m_class.ast().name });
        emit(vm_push(SEG_ARGUMENT, 0));
        emit(vm_pop(SEG_POINTER, 0));
        break;

    case SUB_FUNCTION:
        break;
    }
}

void subroutine_compiler_t::declare(var_kind_t kind, pstring_t name, type_name_t type)
{
    std::string_view const str = view(name);

    if(m_symbols.find(kind, str))
        compiler_warning(m_class.file(), name, fmt("Redeclaration of % '%'. Later references use this one.",
                                                   to_string(kind), str));

    if(m_class.symbols().get_field(str))
        compiler_warning(m_class.file(), name, fmt("% '%' is hidden by the field of the same name.",
                                                   to_string(kind), str));

    unsigned const index = kind == VAR_ARGUMENT
        ? m_symbols.insert_argument(str, type)
        : m_symbols.insert_var(str, type);

    dprint(trace_log(), "DECLARE", fmt("%.%", m_class.class_name(), view(m_dec.name)),
           to_string(kind), str, index);
}

std::optional<var_location_t> subroutine_compiler_t::search_var(pstring_t name) const
{
    struct probe_t
    {
        symbol_scope_t const* scope;
        var_kind_t kind;
        vm_segment_t segment;
    };

    probe_t const probes[] =
    {
        { &m_class.symbols(), VAR_FIELD,    SEG_THIS },
        { &m_symbols,         VAR_LOCAL,    SEG_LOCAL },
        { &m_symbols,         VAR_ARGUMENT, SEG_ARGUMENT },
        { &m_class.symbols(), VAR_STATIC,   SEG_STATIC },
    };

    std::string_view const str = view(name);

    for(probe_t const& probe : probes)
    {
        if(symbol_t const* symbol = probe.scope->find(probe.kind, str))
        {
            dprint(trace_log(), "RESOLVE", str, to_string(probe.segment), symbol->index);
            return var_location_t{ probe.segment, symbol->index, symbol->type };
        }
    }

    dprint(trace_log(), "RESOLVE", str, "<none>");
    return std::nullopt;
}

var_location_t subroutine_compiler_t::resolve_var(pstring_t name) const
{
    if(std::optional<var_location_t> var = search_var(name))
        return *var;
    compiler_error(name, fmt("Unknown variable '%'.", view(name)), ERR_UNRESOLVED);
}

////////////////
// Statements //
////////////////

void subroutine_compiler_t::compile_statements(stmts_t const& stmts)
{
    for(stmt_t const& stmt : stmts)
        std::visit([this](auto const& s){ this->compile(s); }, stmt.value);
}

void subroutine_compiler_t::compile(let_stmt_t const& let)
{
    var_location_t const var = resolve_var(let.name);

    if(let.index)
    {
        compile_expr(*let.index);
        emit(vm_push(var.segment, var.index));
        emit(vm_op(VM_ADD));

        // The value may rebind pointer 1 itself, so the address stays on
        // the stack until the value is computed.
        compile_expr(let.value);
        emit(vm_pop(SEG_TEMP, 0));
        emit(vm_pop(SEG_POINTER, 1));
        emit(vm_push(SEG_TEMP, 0));
        emit(vm_pop(SEG_THAT, 0));
    }
    else
    {
        compile_expr(let.value);
        emit(vm_pop(var.segment, var.index));
    }
}

void subroutine_compiler_t::compile(if_stmt_t const& if_)
{
    std::string const end_label = m_class.new_label();
    std::string const else_label = m_class.new_label();

    compile_expr(if_.condition);
    emit(vm_op(VM_NOT));
    emit(vm_if_goto(else_label));
    compile_statements(if_.then_branch);
    emit(vm_goto(end_label));
    emit(vm_label(else_label));
    if(if_.else_branch)
        compile_statements(*if_.else_branch);
    emit(vm_label(end_label));
}

void subroutine_compiler_t::compile(while_stmt_t const& while_)
{
    std::string const top_label = m_class.new_label();
    std::string const exit_label = m_class.new_label();

    emit(vm_label(top_label));
    compile_expr(while_.condition);
    emit(vm_op(VM_NOT));
    emit(vm_if_goto(exit_label));
    compile_statements(while_.body);
    emit(vm_goto(top_label));
    emit(vm_label(exit_label));
}

void subroutine_compiler_t::compile(do_stmt_t const& do_)
{
    compile(do_.call);
    emit(vm_pop(SEG_TEMP, 0));
}

void subroutine_compiler_t::compile(return_stmt_t const& return_)
{
    if(return_.value)
        compile_expr(*return_.value);
    else
        emit(vm_push(SEG_CONSTANT, 0));
    emit(vm_return());
}

/////////////////
// Expressions //
/////////////////

// No precedence: operators apply left to right, in the order written.
void subroutine_compiler_t::compile_expr(expr_t const& expr)
{
    compile_term(expr.head);
    for(binary_t const& binary : expr.tail)
    {
        compile_term(binary.term);
        compile_op(binary.op);
    }
}

void subroutine_compiler_t::compile_op(binary_op_t op)
{
    switch(op)
    {
    case OP_ADD: emit(vm_op(VM_ADD)); break;
    case OP_SUB: emit(vm_op(VM_SUB)); break;
    case OP_MUL: emit(vm_call("Math", "multiply", 2)); break;
    case OP_DIV: emit(vm_call("Math", "divide", 2)); break;
    case OP_AND: emit(vm_op(VM_AND)); break;
    case OP_OR:  emit(vm_op(VM_OR)); break;
    case OP_LT:  emit(vm_op(VM_LT)); break;
    case OP_GT:  emit(vm_op(VM_GT)); break;
    case OP_EQ:  emit(vm_op(VM_EQ)); break;
    }
}

void subroutine_compiler_t::compile_term(term_t const& term)
{
    std::visit([this](auto const& v){ this->compile(v); }, term.value);
}

void subroutine_compiler_t::compile(int_const_t const& i)
{
    emit(vm_push(SEG_CONSTANT, i.value));
}

void subroutine_compiler_t::compile(string_const_t const& str)
{
    std::string_view const chars = view(str.pstring);
    emit(vm_push(SEG_CONSTANT, chars.size()));
    emit(vm_call("String", "new", 1));
    for(unsigned char c : chars)
    {
        emit(vm_push(SEG_CONSTANT, c));
        emit(vm_call("String", "appendChar", 2));
    }
}

void subroutine_compiler_t::compile(keyword_const_t k)
{
    switch(k)
    {
    case KEYWORD_TRUE:
        emit(vm_push(SEG_CONSTANT, 1));
        emit(vm_op(VM_NEG));
        break;
    case KEYWORD_FALSE:
    case KEYWORD_NULL:
        emit(vm_push(SEG_CONSTANT, 0));
        break;
    case KEYWORD_THIS:
        emit(vm_push(SEG_POINTER, 0));
        break;
    }
}

void subroutine_compiler_t::compile(var_ref_t const& var_ref)
{
    var_location_t const var = resolve_var(var_ref.name);
    emit(vm_push(var.segment, var.index));
}

void subroutine_compiler_t::compile(array_ref_t const& array)
{
    var_location_t const var = resolve_var(array.name);
    compile_expr(*array.index);
    emit(vm_push(var.segment, var.index));
    emit(vm_op(VM_ADD));
    emit(vm_pop(SEG_POINTER, 1));
    emit(vm_push(SEG_THAT, 0));
}

void subroutine_compiler_t::compile(paren_t const& paren)
{
    compile_expr(*paren.expr);
}

void subroutine_compiler_t::compile(unary_t const& unary)
{
    compile_term(*unary.term);
    emit(vm_op(unary.op == UNARY_NEG ? VM_NEG : VM_NOT));
}

void subroutine_compiler_t::compile(subroutine_call_t const& call)
{
    std::visit([this](auto const& c){ this->compile_call(c); }, call);
}

void subroutine_compiler_t::compile_args(std::vector<expr_t> const& args)
{
    for(expr_t const& arg : args)
        compile_expr(arg);
}

// 'name(args)' is a method call on the current object.
void subroutine_compiler_t::compile_call(call_t const& call)
{
    emit(vm_push(SEG_POINTER, 0));
    compile_args(call.args);
    emit(vm_call(m_class.class_name(), view(call.name), call.args.size() + 1));
}

// 'x.name(args)' is a method call when 'x' is a variable,
// otherwise a call to a function or constructor of class 'x'.
void subroutine_compiler_t::compile_call(class_call_t const& call)
{
    if(std::optional<var_location_t> var = search_var(call.target))
    {
        if(var->type.cls != TYPE_CLASS)
        {
            compiler_error(call.target, fmt("Cannot call '%' on '%', which has primitive type %.",
                                            view(call.name), view(call.target), view(var->type.pstring)),
                           ERR_MALFORMED);
        }

        emit(vm_push(var->segment, var->index));
        compile_args(call.args);
        emit(vm_call(view(var->type.pstring), view(call.name), call.args.size() + 1));
    }
    else
    {
        compile_args(call.args);
        emit(vm_call(view(call.target), view(call.name), call.args.size()));
    }
}
