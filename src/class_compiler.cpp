#include "class_compiler.hpp"

#include <iterator>

#include "compiler_error.hpp"
#include "debug_print.hpp"
#include "format.hpp"
#include "subroutine_compiler.hpp"

class_compiler_t::class_compiler_t(file_contents_t const& file, class_t const& cls)
: m_file(file)
, m_class(cls)
{}

std::string class_compiler_t::new_label()
{
    return fmt("%_%", class_name(), m_next_label++);
}

void class_compiler_t::declare_class_vars()
{
    for(class_var_dec_t const& dec : m_class.class_var_decs)
    {
        for(pstring_t name : dec.names)
        {
            var_kind_t const kind = dec.kind == CLASS_VAR_STATIC ? VAR_STATIC : VAR_FIELD;

            if(m_symbols.find(kind, view(name)))
                compiler_warning(m_file, name, fmt("Redeclaration of % '%'. Later references use this one.",
                                                   to_string(kind), view(name)));

            unsigned const index = kind == VAR_STATIC
                ? m_symbols.insert_static(view(name), dec.type)
                : m_symbols.insert_field(view(name), dec.type);

            dprint(trace_log(), "DECLARE", class_name(), to_string(kind), view(name), index);
        }
    }
}

std::vector<std::string> class_compiler_t::compile()
{
    declare_class_vars();

    std::vector<std::string> lines;
    for(subroutine_dec_t const& dec : m_class.subroutine_decs)
    {
        std::vector<std::string> sub = subroutine_compiler_t(*this, dec).compile();
        lines.insert(lines.end(), std::make_move_iterator(sub.begin()), std::make_move_iterator(sub.end()));
    }
    return lines;
}
