#ifndef CLASS_COMPILER_HPP
#define CLASS_COMPILER_HPP

#include <string>
#include <string_view>
#include <vector>

#include "ast.hpp"
#include "file.hpp"
#include "symbol_table.hpp"

// Translates one class into VM instructions.
// Owns the static and field table, and hands out labels to the
// subroutine compilers so that no two subroutines share one.
class class_compiler_t
{
public:
    class_compiler_t(file_contents_t const& file, class_t const& cls);

    // Returns one instruction per element, in order.
    std::vector<std::string> compile();

    file_contents_t const& file() const { return m_file; }
    std::string_view view(pstring_t pstring) const { return pstring.view(m_file.source()); }

    class_t const& ast() const { return m_class; }
    std::string_view class_name() const { return view(m_class.name); }
    class_symbol_table_t const& symbols() const { return m_symbols; }

    // Labels look like 'Main_3'.
    std::string new_label();

private:
    void declare_class_vars();

    file_contents_t const& m_file;
    class_t const& m_class;
    class_symbol_table_t m_symbols;
    unsigned m_next_label = 0;
};

#endif
