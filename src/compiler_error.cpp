#include "compiler_error.hpp"

#include <algorithm>
#include <cctype>

#include "debug_print.hpp"
#include "options.hpp"

namespace
{
    struct line_col_t
    {
        unsigned line;
        unsigned col;
    };

    line_col_t get_line_col(char const* src, pstring_t pstring)
    {
        line_col_t ret = { 1, 1 };

        for(std::size_t i = 0; i < pstring.offset; ++i)
        {
            if(src[i] == '\n')
            {
                ++ret.line;
                ret.col = 1;
            }
            else if(src[i] != '\r')
                ++ret.col;
        }

        return ret;
    }

    char const* get_line_begin(char const* src, pstring_t pstring)
    {
        for(std::size_t i = pstring.offset; i > 0; --i)
            if(src[i-1] == '\n')
                return src + i;
        return src;
    }

    char const* get_line_end(char const* src, pstring_t pstring)
    {
        for(std::size_t i = pstring.offset;; ++i)
            if(src[i] == '\n' || src[i] == '\r' || src[i] == '\0')
                return src + i;
    }
} // end anon namespace

std::string_view to_string(error_kind_t kind)
{
    switch(kind)
    {
#define X(name, str) case name: return str;
    ERROR_KIND_XENUM
#undef X
    }
    return "error";
}

std::string fmt_source_pos(file_contents_t const& file, pstring_t pstring)
{
    line_col_t line_col = get_line_col(file.source(), pstring);
    return fmt(CONSOLE_BOLD "%:%:%" CONSOLE_RESET, file.name(), line_col.line, line_col.col);
}

std::string fmt_error(file_contents_t const& file, pstring_t pstring, std::string const& what,
                      char const* color, std::string_view prefix)
{
    passert(pstring.offset <= file.size(), pstring.offset, file.size());

    std::string str(fmt("%: %%:" CONSOLE_RESET " %\n", fmt_source_pos(file, pstring), color, prefix, what));

    char const* line_begin = get_line_begin(file.source(), pstring);
    char const* line_end = get_line_end(file.source(), pstring);

    std::string pre = fmt(" % | ", get_line_col(file.source(), pstring).line);

    str += pre;
    str.insert(str.end(), line_begin, line_end);
    str.push_back('\n');

    unsigned const caret_position =
        pre.size() + (file.source() + pstring.offset) - line_begin;

    str.resize(str.size() + caret_position, ' ');

    str += color;

    // Underline up to the end of the line, at least one character.
    unsigned underline = std::min<unsigned>(pstring.size, line_end - (file.source() + pstring.offset));
    while(underline && std::isspace(static_cast<unsigned char>(file.source()[pstring.offset + underline - 1])))
        --underline;

    unsigned i = 0;
    do
        str.push_back('^');
    while(++i < underline);

    str += CONSOLE_RESET;

    str.push_back('\n');
    return str;
}

std::string fmt_note(std::string const& what)
{
    return fmt(CONSOLE_BOLD CONSOLE_CYN "note: " CONSOLE_RESET "%\n", what);
}

std::string fmt_warning(file_contents_t const& file, pstring_t pstring, std::string const& what)
{
    return fmt_error(file, pstring, what, CONSOLE_YEL CONSOLE_BOLD, "warning");
}

void compiler_error(file_contents_t const& file, pstring_t pstring, std::string const& what,
                    error_kind_t kind)
{
    throw compiler_error_t(fmt_error(file, pstring, what, CONSOLE_RED CONSOLE_BOLD, to_string(kind)), kind);
}

void compiler_warning(file_contents_t const& file, pstring_t pstring, std::string const& what,
                      error_kind_t kind)
{
    std::string msg = fmt_warning(file, pstring, what);

    if(compiler_options().werror)
    {
        msg += fmt_note("This is an error because --error-on-warning is enabled.");
        throw compiler_error_t(std::move(msg), kind, true);
    }
    else
        stderr_log.write(msg);
}
