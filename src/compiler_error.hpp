#ifndef COMPILER_ERROR_HPP
#define COMPILER_ERROR_HPP

#include <stdexcept>
#include <string>

#include "file.hpp"
#include "format.hpp"
#include "pstring.hpp"

#define ERROR_KIND_XENUM \
    X(ERR_LEXICAL,    "lexical error") \
    X(ERR_SYNTAX,     "syntax error") \
    X(ERR_UNRESOLVED, "unresolved identifier") \
    X(ERR_MALFORMED,  "malformed construct")

enum error_kind_t : char
{
#define X(name, str) name,
    ERROR_KIND_XENUM
#undef X
};

std::string_view to_string(error_kind_t kind);

class compiler_error_t : public std::runtime_error
{
public:
    compiler_error_t(std::string const& what, error_kind_t kind, bool warning = false)
    : std::runtime_error(what)
    , kind(kind)
    , warning(warning)
    {}

    error_kind_t kind;
    bool warning = false;
};

std::string fmt_source_pos(file_contents_t const& file, pstring_t pstring);

std::string fmt_error(file_contents_t const& file, pstring_t pstring, std::string const& what,
                      char const* color = CONSOLE_RED CONSOLE_BOLD, std::string_view prefix = "error");

std::string fmt_note(std::string const& what);

std::string fmt_warning(file_contents_t const& file, pstring_t pstring, std::string const& what);

[[gnu::noreturn]]
void compiler_error(file_contents_t const& file, pstring_t pstring, std::string const& what,
                    error_kind_t kind = ERR_SYNTAX);

// Prints to stderr, unless --error-on-warning turns it into an error.
void compiler_warning(file_contents_t const& file, pstring_t pstring, std::string const& what,
                      error_kind_t kind = ERR_MALFORMED);

#endif
