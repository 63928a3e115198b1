#include "token.hpp"

#include "format.hpp"

using namespace lex;

std::string_view to_string(token_kind_t kind)
{
    switch(kind)
    {
    case KIND_KEYWORD:    return "keyword";
    case KIND_SYMBOL:     return "symbol";
    case KIND_INTEGER:    return "integerConstant";
    case KIND_STRING:     return "stringConstant";
    case KIND_IDENTIFIER: return "identifier";
    case KIND_END:        return "end";
    }
    return "?BAD?";
}

std::string token_t::to_string(char const* source) const
{
    return fmt("{ %, %, line % }", token_name(type), view(source), line);
}
