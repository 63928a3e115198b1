#include "lexer.hpp"

#include <algorithm>
#include <limits>

#include "compiler_error.hpp"

using namespace lex;

namespace
{

class lexer_t
{
public:
    explicit lexer_t(file_contents_t const& file)
    : file(file)
    , next_char(file.source())
    {}

    std::vector<token_t> run();

private:
    char const* source() const { return file.source(); }

    pstring_t here(char const* ptr, std::uint32_t size = 1) const
        { return { std::uint32_t(ptr - source()), size }; }

    void count_lines(char const* begin, char const* end)
        { line += std::count(begin, end, '\n'); }

    void skip_ml_comment();
    std::uint32_t parse_integer(token_t const& token) const;

    file_contents_t const& file;
    char const* next_char = nullptr;
    std::uint32_t line = 1;
};

std::vector<token_t> lexer_t::run()
{
    std::vector<token_t> tokens;

    while(true)
    {
        char const* const token_source = next_char;
        token_type_t lexed = TOK_START;
        while(lexed > TOK_LAST_STATE)
        {
            passert(next_char <= source() + file.size() + 1, next_char - source(), file.size());
            unsigned char const c = *next_char;
            lexed = lexer_transition_table[lexed + lexer_ec_table[c]];
            ++next_char;
        }
        --next_char;

        token_t token = {};
        token.type = lexed;
        token.pstring = here(token_source, next_char - token_source);
        token.line = line;

        switch(lexed)
        {
        case TOK_ERROR:
            if(*token_source == '"')
                compiler_error(file, token.pstring, "Unterminated string constant.", ERR_LEXICAL);
            compiler_error(file, here(token_source),
                           fmt("Unexpected character '%'.", *token_source), ERR_LEXICAL);

        case TOK_eof:
            token.pstring.size = 0;
            tokens.push_back(token);
            return tokens;

        case TOK_whitespace:
        case TOK_comment:
            count_lines(token_source, next_char);
            continue;

        case TOK_ml_comment_begin:
            skip_ml_comment();
            continue;

        case TOK_integer:
            token.value = parse_integer(token);
            break;

        default:
            break;
        }

        tokens.push_back(token);
    }
}

// Also handles '/** */' comments, which start the same way.
void lexer_t::skip_ml_comment()
{
    char const* const begin = next_char - 2;
    while(true)
    {
        if(*next_char == '\0' && next_char >= source() + file.size())
            compiler_error(file, here(begin, 2), "Unterminated multi-line comment.", ERR_LEXICAL);

        if(next_char[0] == '*' && next_char[1] == '/')
        {
            next_char += 2;
            return;
        }

        if(*next_char == '\n')
            ++line;
        ++next_char;
    }
}

std::uint32_t lexer_t::parse_integer(token_t const& token) const
{
    std::uint32_t value = 0;
    for(char c : token.view(source()))
    {
        value = value * 10 + (c - '0');
        if(value > std::numeric_limits<std::uint16_t>::max())
            compiler_error(file, token.pstring, "Integer constant is too large.", ERR_LEXICAL);
    }
    return value;
}

} // end anon namespace

std::vector<token_t> tokenize(file_contents_t const& file)
{
    return lexer_t(file).run();
}
