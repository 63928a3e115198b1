#ifndef LEXER_HPP
#define LEXER_HPP

#include <vector>

#include "file.hpp"
#include "token.hpp"

// Splits 'file' into tokens, dropping whitespace and comments.
// The result always ends with a TOK_eof token.
// Throws compiler_error_t (ERR_LEXICAL) on input that forms no token.
std::vector<token_t> tokenize(file_contents_t const& file);

#endif
