#ifndef PSTRING_HPP
#define PSTRING_HPP

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>

#include "assert.hpp"

// Holds a slice of a source buffer.
// Tokens, AST identifiers and diagnostics all point into the buffer this way,
// so the buffer must outlive them.
struct pstring_t
{
    std::uint32_t offset;
    std::uint32_t size;

    std::string_view view(char const* buffer) const
        { return std::string_view(buffer + offset, size); }

    std::string string(char const* buffer) const
        { return std::string(view(buffer)); }

    constexpr std::uint32_t end() const { return offset + size; }

    constexpr explicit operator bool() const { return size; }
};

// Combines two pstrings into one spanning both.
constexpr pstring_t concat(pstring_t lo, pstring_t hi)
{
    auto min_offset = std::min(lo.offset, hi.offset);
    auto max_end = std::max(lo.end(), hi.end());
    return { min_offset, max_end - min_offset };
}

// Shrinks 'pstring' by 'n' characters on both ends.
constexpr pstring_t trim(pstring_t pstring, std::uint32_t n = 1)
{
    passert(pstring.size >= n * 2, pstring.size, n);
    return { pstring.offset + n, pstring.size - n * 2 };
}

#endif
