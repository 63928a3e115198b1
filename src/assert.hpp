#ifndef ASSERT_HPP
#define ASSERT_HPP

#include <cassert>
#include <cstdio>
#include <cstdlib>

#include "format.hpp"

// Like assert, but prints the extra arguments when the check fails.
// Only for internal invariants; user errors go through compiler_error.
#ifdef NDEBUG
#define passert(C, ...) ((void) 0)
#else
#define passert(C, ...) (void)((C) || (_passert_impl(#C, __FILE__, __LINE__, __PRETTY_FUNCTION__, __VA_ARGS__), 0))
#endif

template<typename... Args>
[[gnu::noreturn]] void _passert_impl(char const* expr, char const* file, long long line, char const* fn, Args const&... args)
{
    std::fflush(stdout);
    std::fprintf(stderr, "assert: %s:%lli: %s: `%s' failed.\n%s\n",
                 file, line, fn, expr, ezcat(" ", args...).c_str());
    std::abort();
}

#endif
