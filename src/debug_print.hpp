#ifndef DEBUG_PRINT_HPP
#define DEBUG_PRINT_HPP

// Logging, enabled by --verbose.

#include <cstdio>
#include <mutex>
#include <string>

#include "format.hpp"
#include "options.hpp"

struct log_t
{
    FILE* stream;
    std::mutex mutex;

    void write(std::string const& msg)
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::fputs(msg.c_str(), stream);
        if(msg.empty() || msg.back() != '\n')
            std::fputc('\n', stream);
        std::fflush(stream);
    }
};

inline log_t stdout_log = { stdout };
inline log_t stderr_log = { stderr };

// Returns null when tracing is off, which makes 'dprint' a no-op.
inline log_t* trace_log() { return compiler_options().verbose ? &stdout_log : nullptr; }

#define dprint(stream, ...) ((void)((stream) ? ((stream)->write(::ezcat(" ", __VA_ARGS__)), 0) : 0))

#endif
