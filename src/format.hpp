#ifndef FORMAT_HPP
#define FORMAT_HPP

// String formatting helpers, plus the console colors used by diagnostics.

#include <cstdio>
#include <sstream>
#include <string>
#include <string_view>

#define CONSOLE_RED   "\x1B[31m"
#define CONSOLE_YEL   "\x1B[33m"
#define CONSOLE_CYN   "\x1B[36m"
#define CONSOLE_RESET "\x1B[0m"
#define CONSOLE_BOLD  "\x1B[1m"

template<char F>
void fmt_impl(std::ostringstream& ss, char const* str)
{
    while(*str)
        ss.rdbuf()->sputc(*str++);
}

template<char F, typename T, typename... Ts>
void fmt_impl(std::ostringstream& ss, char const* str, T const& t, Ts const&... ts)
{
    while(*str)
    {
        char const c = *str++;
        if(c == F)
        {
            ss << t;
            fmt_impl<F>(ss, str, ts...);
            return;
        }
        else
            ss.rdbuf()->sputc(c);
    }
}

// Substitutes each 'F' character in 'str' with the next argument.
// Example use: fmt("push % %", segment, index)
template<char F = '%', typename... Ts>
std::string fmt(char const* str, Ts const&... ts)
{
    std::ostringstream ss;
    fmt_impl<F>(ss, str, ts...);
    return ss.str();
}

template<char F = '%', typename... Ts>
int ffmt(FILE* fp, char const* str, Ts const&... ts)
{
    return std::fputs(fmt<F>(str, ts...).c_str(), fp);
}

template<typename P>
void ezcat_impl(std::ostringstream& ss, P const& separator) {}

template<typename P, typename T, typename... Ts>
void ezcat_impl(std::ostringstream& ss, P const& separator, T const& t, Ts const&... ts)
{
    ss << t;
    if(sizeof...(Ts))
        ss << separator;
    ezcat_impl(ss, separator, ts...);
}

// Joins the string representations of 'ts', separated by 'separator'.
template<typename P, typename... Ts>
std::string ezcat(P const& separator, Ts const&... ts)
{
    std::ostringstream ss;
    ezcat_impl(ss, separator, ts...);
    return ss.str();
}

#endif
