#ifndef FNV1A_HPP
#define FNV1A_HPP

#include <cstdint>
#include <string_view>

// FNV-1a: a fast non-cryptographic hash, good for short identifiers.
//   http://isthe.com/chongo/tech/comp/fnv/

template<typename T>
struct fnv1a_constants {};

template<>
struct fnv1a_constants<std::uint32_t>
{
    static constexpr std::uint32_t prime = 16777619ul;
    static constexpr std::uint32_t seed  = 2166136261ul;
};

template<>
struct fnv1a_constants<std::uint64_t>
{
    static constexpr std::uint64_t prime = 1099511628211ull;
    static constexpr std::uint64_t seed  = 14695981039346656037ull;
};

template<typename T = std::uint64_t>
struct fnv1a
{
    static constexpr T prime = fnv1a_constants<T>::prime;
    static constexpr T seed  = fnv1a_constants<T>::seed;

    static constexpr T hash(std::string_view view, T hashval = seed)
    {
        for(unsigned char byte : view)
            hashval = (byte ^ hashval) * prime;
        return hashval;
    }
};

#endif
