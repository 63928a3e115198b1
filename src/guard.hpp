#ifndef GUARD_HPP
#define GUARD_HPP

#include <type_traits>
#include <utility>

// Calls the stored function when the scope exits, by any path.
template<typename OnExit>
class scope_guard_t
{
public:
    template<typename F>
    scope_guard_t(F&& on_exit)
    : on_exit(std::forward<F>(on_exit))
    {}

    scope_guard_t(scope_guard_t const&) = delete;
    scope_guard_t& operator=(scope_guard_t const&) = delete;

    ~scope_guard_t() { on_exit(); }

private:
    OnExit on_exit;
};

template<typename T>
scope_guard_t<std::remove_reference_t<T>> make_scope_guard(T&& t)
{
    return scope_guard_t<std::remove_reference_t<T>>(std::forward<T>(t));
}

#endif
