#pragma once
///@file

#include <utility>

namespace arbor {

/**
 * Calls `fun` when the enclosing scope is left, e.g.
 *
 *   Finally cleanup([&]() { seccomp_release(ctx); });
 *
 * `fun` may throw only if no other exception is propagating.
 */
template<typename Fn>
class [[nodiscard]] Finally
{
    Fn fun;
    bool armed = true;

public:
    Finally(Fn fun)
        : fun(std::move(fun))
    {
    }

    Finally(const Finally &) = delete;

    Finally(Finally && other)
        : fun(std::move(other.fun))
        , armed(std::exchange(other.armed, false))
    {
    }

    ~Finally() noexcept(false)
    {
        if (armed)
            fun();
    }
};

} // namespace arbor
