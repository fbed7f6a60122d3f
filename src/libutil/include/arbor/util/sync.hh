#pragma once
///@file

#include <condition_variable>
#include <mutex>

namespace arbor {

/**
 * A value of type `T` that can only be reached while holding its
 * mutex:
 *
 *   Sync<State> state_;
 *
 *   {
 *     auto state(state_.lock());
 *     state->pending.push(item);
 *   }
 *
 * The mutex is released when `state` goes out of scope.
 */
template<class T>
class Sync
{
    std::mutex mutex;
    T data;

public:

    Sync() {}

    Sync(T && data)
        : data(std::move(data))
    {
    }

    class Lock
    {
        Sync * s;
        std::unique_lock<std::mutex> lk;
        friend Sync;

        Lock(Sync * s)
            : s(s)
            , lk(s->mutex)
        {
        }

    public:
        Lock(Lock &&) = delete;
        Lock(const Lock &) = delete;

        T * operator->()
        {
            return &s->data;
        }

        T & operator*()
        {
            return s->data;
        }

        /**
         * Release the mutex until `cv` is notified.
         */
        void wait(std::condition_variable & cv)
        {
            cv.wait(lk);
        }
    };

    Lock lock()
    {
        return Lock(this);
    }
};

} // namespace arbor
