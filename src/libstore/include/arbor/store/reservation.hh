#pragma once
///@file

#include "arbor/util/sync.hh"
#include "arbor/util/error.hh"

#include <condition_variable>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace arbor {

/**
 * Thrown to callers that waited on a reservation whose holder gave up
 * without producing a result.
 */
MakeError(BuildAbandoned, Error);

/**
 * An in-process table of per-key reservations. The first caller for a
 * key becomes its owner; everyone else blocks until the owner calls
 * `complete()` or `abandon()`.
 */
template<typename T>
class Reservations
{
    struct Slot
    {
        bool finished = false;
        std::optional<T> result;
    };

    struct State
    {
        std::map<std::string, std::shared_ptr<Slot>> slots;
    };

    Sync<State> state_;
    std::condition_variable wakeup;

public:

    /**
     * Become the owner of `key`, returning `std::nullopt`, or wait for
     * the current owner and return its result.
     *
     * @throws BuildAbandoned if the owner abandoned the key. The caller
     * may then call `claim()` again.
     */
    std::optional<T> claim(const std::string & key)
    {
        auto state(state_.lock());

        auto i = state->slots.find(key);
        if (i == state->slots.end()) {
            state->slots.emplace(key, std::make_shared<Slot>());
            return std::nullopt;
        }

        auto slot = i->second;
        while (!slot->finished)
            state.wait(wakeup);

        if (!slot->result)
            throw BuildAbandoned("the build of '%s' was abandoned by another worker", key);

        return slot->result;
    }

    /**
     * Release `key`, handing `result` to every waiter.
     */
    void complete(const std::string & key, const T & result)
    {
        finish(key, result);
    }

    /**
     * Release `key` without a result.
     */
    void abandon(const std::string & key)
    {
        finish(key, std::nullopt);
    }

    bool isClaimed(const std::string & key)
    {
        return state_.lock()->slots.count(key);
    }

private:

    void finish(const std::string & key, std::optional<T> result)
    {
        {
            auto state(state_.lock());
            auto i = state->slots.find(key);
            if (i == state->slots.end())
                return;
            i->second->finished = true;
            i->second->result = std::move(result);
            /* Waiters hold their own reference to the slot. */
            state->slots.erase(i);
        }
        wakeup.notify_all();
    }
};

} // namespace arbor
