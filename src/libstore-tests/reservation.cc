#include <gtest/gtest.h>

#include "arbor/store/reservation.hh"

#include <thread>

namespace arbor {

TEST(Reservations, firstClaimOwnsTheKey)
{
    Reservations<int> reservations;

    ASSERT_FALSE(reservations.isClaimed("tree"));
    ASSERT_FALSE(reservations.claim("tree").has_value());
    ASSERT_TRUE(reservations.isClaimed("tree"));

    reservations.complete("tree", 1);
    ASSERT_FALSE(reservations.isClaimed("tree"));
}

TEST(Reservations, waitersReceiveTheResult)
{
    Reservations<int> reservations;
    ASSERT_FALSE(reservations.claim("tree").has_value());

    std::optional<int> seen;
    std::thread waiter([&]() { seen = reservations.claim("tree"); });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    reservations.complete("tree", 42);
    waiter.join();

    ASSERT_TRUE(seen.has_value());
    ASSERT_EQ(*seen, 42);
}

TEST(Reservations, waitersSeeAbandonment)
{
    Reservations<int> reservations;
    ASSERT_FALSE(reservations.claim("tree").has_value());

    bool abandoned = false;
    std::thread waiter([&]() {
        try {
            reservations.claim("tree");
        } catch (BuildAbandoned &) {
            abandoned = true;
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    reservations.abandon("tree");
    waiter.join();

    ASSERT_TRUE(abandoned);

    /* The key can be claimed again. */
    ASSERT_FALSE(reservations.claim("tree").has_value());
}

TEST(Reservations, keysAreIndependent)
{
    Reservations<int> reservations;

    ASSERT_FALSE(reservations.claim("tree").has_value());
    ASSERT_FALSE(reservations.claim("image").has_value());
}

} // namespace arbor
