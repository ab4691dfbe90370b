//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  tests/test_semaphore.cpp
//

//
//  IAPPA CM Revision # : $Revision$
//  IAPPA CM Tag        : $Name:  $
//  Last user to change : $Author$
//  Date of change      : $Date$
//  File Path           : $Source$
//  Source of funding   : IAPPA
//
//  CAUTION:  CONTROLLED SOURCE.  DO NOT MODIFY ANYTHING ABOVE THIS LINE.
//

#include "doctest/doctest.h"
#include "relay/concurrency/error.hpp"
#include "relay/concurrency/semaphore.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace Relay::Concurrency;
using namespace std::chrono_literals;


TEST_CASE("semaphore rejects a non-positive count")
{
    CHECK_THROWS_AS(Semaphore(0), Usage_error);
    CHECK_THROWS_AS(Semaphore(-1), Usage_error);
}


TEST_CASE("semaphore counts permits")
{
    Semaphore s(2);

    CHECK(s.max_count() == 2);
    CHECK(s.available() == 2);
    s.acquire();
    CHECK(s.try_acquire());
    CHECK(s.available() == 0);
    CHECK_FALSE(s.try_acquire());
    s.release();
    CHECK(s.available() == 1);
    s.release();
    CHECK(s.available() == 2);
    CHECK_THROWS_AS(s.release(), Usage_error);
}


TEST_CASE("semaphore acquire waits for a release")
{
    Semaphore           s(1);
    std::atomic<bool>   is_acquired{false};

    s.acquire();

    std::thread waiter([&]{
        s.acquire();
        is_acquired = true;
        s.release();
    });

    while (s.waiting() == 0)
        std::this_thread::sleep_for(1ms);

    CHECK_FALSE(is_acquired);
    s.release();
    waiter.join();
    CHECK(is_acquired);
    CHECK(s.available() == 1);
}


TEST_CASE("semaphore wakes waiters in arrival order")
{
    Semaphore           s(1);
    std::vector<int>    order;
    std::mutex          ordermutex;
    std::vector<std::thread> waiters;

    s.acquire();
    for (int i = 0; i < 3; ++i) {
        waiters.emplace_back([&, i]{
            s.acquire();
            {
                const std::lock_guard<std::mutex> lock{ordermutex};
                order.push_back(i);
            }
            s.release();
        });

        // Queue each waiter before starting the next.
        while (s.waiting() != i + 1)
            std::this_thread::sleep_for(1ms);
    }

    s.release();
    for (auto& t : waiters)
        t.join();

    CHECK(order == std::vector<int>{0, 1, 2});
}


TEST_CASE("semaphore bounds concurrent holders")
{
    Semaphore                   s(2);
    std::atomic<int>            active{0};
    std::atomic<int>            peak{0};
    std::vector<std::thread>    threads;

    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&]{
            const Semaphore::Permit permit = s.make_permit();
            const int               now = ++active;
            int                     seen = peak;

            while (now > seen && !peak.compare_exchange_weak(seen, now))
                ;
            std::this_thread::sleep_for(20ms);
            --active;
        });
    }

    for (auto& t : threads)
        t.join();

    CHECK(peak <= 2);
    CHECK(s.available() == 2);
}


TEST_CASE("semaphore permit releases once")
{
    Semaphore s(1);

    {
        Semaphore::Permit permit = s.make_permit();

        CHECK(permit.is_held());
        CHECK(s.available() == 0);

        Semaphore::Permit moved = std::move(permit);
        CHECK_FALSE(permit.is_held());
        CHECK(moved.is_held());

        moved.release();
        CHECK(s.available() == 1);
        moved.release();
        CHECK(s.available() == 1);
    }

    CHECK(s.available() == 1);

    optional<Semaphore::Permit> held = s.try_make_permit();
    REQUIRE(held.is_initialized());
    CHECK_FALSE(s.try_make_permit().is_initialized());
}

//  $CUSTOM_FOOTER$
