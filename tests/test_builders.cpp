//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  tests/test_builders.cpp
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
#include "relay/concurrency/builders.hpp"
#include "relay/concurrency/dispatcher.hpp"
#include "relay/concurrency/error.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace Relay::Concurrency;
using namespace std::chrono_literals;


namespace {


using Clock = std::chrono::steady_clock;


Retry_policy
quick_policy(int retries)
{
    Retry_policy policy;

    policy.max_retries = retries;
    policy.backoff = 5ms;
    return policy;
}


}   // namespace


TEST_CASE("with_timeout returns a result that arrives in time")
{
    const Worker_dispatcher dispatcher;

    CHECK(with_timeout(dispatcher, []{ return 5; }, 2s) == 5);
    CHECK(with_timeout(dispatcher, []{ return std::string("ok"); }, 2s, "quick") == "ok");
}


TEST_CASE("with_timeout gives up on a slow worker")
{
    const Worker_dispatcher dispatcher;
    const Clock::time_point start = Clock::now();

    try {
        with_timeout(dispatcher, []{ std::this_thread::sleep_for(200ms); return 1; }, 30ms, "slow");
        FAIL("expected a timeout");
    } catch (const Timeout_error& e) {
        CHECK(e.timeout() == Duration(30ms));
        CHECK(Clock::now() - start < 200ms);
    }

    // The abandoned worker is still running.
    CHECK(dispatcher.active_worker_names() == std::vector<std::string>{"slow"});
}


TEST_CASE("with_timeout passes on a task failure")
{
    const Worker_dispatcher dispatcher;

    CHECK_THROWS_AS(with_timeout(dispatcher, []() -> int { throw std::runtime_error("broken"); }, 2s), Task_failure);
}


TEST_CASE("retry succeeds once an attempt does")
{
    int attempts = 0;

    const int result = retry([&]{
        if (++attempts < 3)
            throw std::runtime_error("flaky");
        return attempts;
    }, quick_policy(3));

    CHECK(result == 3);
    CHECK(attempts == 3);
}


TEST_CASE("retry rethrows the last error when attempts run out")
{
    int attempts = 0;

    CHECK_THROWS_WITH_AS(retry([&]() -> int {
        throw std::runtime_error("attempt " + std::to_string(++attempts));
    }, quick_policy(2)), "attempt 3", std::runtime_error);
    CHECK(attempts == 3);
}


TEST_CASE("retry backs off exponentially")
{
    Retry_policy        policy  = quick_policy(3);
    int                 attempts = 0;
    const Clock::time_point start = Clock::now();

    policy.backoff = 20ms;
    CHECK_THROWS_AS(retry([&]() -> int { ++attempts; throw std::runtime_error("down"); }, policy), std::runtime_error);

    // 20 + 40 + 80 ms of waiting between four attempts.
    CHECK(attempts == 4);
    CHECK(Clock::now() - start >= 140ms);
}


TEST_CASE("retry backoff stops doubling before it overflows")
{
    CHECK(Detail::backoff_delay(20ms, 1) == Duration(20ms));
    CHECK(Detail::backoff_delay(20ms, 3) == Duration(80ms));

    // Far past the width of a shift or of the duration's count.
    const Duration longest = Detail::backoff_delay(1s, 1000);

    CHECK(longest > Duration::max() / 2);
    CHECK(Detail::backoff_delay(1s, 100) == longest);
}


TEST_CASE("retry rejects a negative policy")
{
    Retry_policy    policy      = quick_policy(-1);
    int             attempts    = 0;

    CHECK_THROWS_AS(retry([&]{ return ++attempts; }, policy), Usage_error);
    policy.max_retries = 1;
    policy.backoff = -5ms;
    CHECK_THROWS_AS(retry([&]{ return ++attempts; }, policy), Usage_error);
    CHECK(attempts == 0);
}


TEST_CASE("delay suspends the caller")
{
    const Clock::time_point start = Clock::now();

    delay(20ms);
    CHECK(Clock::now() - start >= 20ms);
}


TEST_CASE("retry_if stops retrying on an unretryable error")
{
    Retry_policy    policy      = quick_policy(5);
    int             attempts    = 0;

    policy.retry_if = [](exception_ptr ep) {
        bool is_retryable = true;

        try {
            std::rethrow_exception(ep);
        } catch (const std::invalid_argument&) {
            is_retryable = false;
        } catch (const std::exception&) {
        }

        return is_retryable;
    };

    CHECK_THROWS_AS(retry([&]() -> int { ++attempts; throw std::invalid_argument("bad"); }, policy), std::invalid_argument);
    CHECK(attempts == 1);
}


TEST_CASE("retry composes with a dispatcher")
{
    const Worker_dispatcher dispatcher;
    const auto              attempts = std::make_shared<std::atomic<int>>(0);

    const int result = retry([&]{
        return dispatcher.launch([attempts]{
            if (++*attempts < 2)
                throw std::runtime_error("first try fails");
            return 7;
        }).get();
    }, quick_policy(1));

    CHECK(result == 7);
    CHECK(*attempts == 2);
}


TEST_CASE("launch_sequentially runs tasks one after another")
{
    const Worker_dispatcher         dispatcher;
    const auto                      running = std::make_shared<std::atomic<int>>(0);
    const auto                      overlap = std::make_shared<std::atomic<bool>>(false);
    std::vector<Task<int>>          tasks;

    for (int i = 0; i < 4; ++i) {
        tasks.push_back([running, overlap, i]{
            if (++*running > 1)
                *overlap = true;
            std::this_thread::sleep_for(10ms);
            --*running;
            return i * 10;
        });
    }

    CHECK(launch_sequentially(dispatcher, tasks) == std::vector<int>{0, 10, 20, 30});
    CHECK_FALSE(*overlap);
}


TEST_CASE("launch_sequentially stops at the first failure")
{
    const Worker_dispatcher         dispatcher;
    const auto                      is_reached = std::make_shared<std::atomic<bool>>(false);
    const std::vector<Task<int>>    tasks{
        []{ return 1; },
        []() -> int { throw std::runtime_error("stop here"); },
        [is_reached]{ *is_reached = true; return 3; }
    };

    CHECK_THROWS_AS(launch_sequentially(dispatcher, tasks), Task_failure);
    CHECK_FALSE(*is_reached);
}


TEST_CASE("concurrent bounds work by a default limit")
{
    const Worker_dispatcher dispatcher;
    const auto              running = std::make_shared<std::atomic<int>>(0);
    const auto              peak    = std::make_shared<std::atomic<int>>(0);
    std::vector<Task<int>>  tasks;

    for (int i = 0; i < 25; ++i) {
        tasks.push_back([running, peak, i]{
            const int now = ++*running;
            int       seen = *peak;

            while (now > seen && !peak->compare_exchange_weak(seen, now))
                ;
            std::this_thread::sleep_for(10ms);
            --*running;
            return i;
        });
    }

    const std::vector<int> results = concurrent(dispatcher, tasks).get();

    CHECK(results.size() == 25);
    CHECK(results.front() == 0);
    CHECK(results.back() == 24);
    CHECK(*peak <= 10);
    CHECK_THROWS_AS(concurrent(dispatcher, tasks, 0), Usage_error);
}

//  $CUSTOM_FOOTER$
