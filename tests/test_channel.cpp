//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  tests/test_channel.cpp
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
#include "relay/concurrency/channel.hpp"
#include "relay/concurrency/error.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace Relay::Concurrency;
using namespace std::chrono_literals;


TEST_CASE("buffered channel rejects a non-positive capacity")
{
    CHECK_THROWS_AS(make_buffered_channel<int>(0), Usage_error);
    CHECK_THROWS_AS(make_buffered_channel<int>(-3), Usage_error);
}


TEST_CASE("buffered channel try_send fills to capacity")
{
    const Channel<int> c = make_buffered_channel<int>(3);

    CHECK(c.capacity() == 3);
    CHECK(c.is_empty());
    CHECK(c.try_send(1));
    CHECK(c.try_send(2));
    CHECK(c.try_send(3));
    CHECK(c.is_full());
    CHECK_FALSE(c.try_send(4));
    CHECK(c.size() == 3);

    CHECK(c.receive() == 1);
    CHECK(c.try_send(4));
    CHECK_FALSE(c.try_send(5));
}


TEST_CASE("channel delivers values in send order")
{
    const Channel<int> c = make_buffered_channel<int>(5);

    c.send(1);
    c.send(2);
    c.send(3);
    CHECK(c.size() == 3);
    CHECK(c.receive() == 1);
    CHECK(c.receive() == 2);
    CHECK(c.receive() == 3);
    CHECK(c.size() == 0);
}


TEST_CASE("channel try_receive returns nothing when empty")
{
    const Channel<std::string> c = make_buffered_channel<std::string>(2);

    CHECK_FALSE(c.try_receive().is_initialized());
    c.send("a");

    const optional<std::string> x = c.try_receive();
    REQUIRE(x.is_initialized());
    CHECK(*x == "a");
    CHECK_FALSE(c.try_receive().is_initialized());
}


TEST_CASE("closed channel refuses sends but drains its buffer")
{
    const Channel<int> c = make_buffered_channel<int>(4);

    c.send(1);
    c.send(2);
    CHECK_FALSE(c.is_closed());
    c.close();
    c.close();
    CHECK(c.is_closed());

    CHECK_FALSE(c.try_send(3));
    CHECK_THROWS_AS(c.send(3), Channel_closed);
    CHECK(c.receive() == 1);
    CHECK(c.receive() == 2);
    CHECK_THROWS_WITH_AS(c.receive(), "channel is closed", Channel_closed);
}


TEST_CASE("close fails a waiting receiver")
{
    const Channel<int>  c = make_channel<int>();
    std::atomic<bool>   is_failed{false};

    std::thread receiver([&]{
        try {
            c.receive();
        } catch (const Channel_closed&) {
            is_failed = true;
        }
    });

    std::this_thread::sleep_for(30ms);
    c.close();
    receiver.join();
    CHECK(is_failed);
}


TEST_CASE("close fails a blocked sender")
{
    const Channel<int>  c = make_buffered_channel<int>(1);
    std::atomic<bool>   is_failed{false};

    c.send(1);

    std::thread sender([&]{
        try {
            c.send(2);
        } catch (const Channel_closed&) {
            is_failed = true;
        }
    });

    std::this_thread::sleep_for(30ms);
    c.close();
    sender.join();
    CHECK(is_failed);
    CHECK(c.receive() == 1);
    CHECK_FALSE(c.try_receive().is_initialized());
}


TEST_CASE("unbuffered channel is a rendezvous")
{
    const Channel<int> c = make_channel<int>();

    CHECK(c.capacity() == 0);
    CHECK_FALSE(c.try_send(1));

    std::thread sender([c]{ c.send(7); });

    CHECK(c.receive() == 7);
    sender.join();
    CHECK(c.size() == 0);
}


TEST_CASE("send hands a value directly to a waiting receiver")
{
    const Channel<int>  c = make_buffered_channel<int>(2);
    std::atomic<int>    got{0};

    std::thread receiver([&]{ got = c.receive(); });

    std::this_thread::sleep_for(30ms);
    c.send(5);
    receiver.join();
    CHECK(got == 5);
    CHECK(c.is_empty());
}


TEST_CASE("blocked sender is admitted as space frees up")
{
    const Channel<int> c = make_buffered_channel<int>(1);

    c.send(1);

    std::thread sender([c]{
        c.send(2);
        c.send(3);
    });

    CHECK(c.receive() == 1);
    CHECK(c.receive() == 2);
    CHECK(c.receive() == 3);
    sender.join();
}


TEST_CASE("channel sequence drains buffered then live values")
{
    const Channel<int> c = make_buffered_channel<int>(2);

    c.send(1);
    c.send(2);

    std::thread producer([c]{
        c.send(3);
        c.send(4);
        c.close();
    });

    std::vector<int> seen;
    for (int x : c.sequence())
        seen.push_back(x);

    producer.join();
    CHECK(seen == std::vector<int>{1, 2, 3, 4});
}


TEST_CASE("channel handles compare by identity")
{
    const Channel<int> a = make_channel<int>();
    const Channel<int> b = a;
    const Channel<int> c = make_channel<int>();
    const Channel<int> unset;

    CHECK(a == b);
    CHECK(a != c);
    CHECK(bool(a));
    CHECK_FALSE(bool(unset));
}


TEST_CASE("many senders and receivers lose no values")
{
    const Channel<int>          c = make_buffered_channel<int>(4);
    std::atomic<long>           sum{0};
    std::vector<std::thread>    threads;

    for (int r = 0; r < 4; ++r) {
        threads.emplace_back([&]{
            for (int x : c.sequence())
                sum += x;
        });
    }

    std::vector<std::thread> senders;
    for (int s = 0; s < 4; ++s) {
        senders.emplace_back([&, s]{
            for (int i = 1; i <= 100; ++i)
                c.send(s * 100 + i);
        });
    }

    for (auto& t : senders)
        t.join();
    c.close();
    for (auto& t : threads)
        t.join();

    // Sum of 1..400.
    CHECK(sum == 80200);
}

//  $CUSTOM_FOOTER$
