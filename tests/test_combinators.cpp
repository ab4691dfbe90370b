//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  tests/test_combinators.cpp
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
#include "relay/concurrency/combinators.hpp"
#include "relay/concurrency/error.hpp"
#include "relay/concurrency/sequence.hpp"
#include <algorithm>
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


Sequence<int>
make_counter(int first, int last)
{
    int n = first;

    return Sequence<int>([n, last]() mutable {
        optional<int> x;

        if (n <= last)
            x = n++;

        return x;
    });
}


std::size_t
drain(const Sequence<int>& s)
{
    std::size_t n = 0;

    while (s.next())
        ++n;

    return n;
}


}   // namespace


TEST_CASE("select rejects an empty source list")
{
    CHECK_THROWS_AS(Relay::Concurrency::select(std::vector<Channel<int>>()), Usage_error);
    CHECK_THROWS_AS(blocking_select(std::vector<Channel<int>>()), Usage_error);
}


TEST_CASE("select takes a value that is already waiting")
{
    const Channel<int> a = make_buffered_channel<int>(1);
    const Channel<int> b = make_buffered_channel<int>(1);

    b.send(8);

    const Selection<int> chosen = Relay::Concurrency::select(std::vector<Channel<int>>{a, b}).get();

    CHECK(chosen.first == 1);
    CHECK(chosen.second == 8);
    CHECK(b.is_empty());
}


TEST_CASE("select waits for the first source to produce")
{
    const Channel<std::string>  a = make_channel<std::string>();
    const Channel<std::string>  b = make_channel<std::string>();
    const auto                  result = Relay::Concurrency::select(std::vector<Channel<std::string>>{a, b});

    CHECK_FALSE(result.wait_for(20ms));

    std::thread sender([b]{ b.send("late"); });

    const Selection<std::string> chosen = result.get();
    sender.join();

    CHECK(chosen.first == 1);
    CHECK(chosen.second == "late");

    // The selector has left the other source's receive queue.
    CHECK_FALSE(a.try_send("nobody listening"));
}


TEST_CASE("select skips drained sources and fails when all are")
{
    const Channel<int> a = make_buffered_channel<int>(2);
    const Channel<int> b = make_buffered_channel<int>(2);

    a.close();
    b.send(3);
    b.close();

    CHECK(blocking_select(std::vector<Channel<int>>{a, b}) == Selection<int>(1, 3));
    CHECK_THROWS_AS(blocking_select(std::vector<Channel<int>>{a, b}), Channel_closed);
    CHECK_THROWS_AS(Relay::Concurrency::select(std::vector<Channel<int>>{a, b}).get(), Channel_closed);
}


TEST_CASE("select fails when its sources close while it waits")
{
    const Channel<int>  a = make_channel<int>();
    const Channel<int>  b = make_channel<int>();
    const auto          result = Relay::Concurrency::select(std::vector<Channel<int>>{a, b});

    a.close();
    CHECK_FALSE(result.wait_for(20ms));
    b.close();
    CHECK_THROWS_AS(result.get(), Channel_closed);
}


TEST_CASE("an abandoned select leaves later values for other receivers")
{
    const Channel<int> source = make_buffered_channel<int>(2);

    {
        const auto pending = Relay::Concurrency::select(std::vector<Channel<int>>{source});

        CHECK_FALSE(pending.wait_for(10ms));
    }

    source.send(1);
    source.send(2);
    CHECK(source.size() == 2);
    CHECK(source.receive() == 1);
    CHECK(source.receive() == 2);
}


TEST_CASE("a select stays pending while any handle to it remains")
{
    const Channel<int>                  source = make_channel<int>();
    Result_promise<Selection<int>>      kept;

    {
        const auto pending = Relay::Concurrency::select(std::vector<Channel<int>>{source});

        kept = pending;
    }

    std::thread sender([source]{ source.send(6); });

    CHECK(kept.get() == Selection<int>(0, 6));
    sender.join();
}


TEST_CASE("try_select never waits")
{
    const Channel<int> a = make_channel<int>();
    const Channel<int> b = make_buffered_channel<int>(1);

    CHECK_FALSE(try_select(std::vector<Channel<int>>{a, b}).is_initialized());
    b.send(4);

    const optional<Selection<int>> chosen = try_select(std::vector<Channel<int>>{a, b});
    REQUIRE(chosen.is_initialized());
    CHECK(chosen->first == 1);
    CHECK(chosen->second == 4);
}


TEST_CASE("select loses no values to competing selectors")
{
    const Channel<int>          a = make_channel<int>();
    const Channel<int>          b = make_channel<int>();
    const std::vector<Channel<int>> both{a, b};
    std::atomic<int>            sum{0};
    std::vector<std::thread>    selectors;

    for (int i = 0; i < 4; ++i) {
        selectors.emplace_back([&]{
            try {
                for (;;)
                    sum += blocking_select(both).second;
            } catch (const Channel_closed&) {
            }
        });
    }

    for (int i = 1; i <= 50; ++i)
        (i % 2 ? a : b).send(i);

    a.close();
    b.close();
    for (auto& t : selectors)
        t.join();

    CHECK(sum == 1275);
}


TEST_CASE("merge interleaves channels and keeps each source's order")
{
    const Channel<int> a = make_buffered_channel<int>(2);
    const Channel<int> b = make_buffered_channel<int>(2);

    std::thread producer_a([a]{
        for (int i = 0; i < 5; ++i)
            a.send(i);
        a.close();
    });
    std::thread producer_b([b]{
        for (int i = 100; i < 105; ++i)
            b.send(i);
        b.close();
    });

    std::vector<int> from_a;
    std::vector<int> from_b;

    for (int x : merge(std::vector<Channel<int>>{a, b}))
        (x < 100 ? from_a : from_b).push_back(x);

    producer_a.join();
    producer_b.join();
    CHECK(from_a == std::vector<int>{0, 1, 2, 3, 4});
    CHECK(from_b == std::vector<int>{100, 101, 102, 103, 104});
}


TEST_CASE("merge ends only after every channel has closed and drained")
{
    const Channel<int>  a = make_buffered_channel<int>(4);
    const Channel<int>  b = make_buffered_channel<int>(4);
    std::atomic<bool>   is_done{false};
    std::atomic<int>    count{0};

    a.send(1);
    b.send(2);

    std::thread consumer([&]{
        for (int x : merge(std::vector<Channel<int>>{a, b})) {
            (void)x;
            ++count;
        }
        is_done = true;
    });

    a.close();
    std::this_thread::sleep_for(30ms);
    CHECK_FALSE(is_done);

    b.send(3);
    b.close();
    consumer.join();
    CHECK(is_done);
    CHECK(count == 3);
}


TEST_CASE("merge of sequences ends after every sequence has ended")
{
    std::vector<int> seen;

    for (int x : merge(std::vector<Sequence<int>>{make_counter(1, 3), make_counter(10, 12)}))
        seen.push_back(x);

    std::sort(seen.begin(), seen.end());
    CHECK(seen == std::vector<int>{1, 2, 3, 10, 11, 12});
    CHECK_FALSE(merge(std::vector<Sequence<int>>()).next().is_initialized());
}


TEST_CASE("merge of sequences fails fast on a source error")
{
    const Channel<int>  idle = make_channel<int>();
    const Sequence<int> failing([]() -> optional<int> {
        throw std::runtime_error("source broke");
    });
    const Sequence<int> merged = merge(std::vector<Sequence<int>>{idle.sequence(), failing});

    // The idle source is still open; the error must not wait for it.
    CHECK_THROWS_WITH_AS(drain(merged), "source broke", std::runtime_error);

    idle.close();
}


TEST_CASE("merge pulls from a source only as fast as it is consumed")
{
    const auto          npulled = std::make_shared<std::atomic<int>>(0);
    const Sequence<int> endless([npulled]{ return optional<int>(++*npulled); });

    {
        const Sequence<int> merged = merge(std::vector<Sequence<int>>{endless});

        CHECK(*merged.next() == 1);
        std::this_thread::sleep_for(30ms);

        // At most one value waits in the merge and one in the pump's hand.
        CHECK(*npulled <= 3);
    }

    // Releasing the merge has stopped and joined the pump.
    const int after_release = *npulled;

    std::this_thread::sleep_for(20ms);
    CHECK(*npulled == after_release);
}


TEST_CASE("an abandoned merge stops receiving from a channel")
{
    const Channel<int> source = make_buffered_channel<int>(3);

    std::thread producer([source]{
        std::this_thread::sleep_for(30ms);
        source.send(1);
        source.send(2);
        source.send(3);
    });

    {
        const Sequence<int> merged = merge(std::vector<Sequence<int>>{source.sequence()});

        // Released while its pump waits on the empty channel; the release
        // completes once the pump has taken at most one value.
    }

    producer.join();
    CHECK(source.size() >= 2);
    source.close();
}


TEST_CASE("pipeline maps each value and ends with its source")
{
    const Channel<int> source = make_buffered_channel<int>(3);

    source.send(1);
    source.send(2);
    source.send(3);
    source.close();

    std::vector<std::string> seen;
    for (const std::string& s : pipeline(source, [](int x){ return std::to_string(x * x); }))
        seen.push_back(s);

    CHECK(seen == std::vector<std::string>{"1", "4", "9"});
}


TEST_CASE("pipelines compose over sequences")
{
    const Sequence<int> doubled = pipeline(make_counter(1, 4), [](int x){ return x * 2; });
    const Sequence<int> shifted = pipeline(doubled, [](int x){ return x + 1; });
    std::vector<int>    seen;

    for (int x : shifted)
        seen.push_back(x);

    CHECK(seen == std::vector<int>{3, 5, 7, 9});
    CHECK_FALSE(shifted.next().is_initialized());
}


TEST_CASE("pipeline propagates a transform error")
{
    const Sequence<int> checked = pipeline(make_counter(1, 3), [](int x) {
        if (x == 2)
            throw std::domain_error("two is not allowed");
        return x;
    });

    CHECK(*checked.next() == 1);
    CHECK_THROWS_AS(checked.next(), std::domain_error);
}

//  $CUSTOM_FOOTER$
