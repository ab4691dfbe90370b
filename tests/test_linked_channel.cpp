//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  tests/test_linked_channel.cpp
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
#include "relay/concurrency/linked_channel.hpp"
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace Relay::Concurrency;
using namespace std::chrono_literals;


namespace {


template<class Pred>
bool
eventually(Pred pred)
{
    for (int i = 0; i < 500; ++i) {
        if (pred())
            return true;
        std::this_thread::sleep_for(2ms);
    }

    return pred();
}


}   // namespace


TEST_CASE("linked channels carry values both ways in order")
{
    const auto ends = make_linked_channels<std::string>();
    const Linked_channel<std::string>& a = ends.first;
    const Linked_channel<std::string>& b = ends.second;

    a.send("one");
    a.send("two");
    b.send("back");

    CHECK(b.receive() == "one");
    CHECK(b.receive() == "two");
    CHECK(a.receive() == "back");
    CHECK(a != b);
}


TEST_CASE("linked channel try_receive only reads what has arrived")
{
    const auto ends = make_linked_channels<int>();

    CHECK_FALSE(ends.second.try_receive().is_initialized());
    CHECK(ends.first.try_send(4));
    REQUIRE(eventually([&]{ return ends.second.size() == 1; }));

    const optional<int> x = ends.second.try_receive();
    REQUIRE(x.is_initialized());
    CHECK(*x == 4);
    CHECK(ends.second.is_empty());
}


TEST_CASE("closing one end is seen by the peer after delivery")
{
    const auto ends = make_linked_channels<int>();
    const Linked_channel<int>& a = ends.first;
    const Linked_channel<int>& b = ends.second;

    a.send(1);
    a.send(2);
    a.close();

    CHECK(a.is_closed());
    CHECK_FALSE(a.try_send(3));
    CHECK_THROWS_AS(a.send(3), Channel_closed);

    // Values sent before the close are still delivered, then the end.
    CHECK(b.receive() == 1);
    CHECK(b.receive() == 2);
    CHECK_THROWS_AS(b.receive(), Channel_closed);
    CHECK(b.is_closed());
    CHECK_THROWS_AS(b.send(4), Channel_closed);
}


TEST_CASE("data reaching a closed end is discarded")
{
    const auto ends = make_linked_channels<int>();
    const Linked_channel<int>& a = ends.first;
    const Linked_channel<int>& b = ends.second;

    b.close();

    // The send may or may not beat the close message to a; either way
    // nothing is buffered at b.
    a.try_send(1);
    REQUIRE(eventually([&]{ return a.is_closed(); }));
    CHECK_FALSE(a.try_send(2));
    std::this_thread::sleep_for(20ms);
    CHECK_FALSE(b.try_receive().is_initialized());
    CHECK_THROWS_AS(b.receive(), Channel_closed);
}


TEST_CASE("linked channel sequence ends when the peer closes")
{
    const auto ends = make_linked_channels<int>();
    const Linked_channel<int> a = ends.first;

    std::thread producer([a]{
        for (int i = 0; i < 5; ++i)
            a.send(i);
        a.close();
    });

    std::vector<int> seen;
    for (int x : ends.second.sequence())
        seen.push_back(x);

    producer.join();
    CHECK(seen == std::vector<int>{0, 1, 2, 3, 4});
}

//  $CUSTOM_FOOTER$
