//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  examples/gochain.cpp
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

#include "relay/concurrency.hpp"
#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>
#include <vector>


using namespace Relay::Concurrency;
using std::cerr;
using std::cout;
using std::endl;


/*
    Daisy Chain

    Each worker receives a number from its right neighbour and passes it,
    plus one, to its left.
*/
int
chain(Channel<int> left, Channel<int> right)
{
    const int n = right.receive();

    left.send(n + 1);
    return n;
}


int
two()
{
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return 2;
}


int
four()
{
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    return 4;
}


int
main(int argc, char* argv[])
{
    if (argc > 2) {
        cerr << "usage: " << argv[0] << " [count]\n";
        return EXIT_FAILURE;
    }

    const Worker_dispatcher dispatcher;
    const int               n       = argc == 2 ? std::max(std::atoi(argv[1]), 0) : 100;
    int                     total   = 0;

    try {
        if (n > 0) {
            const Channel<int>      leftmost    = make_channel<int>();
            Channel<int>            right       = leftmost;
            std::vector<Task<int>>  links;

            for (int i = 0; i != n; ++i) {
                const Channel<int> left = right;

                right = make_buffered_channel<int>(1);
                links.push_back([left, right]{ return chain(left, right); });
            }

            const Result_promise<std::vector<int>> done = dispatcher.launch_all(links);

            right.send(0);
            total = leftmost.receive();
            done.wait();
        }

        cout << "total = " << total << endl;

        // Whichever worker answers first.
        const int first = dispatcher.race(std::vector<Task<int>>{two, four}).get();
        cout << "first = " << first << endl;

        // Both answers, two at a time.
        const std::vector<int> both = launch_with_limit(dispatcher, std::vector<Task<int>>{two, four}, 2).get();
        cout << "both = {" << both[0] << ", " << both[1] << '}' << endl;
    } catch (const std::exception& e) {
        cerr << "gochain: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

//  $CUSTOM_FOOTER$
