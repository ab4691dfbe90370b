//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  tests/test_main.cpp
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

#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest/doctest.h"
#undef DOCTEST_CONFIG_IMPLEMENT

#include "relay/concurrency/log.hpp"
#include <cstdlib>
#include <cstring>


namespace {


bool
env_truthy(const char* v)
{
    return v != nullptr && v[0] != '\0' && std::strcmp(v, "0") != 0;
}


bool
running_in_ci()
{
    return env_truthy(std::getenv("CI")) || env_truthy(std::getenv("GITHUB_ACTIONS"));
}


}   // namespace


int
main(int argc, char** argv)
{
    doctest::Context context;

    context.setOption("order-by", "name");
    context.setOption("duration", true);

    // No debug breaks or ANSI colours in CI logs.
    if (running_in_ci()) {
        context.setOption("no-breaks", true);
        context.setOption("no-colors", true);
    }

    context.applyCommandLine(argc, argv);

    // Create the library logger up front so SPDLOG_LEVEL applies to every test.
    Relay::Concurrency::logger();

    return context.run();
}

//  $CUSTOM_FOOTER$
