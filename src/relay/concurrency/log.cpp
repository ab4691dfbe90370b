//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  src/relay/concurrency/log.cpp
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

#include "relay/concurrency/log.hpp"
#include "spdlog/cfg/env.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include <mutex>
#include <utility>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Names/Types
*/
namespace {

using Mutex = std::mutex;
using Lock  = std::lock_guard<Mutex>;

const char* const   logger_name     = "relay";
const char* const   logger_pattern  = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

Mutex       logmutex;
Logger_ptr  loggerp;


Logger_ptr
make_default_logger()
{
    Logger_ptr lp = spdlog::get(logger_name);

    if (!lp) {
        lp = spdlog::stdout_color_mt(logger_name);
        lp->set_pattern(logger_pattern);
        lp->set_level(spdlog::level::warn);
        spdlog::cfg::load_env_levels();
    }

    return lp;
}

}   // namespace


/*
    Library Logger
*/
Logger_ptr
logger()
{
    const Lock lock{logmutex};

    if (!loggerp)
        loggerp = make_default_logger();

    return loggerp;
}


void
set_logger(Logger_ptr lp)
{
    const Lock lock{logmutex};

    loggerp = std::move(lp);
}


}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
