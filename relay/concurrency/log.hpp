//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/log.hpp
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

#ifndef RELAY_CONCURRENCY_LOG_HPP
#define RELAY_CONCURRENCY_LOG_HPP

#include "relay/concurrency/config.hpp"
#include "spdlog/spdlog.h"
#include <memory>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Library Logger

    All library diagnostics go through one named spdlog logger ("relay").
    It is created on first use with a colour console sink at level warn;
    SPDLOG_LEVEL (e.g., "relay=debug") overrides the level.  An application
    may substitute its own logger.
*/
using Logger_ptr = std::shared_ptr<spdlog::logger>;

RELAY_CONCURRENCY_DECL Logger_ptr   logger();
RELAY_CONCURRENCY_DECL void         set_logger(Logger_ptr);


}   // Concurrency
}   // Relay

#endif  // RELAY_CONCURRENCY_LOG_HPP

//  $CUSTOM_FOOTER$
