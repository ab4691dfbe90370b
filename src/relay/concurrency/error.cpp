//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  src/relay/concurrency/error.cpp
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

#include "relay/concurrency/error.hpp"
#include <chrono>
#include <exception>
#include <string>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Usage Error
*/
Usage_error::Usage_error(const std::string& what)
    : std::invalid_argument{what}
{
}


/*
    Channel Closed
*/
Channel_closed::Channel_closed()
    : std::runtime_error{"channel is closed"}
{
}


/*
    Task Failure
*/
Task_failure::Task_failure(const std::string& worker, exception_ptr cause)
    : std::runtime_error{describe(worker, cause)}
    , name{worker}
    , causep{cause}
{
}


exception_ptr
Task_failure::cause() const
{
    return causep;
}


std::string
Task_failure::describe(const std::string& worker, exception_ptr cause)
{
    return "worker '" + worker + "' failed: " + Concurrency::describe(cause);
}


void
Task_failure::rethrow_cause() const
{
    if (causep)
        std::rethrow_exception(causep);

    throw *this;
}


const std::string&
Task_failure::worker() const
{
    return name;
}


/*
    Aggregate Failure
*/
Aggregate_failure::Aggregate_failure(std::size_t nfailed, exception_ptr last)
    : std::runtime_error{"all " + std::to_string(nfailed) + " tasks failed, last error: " + describe(last)}
    , nfails{nfailed}
    , lastp{last}
{
}


std::size_t
Aggregate_failure::failures() const
{
    return nfails;
}


exception_ptr
Aggregate_failure::last_error() const
{
    return lastp;
}


/*
    Filter Rejected
*/
Filter_rejected::Filter_rejected()
    : std::runtime_error{"filter predicate rejected the value"}
{
}


/*
    Timeout Error
*/
Timeout_error::Timeout_error(Duration timeout)
    : std::runtime_error{"operation timed out after "
        + std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count()) + "ms"}
    , limit{timeout}
{
}


Duration
Timeout_error::timeout() const
{
    return limit;
}


/*
    Error Description
*/
std::string
describe(exception_ptr ep)
{
    if (!ep)
        return "no error";

    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}


}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
