//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/error.hpp
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

#ifndef RELAY_CONCURRENCY_ERROR_HPP
#define RELAY_CONCURRENCY_ERROR_HPP

#include "relay/concurrency/config.hpp"
#include "relay/concurrency/types.hpp"
#include <cstddef>
#include <stdexcept>
#include <string>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Usage Error

    Raised synchronously by the call that received an invalid argument,
    before any worker is spawned.
*/
class RELAY_CONCURRENCY_DECL Usage_error : public std::invalid_argument {
public:
    // Construct
    explicit Usage_error(const std::string& what);
};


/*
    Channel Closed
*/
class RELAY_CONCURRENCY_DECL Channel_closed : public std::runtime_error {
public:
    // Construct
    Channel_closed();
};


/*
    Task Failure

    An exception thrown by a task body, captured at the worker boundary.
    The underlying exception is retained and can be rethrown.
*/
class RELAY_CONCURRENCY_DECL Task_failure : public std::runtime_error {
public:
    // Construct
    Task_failure(const std::string& worker, exception_ptr cause);

    // Observers
    const std::string&  worker() const;
    exception_ptr       cause() const;

    // Propagation
    void rethrow_cause() const;

private:
    // Message Formatting
    static std::string describe(const std::string& worker, exception_ptr cause);

    // Data
    std::string     name;
    exception_ptr   causep;
};


/*
    Aggregate Failure

    Raised by a race only after every participant has failed.
*/
class RELAY_CONCURRENCY_DECL Aggregate_failure : public std::runtime_error {
public:
    // Construct
    Aggregate_failure(std::size_t nfailed, exception_ptr last);

    // Observers
    std::size_t     failures() const;
    exception_ptr   last_error() const;

private:
    // Data
    std::size_t     nfails;
    exception_ptr   lastp;
};


/*
    Filter Rejected

    Fails a filtered promise whose value did not satisfy the predicate.
*/
class RELAY_CONCURRENCY_DECL Filter_rejected : public std::runtime_error {
public:
    // Construct
    Filter_rejected();
};


/*
    Timeout Error
*/
class RELAY_CONCURRENCY_DECL Timeout_error : public std::runtime_error {
public:
    // Construct
    explicit Timeout_error(Duration);

    // Observers
    Duration timeout() const;

private:
    // Data
    Duration limit;
};


/*
    Error Description
*/
RELAY_CONCURRENCY_DECL std::string describe(exception_ptr);


}   // Concurrency
}   // Relay

#endif  // RELAY_CONCURRENCY_ERROR_HPP

//  $CUSTOM_FOOTER$
