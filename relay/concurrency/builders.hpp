//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/builders.hpp
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

#ifndef RELAY_CONCURRENCY_BUILDERS_HPP
#define RELAY_CONCURRENCY_BUILDERS_HPP

#include "relay/concurrency/config.hpp"
#include "relay/concurrency/dispatcher.hpp"
#include "relay/concurrency/error.hpp"
#include "relay/concurrency/limiter.hpp"
#include "relay/concurrency/log.hpp"
#include "relay/concurrency/promise.hpp"
#include "relay/concurrency/types.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Retry Policy

    A failed attempt is retried up to max_retries more times, waiting
    backoff * 2^(n-1) before the nth retry.  The wait stops doubling
    before it would overflow Duration.  If retry_if is set and returns
    false for an error, that error is rethrown without further attempts.
*/
class Retry_policy {
public:
    // Names/Types
    using Predicate = std::function<bool(exception_ptr)>;

    // Data
    int         max_retries = 3;
    Duration    backoff     = std::chrono::milliseconds(1000);
    Predicate   retry_if;
};


/*
    Task Builders
*/
void                                        delay(Duration);
template<class Fun> std::result_of_t<Fun()> retry(Fun, const Retry_policy& = Retry_policy());
template<class Fun> std::result_of_t<Fun()> with_timeout(const Worker_dispatcher&, Fun, Duration);
template<class Fun> std::result_of_t<Fun()> with_timeout(const Worker_dispatcher&, Fun, Duration, const std::string& name);
template<class T> std::vector<T>            launch_sequentially(const Worker_dispatcher&, const std::vector<Task<T>>&);
template<class T> Result_promise<std::vector<T>> concurrent(const Worker_dispatcher&, const std::vector<Task<T>>&, Channel_size limit = 10);


/*
    Implementation Details
*/
namespace Detail {


Duration                    backoff_delay(Duration base, int attempt);
template<class T> T         await_within(const Result_promise<T>&, Duration timeout);


}   // Implementation Details
}   // Concurrency
}   // Relay

#include "relay/concurrency/builders.inl"

#endif  // RELAY_CONCURRENCY_BUILDERS_HPP

//  $CUSTOM_FOOTER$
