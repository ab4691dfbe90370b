//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/limiter.hpp
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

#ifndef RELAY_CONCURRENCY_LIMITER_HPP
#define RELAY_CONCURRENCY_LIMITER_HPP

#include "relay/concurrency/config.hpp"
#include "relay/concurrency/dispatcher.hpp"
#include "relay/concurrency/error.hpp"
#include "relay/concurrency/promise.hpp"
#include "relay/concurrency/semaphore.hpp"
#include "relay/concurrency/types.hpp"
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Concurrency Limiter

    Launches a list of tasks through a dispatcher with at most a fixed
    number of workers in flight.  Each worker holds a semaphore permit from
    launch until its result is delivered.  Results keep the order of the
    tasks.  The first failure fails the whole launch and stops further
    tasks from being admitted; workers already running are not cancelled.
*/
class Concurrency_limiter {
public:
    // Construct
    Concurrency_limiter(const Worker_dispatcher&, Channel_size concurrency);

    // Launching
    template<class T> Result_promise<std::vector<T>> launch(const std::vector<Task<T>>&) const;

    // Observers
    Channel_size concurrency() const;

private:
    // Data
    Worker_dispatcher   dispatcher;
    Channel_size        nmax;
};


template<class T> Result_promise<std::vector<T>> launch_with_limit(const Worker_dispatcher&, const std::vector<Task<T>>&, Channel_size concurrency);


/*
    Implementation Details
*/
namespace Detail {


/*
    Limited Launch

    The state of one call to Concurrency_limiter::launch.  Tasks are
    admitted in order whenever a permit is free, both initially and as
    each admitted worker completes.
*/
template<class T>
class Limited_launch {
public:
    // Names/Types
    using Launch_ptr = std::shared_ptr<Limited_launch>;

    // Construct/Copy
    Limited_launch(const Worker_dispatcher&, const std::vector<Task<T>>&, Channel_size concurrency);
    Limited_launch(const Limited_launch&) = delete;
    Limited_launch& operator=(const Limited_launch&) = delete;

    // Admission
    static void admit(const Launch_ptr&);

    // Result
    Result_promise<std::vector<T>> result() const;

private:
    // Names/Types
    using Mutex         = std::mutex;
    using Lock          = std::lock_guard<Mutex>;
    using Permit_ptr    = std::shared_ptr<Semaphore::Permit>;

    // Admission
    optional<Semaphore::Permit> next(std::size_t* posp);
    void                        complete(std::size_t pos, const Result_promise<T>&);

    // Data
    Worker_dispatcher               dispatcher;
    std::vector<Task<T>>            tasks;
    Semaphore                       permits;
    Result_slots<T>                 slots;
    Result_promise<std::vector<T>>  results;
    std::size_t                     nextpos;
    bool                            is_failed;
    Mutex                           mutex;
};


}   // Implementation Details
}   // Concurrency
}   // Relay

#include "relay/concurrency/limiter.inl"

#endif  // RELAY_CONCURRENCY_LIMITER_HPP

//  $CUSTOM_FOOTER$
