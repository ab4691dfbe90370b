//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/semaphore.hpp
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

#ifndef RELAY_CONCURRENCY_SEMAPHORE_HPP
#define RELAY_CONCURRENCY_SEMAPHORE_HPP

#include "relay/concurrency/config.hpp"
#include "relay/concurrency/types.hpp"
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Semaphore

    A counting semaphore with a FIFO queue of waiting threads.  A release
    with waiters present hands its permit directly to the oldest waiter
    instead of returning it to the pool, so a late arrival can never
    overtake a thread that is already queued.
*/
class RELAY_CONCURRENCY_DECL Semaphore {
public:
    // Names/Types
    class Permit;
    using Size = std::ptrdiff_t;

    // Construct/Copy/Destroy
    explicit Semaphore(Size maxcount);
    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    // Acquire/Release
    void acquire();
    bool try_acquire();
    void release();

    // Scoped Acquisition
    Permit              make_permit();
    optional<Permit>    try_make_permit();

    // Observers
    Size available() const;
    Size max_count() const;
    Size waiting() const;

private:
    // Names/Types
    using Mutex     = std::mutex;
    using Lock      = std::unique_lock<Mutex>;
    using Condition = std::condition_variable;

    class Waiter {
    public:
        // Construct
        Waiter();

        // Data
        Condition   ready;
        bool        isgranted;
    };

    using Waiter_queue = std::deque<Waiter*>;

    // Data
    const Size      countmax;
    Size            permits;
    Waiter_queue    waiters;
    mutable Mutex   mutex;
};


/*
    Semaphore Permit

    Owns one permit of a Semaphore and returns it when released or
    destroyed, whichever comes first.
*/
class RELAY_CONCURRENCY_DECL Semaphore::Permit {
public:
    // Construct/Move/Destroy
    Permit();
    Permit(Permit&&);
    Permit& operator=(Permit&&);
    Permit(const Permit&) = delete;
    Permit& operator=(const Permit&) = delete;
    ~Permit();

    // Release
    void release();

    // Observers
    bool is_held() const;

    // Friends
    friend class Semaphore;

private:
    // Construct
    explicit Permit(Semaphore*);

    // Data
    Semaphore* semp;
};


}   // Concurrency
}   // Relay

#endif  // RELAY_CONCURRENCY_SEMAPHORE_HPP

//  $CUSTOM_FOOTER$
