//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  src/relay/concurrency/semaphore.cpp
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

#include "relay/concurrency/semaphore.hpp"
#include "relay/concurrency/error.hpp"
#include <utility>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Semaphore Waiter
*/
Semaphore::Waiter::Waiter()
    : isgranted{false}
{
}


/*
    Semaphore
*/
Semaphore::Semaphore(Size maxcount)
    : countmax{maxcount}
    , permits{maxcount}
{
    if (maxcount <= 0)
        throw Usage_error("semaphore count must be positive");
}


void
Semaphore::acquire()
{
    Lock lock{mutex};

    if (permits > 0)
        --permits;
    else {
        Waiter w;

        // Wait for a release to hand over its permit.
        waiters.push_back(&w);
        w.ready.wait(lock, [&]{ return w.isgranted; });
    }
}


Semaphore::Size
Semaphore::available() const
{
    const Lock lock{mutex};
    return permits;
}


Semaphore::Permit
Semaphore::make_permit()
{
    acquire();
    return Permit(this);
}


Semaphore::Size
Semaphore::max_count() const
{
    return countmax;
}


void
Semaphore::release()
{
    const Lock lock{mutex};

    if (!waiters.empty()) {
        Waiter* wp = waiters.front();

        // Notify while locked; the waiter is gone once it sees the grant.
        waiters.pop_front();
        wp->isgranted = true;
        wp->ready.notify_one();
    } else if (permits < countmax)
        ++permits;
    else
        throw Usage_error("semaphore released more often than acquired");
}


bool
Semaphore::try_acquire()
{
    const Lock lock{mutex};
    const bool is_acquired = permits > 0;

    if (is_acquired)
        --permits;

    return is_acquired;
}


optional<Semaphore::Permit>
Semaphore::try_make_permit()
{
    optional<Permit> permit;

    if (try_acquire())
        permit = Permit(this);

    return permit;
}


Semaphore::Size
Semaphore::waiting() const
{
    const Lock lock{mutex};
    return static_cast<Size>(waiters.size());
}


/*
    Semaphore Permit
*/
Semaphore::Permit::Permit()
    : semp{nullptr}
{
}


Semaphore::Permit::Permit(Semaphore* sp)
    : semp{sp}
{
}


Semaphore::Permit::Permit(Permit&& other)
    : semp{other.semp}
{
    other.semp = nullptr;
}


Semaphore::Permit&
Semaphore::Permit::operator=(Permit&& other)
{
    if (this != &other) {
        release();
        semp = other.semp;
        other.semp = nullptr;
    }

    return *this;
}


Semaphore::Permit::~Permit()
{
    release();
}


bool
Semaphore::Permit::is_held() const
{
    return semp != nullptr;
}


void
Semaphore::Permit::release()
{
    if (semp) {
        Semaphore* sp = semp;

        semp = nullptr;
        sp->release();
    }
}


}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
