//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  src/relay/concurrency/dispatcher.cpp
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

#include "relay/concurrency/dispatcher.hpp"
#include <exception>
#include <memory>
#include <thread>
#include <utility>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Worker Registry
*/
Worker_registry::Worker_registry()
    : nextid{1}
{
}


bool
Worker_registry::erase(Worker_id id)
{
    const Lock lock{mutex};
    return workers.erase(id) > 0;
}


Worker_id
Worker_registry::insert(const std::string& name)
{
    const Lock      lock{mutex};
    const Worker_id id = nextid++;

    workers.emplace(id, name);
    return id;
}


std::vector<std::string>
Worker_registry::names() const
{
    std::vector<std::string>    result;
    const Lock                  lock{mutex};

    result.reserve(workers.size());
    for (const auto& w : workers)
        result.push_back(w.second);

    return result;
}


std::size_t
Worker_registry::release_all()
{
    const Lock          lock{mutex};
    const std::size_t   n = workers.size();

    workers.clear();
    return n;
}


std::size_t
Worker_registry::size() const
{
    const Lock lock{mutex};
    return workers.size();
}


/*
    Thread Platform Worker
*/
Thread_platform::Worker::Worker(std::thread&& t, Done_flag done)
    : thread{std::move(t)}
    , isdone{std::move(done)}
{
}


/*
    Thread Platform
*/
Thread_platform::~Thread_platform()
{
    Worker_list finishing;

    {
        const Lock lock{mutex};
        finishing.swap(workers);
    }

    for (Worker& w : finishing)
        join(&w);
}


void
Thread_platform::join(Worker* wp)
{
    if (wp->thread.joinable()) {
        // A worker can release the last reference to its own platform.
        if (wp->thread.get_id() == std::this_thread::get_id())
            wp->thread.detach();
        else
            wp->thread.join();
    }
}


void
Thread_platform::reap()
{
    const std::thread::id self = std::this_thread::get_id();

    for (auto wp = workers.begin(); wp != workers.end();) {
        if (*wp->isdone && wp->thread.get_id() != self) {
            join(&*wp);
            wp = workers.erase(wp);
        } else
            ++wp;
    }
}


std::size_t
Thread_platform::size() const
{
    const Lock lock{mutex};
    return workers.size();
}


void
Thread_platform::spawn(const std::string& name, Entry entry)
{
    const Done_flag isdone = std::make_shared<std::atomic<bool>>(false);
    std::thread     thread{[entry, isdone]{
        entry();
        *isdone = true;
    }};
    const Lock      lock{mutex};

    logger()->trace("thread {} runs worker '{}'", std::hash<std::thread::id>()(thread.get_id()), name);
    reap();
    workers.emplace_back(std::move(thread), isdone);
}


/*
    Worker Dispatcher Implementation
*/
Worker_dispatcher::Impl::Impl(Platform_ptr platform, Registry_ptr registry, const Dispatcher_options& options)
    : loopp{std::make_unique<Detail::Delivery_loop>()}
    , platformp{std::move(platform)}
    , registryp{std::move(registry)}
    , opts{options}
    , nextname{0}
{
}


std::string
Worker_dispatcher::Impl::make_name()
{
    return opts.name_prefix + std::to_string(nextname++);
}


/*
    Worker Dispatcher
*/
Worker_dispatcher::Worker_dispatcher()
    : Worker_dispatcher(Dispatcher_options())
{
}


Worker_dispatcher::Worker_dispatcher(const Dispatcher_options& options)
    : Worker_dispatcher(std::make_shared<Thread_platform>(), std::make_shared<Worker_registry>(), options)
{
}


Worker_dispatcher::Worker_dispatcher(Platform_ptr platform, Registry_ptr registry, const Dispatcher_options& options)
{
    if (!platform || !registry)
        throw Usage_error("a dispatcher needs a worker platform and a registry");

    pimpl = std::make_shared<Impl>(std::move(platform), std::move(registry), options);
}


std::size_t
Worker_dispatcher::active_worker_count() const
{
    return pimpl->registryp->size();
}


std::vector<std::string>
Worker_dispatcher::active_worker_names() const
{
    return pimpl->registryp->names();
}


void
Worker_dispatcher::kill_all() const
{
    const std::size_t n = pimpl->registryp->release_all();

    logger()->warn("abandoned {} active worker(s); their results will be discarded", n);
}


const Dispatcher_options&
Worker_dispatcher::options() const
{
    return pimpl->opts;
}


/*
    Implementation Details
*/
namespace Detail {


/*
    Delivery Loop
*/
Delivery_loop::Delivery_loop()
    : q{make_unbounded_channel<Delivery>()}
{
    const Channel<Delivery> inbox = q;

    worker = std::thread{[inbox]{ run(inbox); }};
}


Delivery_loop::~Delivery_loop()
{
    q.close();

    // The last dispatcher handle can be released by a delivery.
    if (worker.get_id() == std::this_thread::get_id())
        worker.detach();
    else
        worker.join();
}


Channel<Delivery_loop::Delivery>
Delivery_loop::inbox() const
{
    return q;
}


void
Delivery_loop::run(const Channel<Delivery>& inbox)
{
    for (const Delivery& deliver : inbox.sequence()) {
        try {
            deliver();
        } catch (const std::exception& e) {
            logger()->error("completion callback failed: {}", e.what());
        }
    }
}


/*
    Failure Tally
*/
Failure_tally::Failure_tally(std::size_t n)
    : ntotal{n}
    , nfailed{0}
{
}


std::size_t
Failure_tally::count() const
{
    const Lock lock{mutex};
    return nfailed;
}


exception_ptr
Failure_tally::last() const
{
    const Lock lock{mutex};
    return lastp;
}


bool
Failure_tally::record(exception_ptr ep)
{
    const Lock lock{mutex};

    lastp = ep;
    return ++nfailed == ntotal;
}


}   // Implementation Details
}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
