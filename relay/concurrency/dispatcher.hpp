//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/dispatcher.hpp
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

#ifndef RELAY_CONCURRENCY_DISPATCHER_HPP
#define RELAY_CONCURRENCY_DISPATCHER_HPP

#include "relay/concurrency/channel.hpp"
#include "relay/concurrency/config.hpp"
#include "relay/concurrency/error.hpp"
#include "relay/concurrency/log.hpp"
#include "relay/concurrency/promise.hpp"
#include "relay/concurrency/types.hpp"
#include "boost/operators.hpp"
#include "boost/optional.hpp"
#include "spdlog/common.h"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
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
    Implementation Details
*/
namespace Detail {


class Delivery_loop;


}   // Implementation Details


/*
    Dispatcher Options
*/
class Dispatcher_options {
public:
    // Data
    std::string                 name_prefix     = "worker_";
    spdlog::level::level_enum   lifecycle_level = spdlog::level::debug;
};


/*
    Worker Message

    The single message a worker leaves on its private port: the task's
    value or the failure it raised.
*/
template<class T>
class Worker_message {
public:
    // Construct
    static Worker_message success(T&&);
    static Worker_message failure(exception_ptr);

    // Observers
    bool            is_success() const;
    T&              value();
    exception_ptr   error() const;

private:
    // Construct
    Worker_message(optional<T>&&, exception_ptr);

    // Data
    optional<T>     val;
    exception_ptr   errorp;
};


/*
    Worker Registry

    Records the workers a dispatcher has in flight.  A worker leaves the
    registry either when its result is delivered or when the registry is
    cleared by kill_all(); whichever happens first decides whether the
    result is delivered at all.
*/
class RELAY_CONCURRENCY_DECL Worker_registry {
public:
    // Construct/Copy
    Worker_registry();
    Worker_registry(const Worker_registry&) = delete;
    Worker_registry& operator=(const Worker_registry&) = delete;

    // Registration
    Worker_id   insert(const std::string& name);
    bool        erase(Worker_id);
    std::size_t release_all();

    // Observers
    std::size_t                 size() const;
    std::vector<std::string>    names() const;

private:
    // Names/Types
    using Mutex     = std::mutex;
    using Lock      = std::lock_guard<Mutex>;
    using Name_map  = std::map<Worker_id, std::string>;

    // Data
    Name_map        workers;
    Worker_id       nextid;
    mutable Mutex   mutex;
};


/*
    Worker Platform

    The primitive a dispatcher uses to run a worker body.
*/
class RELAY_CONCURRENCY_DECL Worker_platform {
public:
    // Names/Types
    using Entry = std::function<void()>;

    // Destroy
    virtual ~Worker_platform() = default;

    // Spawning
    virtual void spawn(const std::string& name, Entry) = 0;
};


/*
    Thread Platform

    Runs each worker on its own thread.  Finished threads are joined as new
    workers are spawned; the remainder are joined on destruction.
*/
class RELAY_CONCURRENCY_DECL Thread_platform : public Worker_platform {
public:
    // Construct/Copy/Destroy
    Thread_platform() = default;
    Thread_platform(const Thread_platform&) = delete;
    Thread_platform& operator=(const Thread_platform&) = delete;
    ~Thread_platform() override;

    // Spawning
    void spawn(const std::string& name, Entry) override;

    // Observers
    std::size_t size() const;

private:
    // Names/Types
    using Mutex     = std::mutex;
    using Lock      = std::lock_guard<Mutex>;
    using Done_flag = std::shared_ptr<std::atomic<bool>>;

    class Worker {
    public:
        // Construct
        Worker(std::thread&&, Done_flag);

        // Data
        std::thread thread;
        Done_flag   isdone;
    };

    using Worker_list = std::list<Worker>;

    // Reaping
    void        reap();
    static void join(Worker*);

    // Data
    Worker_list     workers;
    mutable Mutex   mutex;
};


/*
    Worker Dispatcher

    Runs tasks as isolated workers and reports each result through a
    Result_promise.  A task's exception is captured at the worker boundary
    and delivered as a Task_failure; it never escapes into the dispatcher
    or a sibling worker.  Copies of a dispatcher share its platform and
    registry.

    Workers touch neither the registry nor their promise.  Each leaves its
    message on a private port, and the dispatcher's delivery loop reads the
    port, updates the registry, and completes the promise; completion
    callbacks therefore run on the delivery loop's thread.
*/
class RELAY_CONCURRENCY_DECL Worker_dispatcher : boost::equality_comparable<Worker_dispatcher> {
public:
    // Names/Types
    using Platform_ptr = std::shared_ptr<Worker_platform>;
    using Registry_ptr = std::shared_ptr<Worker_registry>;

    // Construct/Copy
    Worker_dispatcher();
    explicit Worker_dispatcher(const Dispatcher_options&);
    Worker_dispatcher(Platform_ptr, Registry_ptr, const Dispatcher_options& = Dispatcher_options());

    // Launching
    template<class Fun> Result_promise<std::result_of_t<Fun()>> launch(Fun) const;
    template<class Fun> Result_promise<std::result_of_t<Fun()>> launch(Fun, const std::string& name) const;
    template<class T> Result_promise<std::vector<T>>            launch_all(const std::vector<Task<T>>&) const;
    template<class T> Result_promise<T>                         race(const std::vector<Task<T>>&) const;

    // Termination
    void kill_all() const;

    // Observers
    std::size_t                 active_worker_count() const;
    std::vector<std::string>    active_worker_names() const;
    const Dispatcher_options&   options() const;

    // Comparisons
    inline friend bool operator==(const Worker_dispatcher& x, const Worker_dispatcher& y) {
        return x.pimpl == y.pimpl;
    }

private:
    // Names/Types
    class Impl {
    public:
        // Construct
        Impl(Platform_ptr, Registry_ptr, const Dispatcher_options&);

        // Naming
        std::string make_name();

        // Data
        std::unique_ptr<Detail::Delivery_loop>  loopp;     // destroyed after the platform
        Platform_ptr                            platformp;
        Registry_ptr                            registryp;
        Dispatcher_options                      opts;
        std::atomic<std::uint64_t>              nextname;
    };

    using Impl_ptr = std::shared_ptr<Impl>;

    // Worker Execution
    template<class Fun, class T> static void    run(Fun&, const std::string& name, const Channel<Worker_message<T>>& port);
    template<class T> static void               deliver(const Channel<Worker_message<T>>& port, const Registry_ptr&, Worker_id, const std::string& name, const Result_promise<T>&, spdlog::level::level_enum);

    // Data
    Impl_ptr pimpl;
};


/*
    Implementation Details
*/
namespace Detail {


/*
    Delivery Loop

    The dispatcher's own thread for finished workers.  A worker posts a
    delivery that reads its port; the loop runs deliveries in the order
    they arrive.  The destructor closes the inbox, runs whatever is still
    queued, and joins the thread.
*/
class RELAY_CONCURRENCY_DECL Delivery_loop {
public:
    // Names/Types
    using Delivery = std::function<void()>;

    // Construct/Copy/Destroy
    Delivery_loop();
    Delivery_loop(const Delivery_loop&) = delete;
    Delivery_loop& operator=(const Delivery_loop&) = delete;
    ~Delivery_loop();

    // Posting
    Channel<Delivery> inbox() const;

private:
    // Delivery
    static void run(const Channel<Delivery>&);

    // Data
    Channel<Delivery>   q;
    std::thread         worker;
};


/*
    Result Slots

    Index-addressed storage for results that arrive out of order.
*/
template<class T>
class Result_slots {
public:
    // Construct/Copy
    explicit Result_slots(std::size_t n);
    Result_slots(const Result_slots&) = delete;
    Result_slots& operator=(const Result_slots&) = delete;

    // Storage
    bool            store(std::size_t pos, T&&);
    std::vector<T>  release();

private:
    // Names/Types
    using Mutex = std::mutex;
    using Lock  = std::lock_guard<Mutex>;

    // Data
    std::vector<optional<T>>    slots;
    std::size_t                 nfilled;
    Mutex                       mutex;
};


/*
    Failure Tally
*/
class RELAY_CONCURRENCY_DECL Failure_tally {
public:
    // Construct/Copy
    explicit Failure_tally(std::size_t n);
    Failure_tally(const Failure_tally&) = delete;
    Failure_tally& operator=(const Failure_tally&) = delete;

    // Recording
    bool record(exception_ptr);

    // Observers
    std::size_t     count() const;
    exception_ptr   last() const;

private:
    // Names/Types
    using Mutex = std::mutex;
    using Lock  = std::lock_guard<Mutex>;

    // Data
    const std::size_t   ntotal;
    std::size_t         nfailed;
    exception_ptr       lastp;
    mutable Mutex       mutex;
};


}   // Implementation Details
}   // Concurrency
}   // Relay

#include "relay/concurrency/dispatcher.inl"

#endif  // RELAY_CONCURRENCY_DISPATCHER_HPP

//  $CUSTOM_FOOTER$
