//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/promise.hpp
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

#ifndef RELAY_CONCURRENCY_PROMISE_HPP
#define RELAY_CONCURRENCY_PROMISE_HPP

#include "relay/concurrency/config.hpp"
#include "relay/concurrency/error.hpp"
#include "relay/concurrency/types.hpp"
#include "boost/operators.hpp"
#include "boost/optional.hpp"
#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Names/Types
*/
enum class Promise_state : int { pending, fulfilled, failed };


/*
    Implementation Details
*/
namespace Detail {


template<class T> class Promise_link;


}   // Implementation Details


/*
    Result Promise

    A Result_promise is a handle to a one-shot result slot shared by the
    producer of a value and any number of consumers.  The first completion
    (value or error) wins; later completions are ignored.  Copies refer to
    the same slot.

    Continuations (map, flat_map, or_else, also, filter, take_if) return a
    new promise completed from this one.  A continuation keeps its source
    alive, but not the other way round: releasing every handle to the
    continuation abandons the source as well.
*/
template<class T>
class Result_promise : boost::equality_comparable<Result_promise<T>> {
public:
    // Names/Types
    using Value         = T;
    using Callback      = std::function<void(const Result_promise&)>;
    using Abandon_hook  = std::function<void()>;

    // Construct/Copy
    Result_promise();
    Result_promise(const Result_promise&) = default;
    Result_promise& operator=(const Result_promise&) = default;
    Result_promise(Result_promise&&);
    Result_promise& operator=(Result_promise&&);
    inline friend void swap(Result_promise& x, Result_promise& y) {
        using std::swap;
        swap(x.pimpl, y.pimpl);
    }

    // Completion
    bool fulfill(const T&) const;
    bool fulfill(T&&) const;
    bool fail(exception_ptr) const;

    // Observers
    Promise_state   state() const;
    bool            is_ready() const;

    // Result Access
    T               get() const;
    optional<T>     try_get() const;
    void            wait() const;
    bool            wait_for(Duration) const;
    exception_ptr   error() const;

    // Continuation
    void                                                            on_complete(Callback) const;
    template<class Fun> Result_promise<std::result_of_t<Fun(T)>>    map(Fun) const;
    template<class Fun> std::result_of_t<Fun(T)>                    flat_map(Fun) const;
    Result_promise                                                  or_else(const T& fallback) const;
    template<class Fun> Result_promise                              also(Fun) const;
    template<class Pred> Result_promise                             filter(Pred) const;
    template<class Pred> Result_promise<optional<T>>                take_if(Pred) const;

    // Abandonment
    void on_abandon(Abandon_hook) const;

    // Comparisons
    inline friend bool operator==(const Result_promise& x, const Result_promise& y) {
        return x.pimpl == y.pimpl;
    }

    // Friends
    template<class U> friend class Result_promise;
    friend class Detail::Promise_link<T>;

private:
    // Names/Types
    using Mutex         = std::mutex;
    using Lock          = std::unique_lock<Mutex>;
    using Condition     = std::condition_variable;
    using Callback_list = std::vector<Callback>;
    using Hook_list     = std::vector<Abandon_hook>;
    using Anchor_list   = std::vector<std::shared_ptr<void>>;

    class Impl {
    public:
        // Construct/Copy/Destroy
        Impl();
        Impl(const Impl&) = delete;
        Impl& operator=(const Impl&) = delete;
        ~Impl();

        // Completion
        template<class U> bool  complete(U* valuep, exception_ptr, Callback_list*);
        bool                    subscribe(const Callback&);

        // Lifetime
        void add_hook(Abandon_hook);
        void retain(std::shared_ptr<void>);

        // Observers
        Promise_state   state() const;
        exception_ptr   error() const;

        // Result Access
        T               get();
        optional<T>     try_get();
        void            wait();
        bool            wait_for(Duration);

    private:
        // Result Access
        T get_ready() const;

        // Data
        optional<T>         value;
        exception_ptr       errorp;
        Promise_state       status;
        Callback_list       callbacks;
        Hook_list           hooks;
        Anchor_list         anchors;
        mutable Mutex       mutex;
        Condition           ready;
    };

    using Impl_ptr = std::shared_ptr<Impl>;

    // Construct
    explicit Result_promise(Impl_ptr);

    // Completion
    template<class U> bool  complete(U* valuep, exception_ptr) const;
    void                    notify(const Callback_list&) const;

    // Continuation
    template<class U> Detail::Promise_link<U>   make_continuation(Result_promise<U>*) const;
    template<class U, class Fun> static void    settle(const Detail::Promise_link<U>&, Fun);

    // Data
    Impl_ptr pimpl;
};


/*
    Implementation Details
*/
namespace Detail {


/*
    Promise Link

    A weak reference to a promise, held by a producer that should not keep
    the promise alive on its own.  Completing through a link whose promise
    has been released does nothing.
*/
template<class T>
class Promise_link {
public:
    // Construct
    Promise_link() = default;
    explicit Promise_link(const Result_promise<T>&);

    // Completion
    bool fulfill(T&&) const;
    bool fail(exception_ptr) const;

    // Observers
    bool                        is_expired() const;
    optional<Result_promise<T>> lock() const;

private:
    // Names/Types
    using Impl = typename Result_promise<T>::Impl;

    // Data
    std::weak_ptr<Impl> implp;
};


}   // Implementation Details
}   // Concurrency
}   // Relay

#include "relay/concurrency/promise.inl"

#endif  // RELAY_CONCURRENCY_PROMISE_HPP

//  $CUSTOM_FOOTER$
