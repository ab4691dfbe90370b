//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/channel.hpp
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

#ifndef RELAY_CONCURRENCY_CHANNEL_HPP
#define RELAY_CONCURRENCY_CHANNEL_HPP

#include "relay/concurrency/config.hpp"
#include "relay/concurrency/error.hpp"
#include "relay/concurrency/log.hpp"
#include "relay/concurrency/sequence.hpp"
#include "relay/concurrency/types.hpp"
#include "boost/operators.hpp"
#include "boost/optional.hpp"
#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <limits>
#include <memory>
#include <mutex>
#include <queue>
#include <random>
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
template<class T> Channel<T> make_channel();
template<class T> Channel<T> make_buffered_channel(Channel_size capacity);


/*
    Implementation Details
*/
namespace Detail {


template<class T> class Selector;
template<class T> Channel<T> make_unbounded_channel();
RELAY_CONCURRENCY_DECL Channel_size random(Channel_size min, Channel_size max);


}   // Implementation Details


/*
    Channel

    A Channel is a handle to a FIFO queue shared by any number of sending
    and receiving threads.  An unbuffered channel is a rendezvous: a send
    completes only when a receiver takes the value.  A buffered channel
    accepts sends until its buffer is full.

    Closing a channel fails every waiting receiver and blocked sender with
    Channel_closed and refuses further sends; values already buffered can
    still be received in order.
*/
template<class T>
class Channel : boost::totally_ordered<Channel<T>> {
public:
    // Names/Types
    using Value = T;

    // Construct/Copy
    Channel() = default;
    Channel(const Channel&) = default;
    Channel& operator=(const Channel&) = default;
    Channel(Channel&&);
    Channel& operator=(Channel&&);
    template<class U> friend Channel<U> make_channel();
    template<class U> friend Channel<U> make_buffered_channel(Channel_size capacity);
    template<class U> friend Channel<U> Detail::make_unbounded_channel();
    inline friend void swap(Channel& x, Channel& y) {
        using std::swap;
        swap(x.pimpl, y.pimpl);
    }

    // Size and Capacity
    Channel_size    size() const;
    Channel_size    capacity() const;
    bool            is_empty() const;
    bool            is_full() const;

    // Send/Receive
    void        send(const T&) const;
    void        send(T&&) const;
    bool        try_send(const T&) const;
    bool        try_send(T&&) const;
    T           receive() const;
    optional<T> try_receive() const;

    // Closing
    void close() const;
    bool is_closed() const;

    // Sequence View
    Sequence<T> sequence() const;

    // Conversions
    explicit operator bool() const;

    // Comparisons
    inline friend bool operator==(const Channel& x, const Channel& y) { return x.pimpl == y.pimpl; }
    inline friend bool operator< (const Channel& x, const Channel& y) { return x.pimpl < y.pimpl; }

    // Friends
    friend class Detail::Selector<T>;

private:
    // Names/Types
    using Mutex     = std::mutex;
    using Lock      = std::unique_lock<Mutex>;
    using Condition = std::condition_variable;

    enum class Io_status : int { waiting, done, closed };

    class Buffer {
    public:
        // Construct
        explicit Buffer(Channel_size maxsize);

        // Size and Capacity
        Channel_size    size() const;
        Channel_size    capacity() const;
        bool            is_empty() const;
        bool            is_full() const;

        // Queue Operations
        bool push(T* valuep);
        bool pop(optional<T>* valuep);

    private:
        // Data
        std::queue<T>   elemq;
        Channel_size    sizemax;
    };

    class Sender : boost::equality_comparable<Sender> {
    public:
        // Construct
        Sender(Condition* waitp, T* valuep, Io_status* statusp);

        // Completion
        template<class U> bool  dequeue(U* recvbufp) const;
        void                    close() const;

        // Comparisons
        inline friend bool operator==(const Sender& x, const Sender& y) {
            if (x.readyp != y.readyp) return false;
            if (x.valp != y.valp) return false;
            return true;
        }

    private:
        // Data Transfer
        static void move(T* valp, optional<T>* destp);
        static void move(T* valp, Buffer* destp);

        // Data
        Condition*  readyp;
        T*          valp;
        Io_status*  statusp;
    };

    class Receiver : boost::equality_comparable<Receiver> {
    public:
        // Construct
        Receiver(Condition* waitp, optional<T>* valuep, Io_status* statusp);
        Receiver(Detail::Selector<T>*, Channel_size pos);

        // Completion
        bool dequeue(T* sendbufp) const;
        void close() const;

        // Comparisons
        inline friend bool operator==(const Receiver& x, const Receiver& y) {
            if (x.readyp != y.readyp) return false;
            if (x.valp != y.valp) return false;
            if (x.selp != y.selp) return false;
            if (x.oper != y.oper) return false;
            return true;
        }

    private:
        // Data
        Condition*              readyp;
        optional<T>*            valp;
        Io_status*              statusp;
        Detail::Selector<T>*    selp;
        Channel_size            oper;
    };

    template<class U>
    class Io_queue {
    private:
        // Names/Types
        using Waiter_deque = std::deque<U>;

        // Data
        Waiter_deque waiters;

    public:
        // Names/Types
        using Waiter = U;

        // Size and Capacity
        bool is_empty() const;

        // Queue Operations
        void    push(const Waiter&);
        Waiter  pop();
        bool    erase(const Waiter&);
        bool    is_found(const Waiter&) const;
    };

    // Names/Types
    using Sender_queue      = Io_queue<Sender>;
    using Receiver_queue    = Io_queue<Receiver>;

    class Impl {
    public:
        // Construct
        explicit Impl(Channel_size bufsize);

        // Size and Capacity
        Channel_size    size() const;
        Channel_size    capacity() const;
        bool            is_empty() const;
        bool            is_full() const;

        // Send/Receive
        void        send(T* valuep);
        bool        try_send(T* valuep);
        optional<T> receive();
        optional<T> try_receive();

        // Closing
        void close();
        bool is_closed() const;

        // Selection (channel must be locked)
        void lock();
        void unlock();
        bool is_readable() const;
        bool is_drained() const;
        bool read(optional<T>* valuep);
        void enqueue_select(Detail::Selector<T>*, Channel_size pos);
        bool dequeue_select(Detail::Selector<T>*, Channel_size pos);

    private:
        // Non-Blocking I/O
        bool write(T* valuep);

        // Blocking I/O
        template<class U> static bool   dequeue(Sender_queue*, U* recvbufp);
        static bool                     dequeue(Receiver_queue*, T* sendbufp);
        static void                     wait_for_sender(Receiver_queue*, optional<T>* recvbufp, Lock*);
        static void                     wait_for_receiver(Sender_queue*, T* sendbufp, Lock*);

        // Data
        Buffer          buffer;
        Sender_queue    senders;
        Receiver_queue  receivers;
        bool            isclosed;
        mutable Mutex   mutex;
    };

    using Impl_ptr = std::shared_ptr<Impl>;

    // Construct
    explicit Channel(Impl_ptr);

    // Data
    Impl_ptr pimpl;
};


/*
    Implementation Details
*/
namespace Detail {


/*
    Channel Selector

    Waits on a set of channels at once and takes exactly one value from
    whichever becomes readable first.  While waiting, the selector sits in
    the receive queue of every live channel; a sender that reaches a
    selector which has already chosen moves on to the next receiver.

    An optional stop channel, which is never sent to, cancels the wait when
    it is closed.  It does not count as a live source.
*/
template<class T>
class Selector {
public:
    // Names/Types
    using Channel_vector = std::vector<Channel<T>>;

    // Selection
    static optional<Selection<T>> select(const Channel_vector&);
    static optional<Selection<T>> select(const Channel_vector&, const Channel<T>& stop);
    static optional<Selection<T>> try_select(const Channel_vector&);

    // Completion (channel must be locked)
    bool complete(Channel_size pos, T* valuep);
    void notify_closed(Channel_size pos);

private:
    // Names/Types
    using Mutex     = std::mutex;
    using Lock      = std::unique_lock<Mutex>;
    using Condition = std::condition_variable;
    using Impl      = typename Channel<T>::Impl;

    class Operation {
    public:
        // Construct
        Operation(Impl*, Channel_size pos);

        // Data
        Impl*           chanp;
        Channel_size    pos;
    };

    using Operation_vector = std::vector<Operation>;

    class Channel_locks {
    public:
        // Construct/Copy/Destroy
        explicit Channel_locks(const Operation_vector&);
        Channel_locks(const Channel_locks&) = delete;
        Channel_locks& operator=(const Channel_locks&) = delete;
        ~Channel_locks();

    private:
        // Data
        const Operation_vector& ops;
    };

    // Construct/Copy
    explicit Selector(Channel_size stoppos);
    Selector(const Selector&) = delete;
    Selector& operator=(const Selector&) = delete;

    // Selection
    static optional<Selection<T>>   wait_select(const Channel_vector&, Channel_size stoppos);
    static Operation_vector         make_operations(const Channel_vector&);
    static Channel_size             count_ready(const Operation_vector&);
    static const Operation*         pick_ready(const Operation_vector&, Channel_size nready);
    static optional<Selection<T>>   select_ready(const Operation_vector&);

    // Waiting
    Channel_size            enqueue(const Operation_vector&);
    void                    dequeue(const Operation_vector&);
    void                    wait();
    optional<Selection<T>>  selection();

    // Data
    const Channel_size  stoppos;
    Channel_size        winner;
    optional<T>         value;
    Channel_size        nlive;
    Mutex               mutex;
    Condition           ready;
};


}   // Implementation Details
}   // Concurrency
}   // Relay

#include "relay/concurrency/channel.inl"

#endif  // RELAY_CONCURRENCY_CHANNEL_HPP

//  $CUSTOM_FOOTER$
