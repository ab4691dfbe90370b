//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/linked_channel.hpp
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

#ifndef RELAY_CONCURRENCY_LINKED_CHANNEL_HPP
#define RELAY_CONCURRENCY_LINKED_CHANNEL_HPP

#include "relay/concurrency/channel.hpp"
#include "relay/concurrency/config.hpp"
#include "relay/concurrency/error.hpp"
#include "relay/concurrency/log.hpp"
#include "relay/concurrency/sequence.hpp"
#include "relay/concurrency/types.hpp"
#include "boost/operators.hpp"
#include "boost/optional.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <tuple>
#include <utility>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Names/Types
*/
template<class T> std::pair<Linked_channel<T>, Linked_channel<T>> make_linked_channels();


/*
    Implementation Details
*/
namespace Detail {


/*
    Envelope

    A message carried by a transport: either a data value or a close
    signal, stamped with the transport's sequence number.
*/
template<class T>
class Envelope {
public:
    // Names/Types
    enum class Kind : int { data, close };

    // Construct
    Envelope(Kind, std::uint64_t seqno, optional<T>&& value);

    // Observers
    Kind            kind() const;
    std::uint64_t   sequence() const;
    optional<T>&    value();

private:
    // Data
    Kind            type;
    std::uint64_t   seq;
    optional<T>     val;
};


/*
    Message Transport

    Delivers envelopes in FIFO order on a dedicated thread.  The destructor
    delivers whatever is still queued before joining the thread.
*/
template<class T>
class Message_transport {
public:
    // Names/Types
    using Kind      = typename Envelope<T>::Kind;
    using Handler   = std::function<void(Envelope<T>&&)>;

    // Construct/Copy/Destroy
    explicit Message_transport(Handler);
    Message_transport(const Message_transport&) = delete;
    Message_transport& operator=(const Message_transport&) = delete;
    ~Message_transport();

    // Posting
    std::uint64_t post(Kind, optional<T>&& value);

private:
    // Names/Types
    using Mutex     = std::mutex;
    using Lock      = std::unique_lock<Mutex>;
    using Condition = std::condition_variable;

    // Delivery
    void                    interrupt();
    optional<Envelope<T>>   pop();
    void                    run();

    // Data
    Handler                     deliver;
    std::deque<Envelope<T>>     q;
    std::uint64_t               nextseq;
    bool                        is_interrupt;
    Mutex                       mutex;
    Condition                   ready;
    std::thread                 worker;
};


/*
    Channel Link

    The shared state behind a pair of linked endpoints.  Each side owns an
    inbound buffer; each direction has its own transport.  A close is sent
    to the peer as a message and takes effect there on receipt.  Data that
    reaches a side after it has closed is discarded.
*/
template<class T>
class Link {
public:
    // Construct/Copy
    Link();
    Link(const Link&) = delete;
    Link& operator=(const Link&) = delete;

    // Send/Receive
    bool        send(int side, T* valuep);
    Channel<T>  inbound(int side) const;

    // Closing
    void close(int side);
    bool is_closed(int side) const;

private:
    // Names/Types
    using Mutex         = std::mutex;
    using Lock          = std::lock_guard<Mutex>;
    using Transport     = Message_transport<T>;
    using Transport_ptr = std::unique_ptr<Transport>;
    using Kind          = typename Envelope<T>::Kind;

    class Endpoint {
    public:
        // Construct
        Endpoint();

        // Data
        Channel<T>  inq;
        bool        is_local_closed;
        bool        is_peer_closed;
    };

    // Delivery
    void deliver(int side, Envelope<T>&&);

    // Data
    Endpoint        ends[2];
    mutable Mutex   mutex;
    Transport_ptr   transports[2];
};


}   // Implementation Details


/*
    Linked Channel

    One end of a pair of channels joined by a message transport, for
    passing values between workers that share no memory.  Values sent on
    one end are buffered at the other without blocking the sender.
    Closing an end stops its own sends at once; the peer observes the
    closure only after the close message has been delivered to it.
*/
template<class T>
class Linked_channel : boost::totally_ordered<Linked_channel<T>> {
public:
    // Names/Types
    using Value = T;

    // Construct/Copy
    Linked_channel();
    template<class U> friend std::pair<Linked_channel<U>, Linked_channel<U>> make_linked_channels();

    // Size and Capacity
    Channel_size    size() const;
    bool            is_empty() const;

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
    inline friend bool operator==(const Linked_channel& x, const Linked_channel& y) {
        return x.linkp == y.linkp && x.side == y.side;
    }
    inline friend bool operator<(const Linked_channel& x, const Linked_channel& y) {
        return std::tie(x.linkp, x.side) < std::tie(y.linkp, y.side);
    }

private:
    // Names/Types
    using Link_ptr = std::shared_ptr<Detail::Link<T>>;

    // Construct
    Linked_channel(Link_ptr, int side);

    // Data
    Link_ptr    linkp;
    int         side;
};


}   // Concurrency
}   // Relay

#include "relay/concurrency/linked_channel.inl"

#endif  // RELAY_CONCURRENCY_LINKED_CHANNEL_HPP

//  $CUSTOM_FOOTER$
