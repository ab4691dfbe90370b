//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/linked_channel.inl
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

/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Implementation Details
*/
namespace Detail {


/*
    Envelope
*/
template<class T>
inline
Envelope<T>::Envelope(Kind k, std::uint64_t seqno, optional<T>&& value)
    : type{k}
    , seq{seqno}
    , val{std::move(value)}
{
}


template<class T>
inline typename Envelope<T>::Kind
Envelope<T>::kind() const
{
    return type;
}


template<class T>
inline std::uint64_t
Envelope<T>::sequence() const
{
    return seq;
}


template<class T>
inline optional<T>&
Envelope<T>::value()
{
    return val;
}


/*
    Message Transport
*/
template<class T>
Message_transport<T>::Message_transport(Handler h)
    : deliver{std::move(h)}
    , nextseq{1}
    , is_interrupt{false}
    , worker{[this]{ run(); }}
{
}


template<class T>
Message_transport<T>::~Message_transport()
{
    interrupt();
    worker.join();
}


template<class T>
void
Message_transport<T>::interrupt()
{
    Lock lock{mutex};

    is_interrupt = true;
    lock.unlock();
    ready.notify_all();
}


template<class T>
optional<Envelope<T>>
Message_transport<T>::pop()
{
    optional<Envelope<T>>   e;
    Lock                    lock{mutex};

    while (q.empty() && !is_interrupt)
        ready.wait(lock);

    if (!q.empty()) {
        e = std::move(q.front());
        q.pop_front();
    }

    return e;
}


template<class T>
std::uint64_t
Message_transport<T>::post(Kind k, optional<T>&& value)
{
    Lock                lock{mutex};
    const std::uint64_t seqno = nextseq++;

    q.emplace_back(k, seqno, std::move(value));
    lock.unlock();
    ready.notify_one();
    return seqno;
}


template<class T>
void
Message_transport<T>::run()
{
    while (optional<Envelope<T>> e = pop())
        deliver(std::move(*e));
}


/*
    Channel Link Endpoint
*/
template<class T>
inline
Link<T>::Endpoint::Endpoint()
    : inq{make_unbounded_channel<T>()}
    , is_local_closed{false}
    , is_peer_closed{false}
{
}


/*
    Channel Link
*/
template<class T>
Link<T>::Link()
{
    transports[0] = std::make_unique<Transport>([this](Envelope<T>&& e){ deliver(1, std::move(e)); });
    transports[1] = std::make_unique<Transport>([this](Envelope<T>&& e){ deliver(0, std::move(e)); });
}


template<class T>
void
Link<T>::close(int side)
{
    const Lock  lock{mutex};
    Endpoint&   end = ends[side];

    if (!end.is_local_closed) {
        end.is_local_closed = true;
        end.inq.close();

        const std::uint64_t seqno = transports[side]->post(Kind::close, none);
        logger()->debug("linked channel {} side {} closed (message {})", static_cast<const void*>(this), side, seqno);
    }
}


template<class T>
void
Link<T>::deliver(int side, Envelope<T>&& e)
{
    using std::move;

    const Lock  lock{mutex};
    Endpoint&   end = ends[side];

    switch (e.kind()) {
    case Kind::data:
        // The close wins: data arriving after a local close is dropped.
        if (end.is_local_closed || !end.inq.try_send(move(*e.value())))
            logger()->warn("linked channel {} side {} discarded message {} after close", static_cast<const void*>(this), side, e.sequence());
        break;

    case Kind::close:
        end.is_peer_closed = true;
        end.inq.close();
        break;
    }
}


template<class T>
inline Channel<T>
Link<T>::inbound(int side) const
{
    return ends[side].inq;
}


template<class T>
bool
Link<T>::is_closed(int side) const
{
    const Lock      lock{mutex};
    const Endpoint& end = ends[side];

    return end.is_local_closed || end.is_peer_closed;
}


template<class T>
bool
Link<T>::send(int side, T* valuep)
{
    using std::move;

    const Lock      lock{mutex};
    const Endpoint& end = ends[side];

    if (end.is_local_closed || end.is_peer_closed)
        return false;

    transports[side]->post(Kind::data, optional<T>(move(*valuep)));
    return true;
}


}   // Implementation Details


/*
    Linked Channel
*/
template<class T>
inline
Linked_channel<T>::Linked_channel()
    : side{0}
{
}


template<class T>
inline
Linked_channel<T>::Linked_channel(Link_ptr lp, int s)
    : linkp{std::move(lp)}
    , side{s}
{
}


template<class T>
inline void
Linked_channel<T>::close() const
{
    linkp->close(side);
}


template<class T>
inline bool
Linked_channel<T>::is_closed() const
{
    return linkp->is_closed(side);
}


template<class T>
inline bool
Linked_channel<T>::is_empty() const
{
    return linkp->inbound(side).is_empty();
}


template<class T>
inline
Linked_channel<T>::operator bool() const
{
    return linkp != nullptr;
}


template<class T>
inline T
Linked_channel<T>::receive() const
{
    return linkp->inbound(side).receive();
}


template<class T>
inline void
Linked_channel<T>::send(const T& x) const
{
    T value{x};

    if (!linkp->send(side, &value))
        throw Channel_closed();
}


template<class T>
inline void
Linked_channel<T>::send(T&& x) const
{
    if (!linkp->send(side, &x))
        throw Channel_closed();
}


template<class T>
inline Sequence<T>
Linked_channel<T>::sequence() const
{
    return linkp->inbound(side).sequence();
}


template<class T>
inline Channel_size
Linked_channel<T>::size() const
{
    return linkp->inbound(side).size();
}


template<class T>
inline optional<T>
Linked_channel<T>::try_receive() const
{
    return linkp->inbound(side).try_receive();
}


template<class T>
inline bool
Linked_channel<T>::try_send(const T& x) const
{
    T value{x};

    return linkp->send(side, &value);
}


template<class T>
inline bool
Linked_channel<T>::try_send(T&& x) const
{
    return linkp->send(side, &x);
}


/*
    Linked Channel Construction
*/
template<class T>
std::pair<Linked_channel<T>, Linked_channel<T>>
make_linked_channels()
{
    using Link = Detail::Link<T>;

    const std::shared_ptr<Link> linkp = std::make_shared<Link>();

    return std::make_pair(Linked_channel<T>(linkp, 0), Linked_channel<T>(linkp, 1));
}


}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
