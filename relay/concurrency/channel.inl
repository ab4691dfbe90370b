//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/channel.inl
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
    Channel Buffer
*/
template<class T>
inline
Channel<T>::Buffer::Buffer(Channel_size maxsize)
    : sizemax{maxsize}
{
}


template<class T>
inline Channel_size
Channel<T>::Buffer::capacity() const
{
    return sizemax;
}


template<class T>
inline bool
Channel<T>::Buffer::is_empty() const
{
    return elemq.empty();
}


template<class T>
inline bool
Channel<T>::Buffer::is_full() const
{
    return size() == capacity();
}


template<class T>
bool
Channel<T>::Buffer::pop(optional<T>* valuep)
{
    using std::move;

    const bool is_data = !is_empty();

    if (is_data) {
        *valuep = move(elemq.front());
        elemq.pop();
    }

    return is_data;
}


template<class T>
bool
Channel<T>::Buffer::push(T* valuep)
{
    using std::move;

    const bool is_capacity = !is_full();

    if (is_capacity)
        elemq.push(move(*valuep));

    return is_capacity;
}


template<class T>
inline Channel_size
Channel<T>::Buffer::size() const
{
    return static_cast<Channel_size>(elemq.size());
}


/*
    Channel Sender
*/
template<class T>
inline
Channel<T>::Sender::Sender(Condition* waitp, T* valuep, Io_status* sp)
    : readyp{waitp}
    , valp{valuep}
    , statusp{sp}
{
}


template<class T>
void
Channel<T>::Sender::close() const
{
    *statusp = Io_status::closed;
    readyp->notify_one();
}


template<class T>
template<class U>
bool
Channel<T>::Sender::dequeue(U* recvbufp) const
{
    /*
        The sending thread is blocked on the channel lock held by the
        caller, so its value and condition remain valid until we return.
    */
    move(valp, recvbufp);
    *statusp = Io_status::done;
    readyp->notify_one();
    return true;
}


template<class T>
inline void
Channel<T>::Sender::move(T* valp, optional<T>* destp)
{
    *destp = std::move(*valp);
}


template<class T>
inline void
Channel<T>::Sender::move(T* valp, Buffer* destp)
{
    destp->push(valp);
}


/*
    Channel Receiver
*/
template<class T>
inline
Channel<T>::Receiver::Receiver(Condition* waitp, optional<T>* valuep, Io_status* sp)
    : readyp{waitp}
    , valp{valuep}
    , statusp{sp}
    , selp{nullptr}
    , oper{-1}
{
}


template<class T>
inline
Channel<T>::Receiver::Receiver(Detail::Selector<T>* sp, Channel_size pos)
    : readyp{nullptr}
    , valp{nullptr}
    , statusp{nullptr}
    , selp{sp}
    , oper{pos}
{
}


template<class T>
void
Channel<T>::Receiver::close() const
{
    if (selp)
        selp->notify_closed(oper);
    else {
        *statusp = Io_status::closed;
        readyp->notify_one();
    }
}


template<class T>
bool
Channel<T>::Receiver::dequeue(T* sendbufp) const
{
    using std::move;

    if (selp)
        return selp->complete(oper, sendbufp);

    *valp = move(*sendbufp);
    *statusp = Io_status::done;
    readyp->notify_one();
    return true;
}


/*
    Channel I/O Queue
*/
template<class T>
template<class U>
bool
Channel<T>::Io_queue<U>::erase(const Waiter& w)
{
    using std::find;

    const auto p        = find(waiters.begin(), waiters.end(), w);
    const bool is_found = p != waiters.end();

    if (is_found)
        waiters.erase(p);

    return is_found;
}


template<class T>
template<class U>
inline bool
Channel<T>::Io_queue<U>::is_empty() const
{
    return waiters.empty();
}


template<class T>
template<class U>
inline bool
Channel<T>::Io_queue<U>::is_found(const Waiter& w) const
{
    using std::find;

    const auto p = find(waiters.begin(), waiters.end(), w);
    return p != waiters.end();
}


template<class T>
template<class U>
inline U
Channel<T>::Io_queue<U>::pop()
{
    const U w = waiters.front();

    waiters.pop_front();
    return w;
}


template<class T>
template<class U>
inline void
Channel<T>::Io_queue<U>::push(const Waiter& w)
{
    waiters.push_back(w);
}


/*
    Channel Implementation
*/
template<class T>
inline
Channel<T>::Impl::Impl(Channel_size bufsize)
    : buffer{bufsize}
    , isclosed{false}
{
}


template<class T>
Channel_size
Channel<T>::Impl::capacity() const
{
    const Lock lock{mutex};
    return buffer.capacity();
}


template<class T>
void
Channel<T>::Impl::close()
{
    const Lock lock{mutex};

    if (!isclosed) {
        isclosed = true;

        while (!receivers.is_empty())
            receivers.pop().close();

        while (!senders.is_empty())
            senders.pop().close();

        logger()->debug("channel {} closed with {} buffered value(s)", static_cast<const void*>(this), buffer.size());
    }
}


template<class T>
template<class U>
bool
Channel<T>::Impl::dequeue(Sender_queue* qp, U* recvbufp)
{
    bool is_received = false;

    while (!(qp->is_empty() || is_received)) {
        const Sender send = qp->pop();
        is_received = send.dequeue(recvbufp);
    }

    return is_received;
}


template<class T>
bool
Channel<T>::Impl::dequeue(Receiver_queue* qp, T* sendbufp)
{
    bool is_sent = false;

    while (!(qp->is_empty() || is_sent)) {
        const Receiver receive = qp->pop();
        is_sent = receive.dequeue(sendbufp);
    }

    return is_sent;
}


template<class T>
inline bool
Channel<T>::Impl::dequeue_select(Detail::Selector<T>* selp, Channel_size pos)
{
    return receivers.erase(Receiver(selp, pos));
}


template<class T>
inline void
Channel<T>::Impl::enqueue_select(Detail::Selector<T>* selp, Channel_size pos)
{
    receivers.push(Receiver(selp, pos));
}


template<class T>
bool
Channel<T>::Impl::is_closed() const
{
    const Lock lock{mutex};
    return isclosed;
}


template<class T>
inline bool
Channel<T>::Impl::is_drained() const
{
    return isclosed && !is_readable();
}


template<class T>
bool
Channel<T>::Impl::is_empty() const
{
    const Lock lock{mutex};
    return buffer.is_empty();
}


template<class T>
bool
Channel<T>::Impl::is_full() const
{
    const Lock lock{mutex};
    return buffer.is_full();
}


template<class T>
inline bool
Channel<T>::Impl::is_readable() const
{
    return !(buffer.is_empty() && senders.is_empty());
}


template<class T>
inline void
Channel<T>::Impl::lock()
{
    mutex.lock();
}


template<class T>
bool
Channel<T>::Impl::read(optional<T>* valuep)
{
    if (buffer.pop(valuep)) {
        // Admit the oldest blocked sender into the slot just freed.
        dequeue(&senders, &buffer);
        return true;
    }

    return dequeue(&senders, valuep);
}


template<class T>
optional<T>
Channel<T>::Impl::receive()
{
    optional<T> value;
    Lock        lock{mutex};

    if (!read(&value) && !isclosed)
        wait_for_sender(&receivers, &value, &lock);

    return value;
}


template<class T>
void
Channel<T>::Impl::send(T* valuep)
{
    Lock lock{mutex};

    if (isclosed)
        throw Channel_closed();

    if (!write(valuep))
        wait_for_receiver(&senders, valuep, &lock);
}


template<class T>
Channel_size
Channel<T>::Impl::size() const
{
    const Lock lock{mutex};
    return buffer.size();
}


template<class T>
optional<T>
Channel<T>::Impl::try_receive()
{
    optional<T> value;
    const Lock  lock{mutex};

    read(&value);
    return value;
}


template<class T>
bool
Channel<T>::Impl::try_send(T* valuep)
{
    const Lock lock{mutex};
    return !isclosed && write(valuep);
}


template<class T>
inline void
Channel<T>::Impl::unlock()
{
    mutex.unlock();
}


template<class T>
void
Channel<T>::Impl::wait_for_receiver(Sender_queue* qp, T* sendbufp, Lock* lockp)
{
    Condition       ready;
    Io_status       status{Io_status::waiting};
    const Sender    send{&ready, sendbufp, &status};

    // Enqueue the send and wait for a receiver (or a close) to dequeue it.
    qp->push(send);
    ready.wait(*lockp, [&]{ return status != Io_status::waiting; });

    if (status == Io_status::closed)
        throw Channel_closed();
}


template<class T>
void
Channel<T>::Impl::wait_for_sender(Receiver_queue* qp, optional<T>* recvbufp, Lock* lockp)
{
    Condition       ready;
    Io_status       status{Io_status::waiting};
    const Receiver  receive{&ready, recvbufp, &status};

    // Enqueue the receive and wait for a sender (or a close) to dequeue it.
    qp->push(receive);
    ready.wait(*lockp, [&]{ return status != Io_status::waiting; });
}


template<class T>
inline bool
Channel<T>::Impl::write(T* valuep)
{
    return dequeue(&receivers, valuep) || buffer.push(valuep);
}


/*
    Channel
*/
template<class T>
inline
Channel<T>::Channel(Impl_ptr p)
    : pimpl{std::move(p)}
{
}


template<class T>
inline
Channel<T>::Channel(Channel&& other)
    : pimpl{std::move(other.pimpl)}
{
}


template<class T>
inline Channel<T>&
Channel<T>::operator=(Channel&& other)
{
    pimpl = std::move(other.pimpl);
    return *this;
}


template<class T>
inline Channel_size
Channel<T>::capacity() const
{
    return pimpl->capacity();
}


template<class T>
inline void
Channel<T>::close() const
{
    pimpl->close();
}


template<class T>
inline bool
Channel<T>::is_closed() const
{
    return pimpl->is_closed();
}


template<class T>
inline bool
Channel<T>::is_empty() const
{
    return pimpl->is_empty();
}


template<class T>
inline bool
Channel<T>::is_full() const
{
    return pimpl->is_full();
}


template<class T>
inline
Channel<T>::operator bool() const
{
    return pimpl != nullptr;
}


template<class T>
T
Channel<T>::receive() const
{
    optional<T> value = pimpl->receive();

    if (!value)
        throw Channel_closed();

    return std::move(*value);
}


template<class T>
inline void
Channel<T>::send(const T& x) const
{
    T value{x};

    pimpl->send(&value);
}


template<class T>
inline void
Channel<T>::send(T&& x) const
{
    pimpl->send(&x);
}


template<class T>
Sequence<T>
Channel<T>::sequence() const
{
    const Impl_ptr chanp = pimpl;

    return Sequence<T>([chanp]{ return chanp->receive(); });
}


template<class T>
inline Channel_size
Channel<T>::size() const
{
    return pimpl->size();
}


template<class T>
inline optional<T>
Channel<T>::try_receive() const
{
    return pimpl->try_receive();
}


template<class T>
inline bool
Channel<T>::try_send(const T& x) const
{
    T value{x};

    return pimpl->try_send(&value);
}


template<class T>
inline bool
Channel<T>::try_send(T&& x) const
{
    return pimpl->try_send(&x);
}


/*
    Channel Construction
*/
template<class T>
inline Channel<T>
make_channel()
{
    return Channel<T>(std::make_shared<typename Channel<T>::Impl>(0));
}


template<class T>
Channel<T>
make_buffered_channel(Channel_size capacity)
{
    if (capacity <= 0)
        throw Usage_error("channel capacity must be positive");

    return Channel<T>(std::make_shared<typename Channel<T>::Impl>(capacity));
}


/*
    Implementation Details
*/
namespace Detail {


/*
    Unbounded Channel
*/
template<class T>
inline Channel<T>
make_unbounded_channel()
{
    const Channel_size unbounded = std::numeric_limits<Channel_size>::max();

    return Channel<T>(std::make_shared<typename Channel<T>::Impl>(unbounded));
}


/*
    Channel Selector Operation
*/
template<class T>
inline
Selector<T>::Operation::Operation(Impl* channelp, Channel_size chanpos)
    : chanp{channelp}
    , pos{chanpos}
{
}


/*
    Channel Selector Locks
*/
template<class T>
Selector<T>::Channel_locks::Channel_locks(const Operation_vector& operations)
    : ops(operations)
{
    Impl* prevchanp = nullptr;

    for (const Operation& op : ops) {
        if (op.chanp != prevchanp) {
            op.chanp->lock();
            prevchanp = op.chanp;
        }
    }
}


template<class T>
Selector<T>::Channel_locks::~Channel_locks()
{
    Impl* prevchanp = nullptr;

    for (const Operation& op : ops) {
        if (op.chanp != prevchanp) {
            op.chanp->unlock();
            prevchanp = op.chanp;
        }
    }
}


/*
    Channel Selector
*/
template<class T>
inline
Selector<T>::Selector(Channel_size stop)
    : stoppos{stop}
    , winner{-1}
    , nlive{0}
{
}


template<class T>
bool
Selector<T>::complete(Channel_size pos, T* valuep)
{
    using std::move;

    const Lock lock{mutex};

    if (winner >= 0)
        return false;

    winner = pos;
    value = move(*valuep);
    ready.notify_one();
    return true;
}


template<class T>
Channel_size
Selector<T>::count_ready(const Operation_vector& ops)
{
    return std::count_if(ops.begin(), ops.end(), [](const Operation& op) {
        return op.chanp->is_readable();
    });
}


template<class T>
void
Selector<T>::dequeue(const Operation_vector& ops)
{
    for (const Operation& op : ops)
        op.chanp->dequeue_select(this, op.pos);
}


template<class T>
Channel_size
Selector<T>::enqueue(const Operation_vector& ops)
{
    bool is_stopped = false;

    for (const Operation& op : ops) {
        if (op.pos == stoppos) {
            if (op.chanp->is_drained())
                is_stopped = true;
            else
                op.chanp->enqueue_select(this, op.pos);
        } else if (!op.chanp->is_drained()) {
            op.chanp->enqueue_select(this, op.pos);
            ++nlive;
        }
    }

    // Nothing to wait for; leave no trace in the queues.
    if (is_stopped || nlive == 0) {
        dequeue(ops);
        nlive = 0;
    }

    return nlive;
}


template<class T>
typename Selector<T>::Operation_vector
Selector<T>::make_operations(const Channel_vector& chans)
{
    using std::sort;

    Operation_vector ops;

    ops.reserve(chans.size());
    for (std::size_t i = 0; i < chans.size(); ++i) {
        if (chans[i])
            ops.emplace_back(chans[i].pimpl.get(), static_cast<Channel_size>(i));
    }

    // Lock channels in address order to avoid deadlock between selectors.
    sort(ops.begin(), ops.end(), [](const Operation& x, const Operation& y) {
        return x.chanp < y.chanp;
    });

    return ops;
}


template<class T>
void
Selector<T>::notify_closed(Channel_size pos)
{
    const Lock lock{mutex};

    if (pos == stoppos)
        nlive = 0;
    else if (nlive > 0)
        --nlive;

    if (nlive == 0)
        ready.notify_one();
}


template<class T>
const typename Selector<T>::Operation*
Selector<T>::pick_ready(const Operation_vector& ops, Channel_size nready)
{
    const Operation*    readyp  = nullptr;
    Channel_size        n       = random(1, nready);

    for (const Operation& op : ops) {
        if (op.chanp->is_readable() && --n == 0) {
            readyp = &op;
            break;
        }
    }

    return readyp;
}


template<class T>
inline optional<Selection<T>>
Selector<T>::select(const Channel_vector& chans)
{
    return wait_select(chans, -1);
}


template<class T>
optional<Selection<T>>
Selector<T>::select(const Channel_vector& chans, const Channel<T>& stop)
{
    Channel_vector stoppable{chans};

    stoppable.push_back(stop);
    return wait_select(stoppable, static_cast<Channel_size>(chans.size()));
}


template<class T>
optional<Selection<T>>
Selector<T>::wait_select(const Channel_vector& chans, Channel_size stoppos)
{
    Selector                selector{stoppos};
    const Operation_vector  ops = make_operations(chans);

    {
        const Channel_locks     lockchans{ops};
        optional<Selection<T>>  chosen = select_ready(ops);

        // Done if something was ready or every source is closed and drained.
        if (chosen || selector.enqueue(ops) == 0)
            return chosen;
    }

    selector.wait();

    {
        const Channel_locks lockchans{ops};
        selector.dequeue(ops);
    }

    return selector.selection();
}


template<class T>
optional<Selection<T>>
Selector<T>::select_ready(const Operation_vector& ops)
{
    using std::move;

    optional<Selection<T>>  chosen;
    const Channel_size      n = count_ready(ops);

    if (n > 0) {
        const Operation*    op = pick_ready(ops, n);
        optional<T>         x;

        op->chanp->read(&x);
        chosen = Selection<T>(op->pos, move(*x));
    }

    return chosen;
}


template<class T>
optional<Selection<T>>
Selector<T>::selection()
{
    using std::move;

    optional<Selection<T>>  chosen;
    const Lock              lock{mutex};

    if (winner >= 0)
        chosen = Selection<T>(winner, move(*value));

    return chosen;
}


template<class T>
optional<Selection<T>>
Selector<T>::try_select(const Channel_vector& chans)
{
    const Operation_vector  ops = make_operations(chans);
    const Channel_locks     lockchans{ops};

    return select_ready(ops);
}


template<class T>
void
Selector<T>::wait()
{
    Lock lock{mutex};

    ready.wait(lock, [&]{ return winner >= 0 || nlive == 0; });
}


}   // Implementation Details
}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
