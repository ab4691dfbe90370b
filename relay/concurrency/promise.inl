//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/promise.inl
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
    Result Promise Implementation
*/
template<class T>
inline
Result_promise<T>::Impl::Impl()
    : status{Promise_state::pending}
{
}


template<class T>
Result_promise<T>::Impl::~Impl()
{
    // The last handle is gone before a result arrived.
    if (status == Promise_state::pending) {
        for (const Abandon_hook& f : hooks)
            f();
    }
}


template<class T>
void
Result_promise<T>::Impl::add_hook(Abandon_hook f)
{
    const Lock lock{mutex};
    hooks.push_back(std::move(f));
}


template<class T>
template<class U>
bool
Result_promise<T>::Impl::complete(U* valuep, exception_ptr ep, Callback_list* callbacksp)
{
    using std::move;

    const Lock lock{mutex};

    if (status != Promise_state::pending)
        return false;

    if (valuep) {
        value = move(*valuep);
        status = Promise_state::fulfilled;
    } else {
        errorp = ep;
        status = Promise_state::failed;
    }

    callbacksp->swap(callbacks);
    ready.notify_all();
    return true;
}


template<class T>
exception_ptr
Result_promise<T>::Impl::error() const
{
    const Lock lock{mutex};
    return errorp;
}


template<class T>
T
Result_promise<T>::Impl::get()
{
    Lock lock{mutex};

    ready.wait(lock, [&]{ return status != Promise_state::pending; });
    return get_ready();
}


template<class T>
inline T
Result_promise<T>::Impl::get_ready() const
{
    if (status == Promise_state::failed)
        std::rethrow_exception(errorp);

    return *value;
}


template<class T>
void
Result_promise<T>::Impl::retain(std::shared_ptr<void> anchorp)
{
    const Lock lock{mutex};
    anchors.push_back(std::move(anchorp));
}


template<class T>
Promise_state
Result_promise<T>::Impl::state() const
{
    const Lock lock{mutex};
    return status;
}


template<class T>
bool
Result_promise<T>::Impl::subscribe(const Callback& f)
{
    const Lock lock{mutex};
    const bool is_pending = status == Promise_state::pending;

    if (is_pending)
        callbacks.push_back(f);

    return is_pending;
}


template<class T>
optional<T>
Result_promise<T>::Impl::try_get()
{
    optional<T> result;
    const Lock  lock{mutex};

    if (status != Promise_state::pending)
        result = get_ready();

    return result;
}


template<class T>
void
Result_promise<T>::Impl::wait()
{
    Lock lock{mutex};

    ready.wait(lock, [&]{ return status != Promise_state::pending; });
}


template<class T>
bool
Result_promise<T>::Impl::wait_for(Duration maxtime)
{
    Lock lock{mutex};

    return ready.wait_for(lock, maxtime, [&]{ return status != Promise_state::pending; });
}


/*
    Result Promise
*/
template<class T>
inline
Result_promise<T>::Result_promise()
    : pimpl{std::make_shared<Impl>()}
{
}


template<class T>
inline
Result_promise<T>::Result_promise(Impl_ptr p)
    : pimpl{std::move(p)}
{
}


template<class T>
inline
Result_promise<T>::Result_promise(Result_promise&& other)
    : pimpl{std::move(other.pimpl)}
{
}


template<class T>
inline Result_promise<T>&
Result_promise<T>::operator=(Result_promise&& other)
{
    pimpl = std::move(other.pimpl);
    return *this;
}


template<class T>
template<class Fun>
Result_promise<T>
Result_promise<T>::also(Fun f) const
{
    Result_promise  next;
    const auto      link = make_continuation(&next);

    on_complete([link, f](const Result_promise& p) mutable {
        if (p.state() == Promise_state::failed)
            link.fail(p.error());
        else {
            settle(link, [&]{
                T x = p.get();

                f(static_cast<const T&>(x));
                return x;
            });
        }
    });

    return next;
}


template<class T>
template<class U>
bool
Result_promise<T>::complete(U* valuep, exception_ptr ep) const
{
    Callback_list   callbacks;
    const bool      is_completed = pimpl->complete(valuep, ep, &callbacks);

    if (is_completed)
        notify(callbacks);

    return is_completed;
}


template<class T>
inline exception_ptr
Result_promise<T>::error() const
{
    return pimpl->error();
}


template<class T>
template<class Pred>
Result_promise<T>
Result_promise<T>::filter(Pred pred) const
{
    Result_promise  next;
    const auto      link = make_continuation(&next);

    on_complete([link, pred](const Result_promise& p) mutable {
        if (p.state() == Promise_state::failed)
            link.fail(p.error());
        else {
            settle(link, [&]{
                T x = p.get();

                if (!pred(static_cast<const T&>(x)))
                    throw Filter_rejected();

                return x;
            });
        }
    });

    return next;
}


template<class T>
inline bool
Result_promise<T>::fail(exception_ptr ep) const
{
    return complete(static_cast<T*>(nullptr), ep);
}


template<class T>
template<class Fun>
std::result_of_t<Fun(T)>
Result_promise<T>::flat_map(Fun f) const
{
    using Inner = std::result_of_t<Fun(T)>;

    Inner       flat;
    const auto  link = make_continuation(&flat);

    on_complete([link, f](const Result_promise& p) mutable {
        if (p.state() == Promise_state::failed)
            link.fail(p.error());
        else {
            try {
                const Inner inner = f(p.get());

                // The flattened promise now depends on the inner one.
                if (const auto targetp = link.lock())
                    targetp->pimpl->retain(inner.pimpl);

                inner.on_complete([link](const Inner& q) {
                    if (q.state() == Promise_state::failed)
                        link.fail(q.error());
                    else
                        settle(link, [&]{ return q.get(); });
                });
            } catch (...) {
                link.fail(std::current_exception());
            }
        }
    });

    return flat;
}


template<class T>
inline bool
Result_promise<T>::fulfill(const T& x) const
{
    return complete(&x, nullptr);
}


template<class T>
inline bool
Result_promise<T>::fulfill(T&& x) const
{
    return complete(&x, nullptr);
}


template<class T>
inline T
Result_promise<T>::get() const
{
    return pimpl->get();
}


template<class T>
inline bool
Result_promise<T>::is_ready() const
{
    return state() != Promise_state::pending;
}


template<class T>
template<class U>
Detail::Promise_link<U>
Result_promise<T>::make_continuation(Result_promise<U>* nextp) const
{
    nextp->pimpl->retain(pimpl);
    return Detail::Promise_link<U>(*nextp);
}


template<class T>
template<class Fun>
Result_promise<std::result_of_t<Fun(T)>>
Result_promise<T>::map(Fun f) const
{
    using Result = std::result_of_t<Fun(T)>;

    Result_promise<Result>  mapped;
    const auto              link = make_continuation(&mapped);

    on_complete([link, f](const Result_promise& p) mutable {
        if (p.state() == Promise_state::failed)
            link.fail(p.error());
        else
            settle(link, [&]{ return f(p.get()); });
    });

    return mapped;
}


template<class T>
void
Result_promise<T>::notify(const Callback_list& callbacks) const
{
    for (const auto& f : callbacks)
        f(*this);
}


template<class T>
void
Result_promise<T>::on_complete(Callback f) const
{
    // Run at once if the result is already in.
    if (!pimpl->subscribe(f))
        f(*this);
}


template<class T>
inline void
Result_promise<T>::on_abandon(Abandon_hook f) const
{
    pimpl->add_hook(std::move(f));
}


template<class T>
Result_promise<T>
Result_promise<T>::or_else(const T& fallback) const
{
    Result_promise  next;
    const auto      link = make_continuation(&next);

    on_complete([link, fallback](const Result_promise& p) {
        if (p.state() == Promise_state::failed)
            settle(link, [&]{ return fallback; });
        else
            settle(link, [&]{ return p.get(); });
    });

    return next;
}


template<class T>
template<class U, class Fun>
void
Result_promise<T>::settle(const Detail::Promise_link<U>& link, Fun produce)
{
    using std::move;

    optional<U>     value;
    exception_ptr   ep;

    try {
        value.emplace(produce());
    } catch (...) {
        ep = std::current_exception();
    }

    if (ep)
        link.fail(ep);
    else
        link.fulfill(move(*value));
}


template<class T>
inline Promise_state
Result_promise<T>::state() const
{
    return pimpl->state();
}


template<class T>
template<class Pred>
Result_promise<optional<T>>
Result_promise<T>::take_if(Pred pred) const
{
    Result_promise<optional<T>> taken;
    const auto                  link = make_continuation(&taken);

    on_complete([link, pred](const Result_promise& p) mutable {
        if (p.state() == Promise_state::failed)
            link.fail(p.error());
        else {
            settle(link, [&]{
                optional<T> x = p.get();

                if (!pred(static_cast<const T&>(*x)))
                    x = none;

                return x;
            });
        }
    });

    return taken;
}


template<class T>
inline optional<T>
Result_promise<T>::try_get() const
{
    return pimpl->try_get();
}


template<class T>
inline void
Result_promise<T>::wait() const
{
    pimpl->wait();
}


template<class T>
inline bool
Result_promise<T>::wait_for(Duration maxtime) const
{
    return pimpl->wait_for(maxtime);
}


/*
    Implementation Details
*/
namespace Detail {


/*
    Promise Link
*/
template<class T>
inline
Promise_link<T>::Promise_link(const Result_promise<T>& promise)
    : implp{promise.pimpl}
{
}


template<class T>
bool
Promise_link<T>::fail(exception_ptr ep) const
{
    const optional<Result_promise<T>> promise = lock();

    return promise && promise->fail(ep);
}


template<class T>
bool
Promise_link<T>::fulfill(T&& x) const
{
    const optional<Result_promise<T>> promise = lock();

    return promise && promise->fulfill(std::move(x));
}


template<class T>
inline bool
Promise_link<T>::is_expired() const
{
    return implp.expired();
}


template<class T>
optional<Result_promise<T>>
Promise_link<T>::lock() const
{
    optional<Result_promise<T>> promise;

    if (const std::shared_ptr<Impl> p = implp.lock())
        promise = Result_promise<T>(p);

    return promise;
}


}   // Implementation Details
}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
