//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/limiter.inl
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
    Limited Launch
*/
template<class T>
Limited_launch<T>::Limited_launch(const Worker_dispatcher& d, const std::vector<Task<T>>& ts, Channel_size concurrency)
    : dispatcher{d}
    , tasks(ts)
    , permits{concurrency}
    , slots{ts.size()}
    , nextpos{0}
    , is_failed{false}
{
}


template<class T>
void
Limited_launch<T>::admit(const Launch_ptr& selfp)
{
    std::size_t pos;

    while (optional<Semaphore::Permit> permit = selfp->next(&pos)) {
        const Permit_ptr permitp = std::make_shared<Semaphore::Permit>(std::move(*permit));

        selfp->dispatcher.launch(selfp->tasks[pos]).on_complete([selfp, pos, permitp](const Result_promise<T>& r) {
            permitp->release();
            selfp->complete(pos, r);
            admit(selfp);
        });
    }
}


template<class T>
void
Limited_launch<T>::complete(std::size_t pos, const Result_promise<T>& r)
{
    if (r.state() == Promise_state::failed) {
        {
            const Lock lock{mutex};
            is_failed = true;
        }

        results.fail(r.error());
    } else if (slots.store(pos, r.get()))
        results.fulfill(slots.release());
}


template<class T>
optional<Semaphore::Permit>
Limited_launch<T>::next(std::size_t* posp)
{
    optional<Semaphore::Permit> permit;
    const Lock                  lock{mutex};

    if (!is_failed && nextpos < tasks.size()) {
        permit = permits.try_make_permit();
        if (permit)
            *posp = nextpos++;
    }

    return permit;
}


template<class T>
inline Result_promise<std::vector<T>>
Limited_launch<T>::result() const
{
    return results;
}


}   // Implementation Details


/*
    Concurrency Limiter
*/
inline
Concurrency_limiter::Concurrency_limiter(const Worker_dispatcher& d, Channel_size concurrency)
    : dispatcher{d}
    , nmax{concurrency}
{
    if (concurrency <= 0)
        throw Usage_error("concurrency limit must be positive");
}


inline Channel_size
Concurrency_limiter::concurrency() const
{
    return nmax;
}


template<class T>
Result_promise<std::vector<T>>
Concurrency_limiter::launch(const std::vector<Task<T>>& tasks) const
{
    using Launch = Detail::Limited_launch<T>;

    const std::shared_ptr<Launch>           launchp = std::make_shared<Launch>(dispatcher, tasks, nmax);
    const Result_promise<std::vector<T>>    result  = launchp->result();

    if (tasks.empty())
        result.fulfill(std::vector<T>());
    else
        Launch::admit(launchp);

    return result;
}


template<class T>
inline Result_promise<std::vector<T>>
launch_with_limit(const Worker_dispatcher& dispatcher, const std::vector<Task<T>>& tasks, Channel_size concurrency)
{
    return Concurrency_limiter(dispatcher, concurrency).launch(tasks);
}


}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
