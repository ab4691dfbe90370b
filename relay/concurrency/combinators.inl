//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/combinators.inl
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
    Sequence Merger Output
*/
template<class T>
inline
Sequence_merger<T>::Output::Output(Channel_size nsources)
    : mergeq{make_buffered_channel<T>(1)}
    , merged{mergeq.sequence()}
    , nactive{nsources}
{
    if (nsources == 0)
        mergeq.close();
}


template<class T>
inline void
Sequence_merger<T>::Output::close()
{
    mergeq.close();
}


template<class T>
void
Sequence_merger<T>::Output::fail(exception_ptr ep)
{
    {
        const Lock lock{mutex};

        if (!errorp)
            errorp = ep;
    }

    mergeq.close();
}


template<class T>
inline void
Sequence_merger<T>::Output::finish()
{
    if (--nactive == 0)
        mergeq.close();
}


template<class T>
inline bool
Sequence_merger<T>::Output::is_closed() const
{
    return mergeq.is_closed();
}


template<class T>
optional<T>
Sequence_merger<T>::Output::next()
{
    rethrow_error();

    optional<T> value = merged.next();

    if (!value)
        rethrow_error();

    return value;
}


template<class T>
bool
Sequence_merger<T>::Output::offer(T&& x)
{
    bool is_sent = true;

    try {
        mergeq.send(std::move(x));
    } catch (const Channel_closed&) {
        is_sent = false;
    }

    return is_sent;
}


template<class T>
inline void
Sequence_merger<T>::Output::rethrow_error() const
{
    const Lock lock{mutex};

    if (errorp)
        std::rethrow_exception(errorp);
}


/*
    Sequence Merger
*/
template<class T>
Sequence_merger<T>::Sequence_merger(const std::vector<Sequence<T>>& sources)
    : outp{std::make_shared<Output>(static_cast<Channel_size>(sources.size()))}
{
    const Output_ptr out = outp;

    try {
        for (const Sequence<T>& s : sources)
            pumps.spawn("merge", [out, s]{ pump(out, s); });
    } catch (...) {
        // Release the pumps already started before they are joined.
        outp->close();
        throw;
    }
}


template<class T>
Sequence_merger<T>::~Sequence_merger()
{
    outp->close();
}


template<class T>
inline optional<T>
Sequence_merger<T>::next()
{
    return outp->next();
}


template<class T>
void
Sequence_merger<T>::pump(const Output_ptr& outp, const Sequence<T>& source)
{
    using std::move;

    bool is_open = true;

    try {
        // Pull nothing more once the consumer has gone or a source failed.
        while (is_open && !outp->is_closed()) {
            optional<T> x = source.next();
            is_open = x && outp->offer(move(*x));
        }
    } catch (...) {
        outp->fail(std::current_exception());
    }

    outp->finish();
}


}   // Implementation Details


/*
    Channel Selection
*/
template<class T>
Selection<T>
blocking_select(const std::vector<Channel<T>>& chans)
{
    if (chans.empty())
        throw Usage_error("select requires at least one channel");

    optional<Selection<T>> chosen = Detail::Selector<T>::select(chans);

    if (!chosen)
        throw Channel_closed();

    logger()->debug("select chose channel {} of {}", chosen->first, chans.size());
    return std::move(*chosen);
}


template<class T>
Result_promise<Selection<T>>
select(const std::vector<Channel<T>>& chans)
{
    using std::move;
    using Link          = Detail::Promise_link<Selection<T>>;
    using Waiter_ptr    = std::shared_ptr<Thread_platform>;

    const Result_promise<Selection<T>> result;

    if (chans.empty())
        throw Usage_error("select requires at least one channel");

    if (optional<Selection<T>> chosen = try_select(chans))
        result.fulfill(move(*chosen));
    else {
        const Channel<T>    stop    = make_channel<T>();
        const Link          link{result};
        const Waiter_ptr    waiterp = std::make_shared<Thread_platform>();

        // The hook owns the waiter, which is joined when the promise goes.
        result.on_abandon([stop, waiterp]{ stop.close(); });

        waiterp->spawn("select", [chans, stop, link]{
            try {
                if (optional<Selection<T>> picked = Detail::Selector<T>::select(chans, stop))
                    link.fulfill(move(*picked));
                else
                    link.fail(std::make_exception_ptr(Channel_closed()));
            } catch (...) {
                link.fail(std::current_exception());
            }
        });
    }

    return result;
}


template<class T>
inline optional<Selection<T>>
try_select(const std::vector<Channel<T>>& chans)
{
    return Detail::Selector<T>::try_select(chans);
}


/*
    Merging
*/
template<class T>
Sequence<T>
merge(const std::vector<Channel<T>>& chans)
{
    using Channel_vector = std::vector<Channel<T>>;

    const auto sourcesp = std::make_shared<Channel_vector>(chans);

    return Sequence<T>([sourcesp]{
        optional<T>             value;
        optional<Selection<T>>  chosen = Detail::Selector<T>::select(*sourcesp);

        if (chosen)
            value = std::move(chosen->second);

        return value;
    });
}


template<class T>
Sequence<T>
merge(const std::vector<Sequence<T>>& sources)
{
    using Merger = Detail::Sequence_merger<T>;

    const auto mergerp = std::make_shared<Merger>(sources);

    return Sequence<T>([mergerp]{ return mergerp->next(); });
}


/*
    Pipelines
*/
template<class T, class Fun>
inline Sequence<std::result_of_t<Fun(T)>>
pipeline(const Channel<T>& source, Fun f)
{
    return pipeline(source.sequence(), f);
}


template<class T, class Fun>
Sequence<std::result_of_t<Fun(T)>>
pipeline(const Sequence<T>& source, Fun f)
{
    using Result = std::result_of_t<Fun(T)>;

    return Sequence<Result>([source, f]() mutable {
        optional<Result> y;

        if (optional<T> x = source.next())
            y = f(std::move(*x));

        return y;
    });
}


}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
