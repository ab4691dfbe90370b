//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/builders.inl
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


inline Duration
backoff_delay(Duration base, int attempt)
{
    Duration wait = base;

    for (int n = 1; n < attempt && wait <= Duration::max() / 2; ++n)
        wait *= 2;

    return wait;
}


template<class T>
T
await_within(const Result_promise<T>& result, Duration timeout)
{
    // The worker keeps running after a timeout; its result is discarded.
    if (!result.wait_for(timeout))
        throw Timeout_error(timeout);

    return result.get();
}


}   // Implementation Details


/*
    Task Builders
*/
template<class T>
inline Result_promise<std::vector<T>>
concurrent(const Worker_dispatcher& dispatcher, const std::vector<Task<T>>& tasks, Channel_size limit)
{
    return launch_with_limit(dispatcher, tasks, limit);
}


inline void
delay(Duration d)
{
    std::this_thread::sleep_for(d);
}


template<class T>
std::vector<T>
launch_sequentially(const Worker_dispatcher& dispatcher, const std::vector<Task<T>>& tasks)
{
    std::vector<T> results;

    results.reserve(tasks.size());
    for (const Task<T>& task : tasks)
        results.push_back(dispatcher.launch(task).get());

    return results;
}


template<class Fun>
std::result_of_t<Fun()>
retry(Fun task, const Retry_policy& policy)
{
    int attempts = 0;

    if (policy.max_retries < 0 || policy.backoff < Duration::zero())
        throw Usage_error("retry needs a non-negative retry count and backoff");

    for (;;) {
        try {
            return task();
        } catch (...) {
            const exception_ptr ep = std::current_exception();

            if (++attempts > policy.max_retries || (policy.retry_if && !policy.retry_if(ep)))
                throw;

            const Duration wait = Detail::backoff_delay(policy.backoff, attempts);

            logger()->warn("attempt {} failed ({}), retrying in {}ms", attempts, describe(ep),
                std::chrono::duration_cast<std::chrono::milliseconds>(wait).count());
            delay(wait);
        }
    }
}


template<class Fun>
inline std::result_of_t<Fun()>
with_timeout(const Worker_dispatcher& dispatcher, Fun task, Duration timeout)
{
    return Detail::await_within(dispatcher.launch(std::move(task)), timeout);
}


template<class Fun>
inline std::result_of_t<Fun()>
with_timeout(const Worker_dispatcher& dispatcher, Fun task, Duration timeout, const std::string& name)
{
    return Detail::await_within(dispatcher.launch(std::move(task), name), timeout);
}


}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
