//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/dispatcher.inl
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
    Worker Message
*/
template<class T>
inline
Worker_message<T>::Worker_message(optional<T>&& value, exception_ptr ep)
    : val{std::move(value)}
    , errorp{ep}
{
}


template<class T>
inline exception_ptr
Worker_message<T>::error() const
{
    return errorp;
}


template<class T>
inline Worker_message<T>
Worker_message<T>::failure(exception_ptr ep)
{
    return Worker_message(none, ep);
}


template<class T>
inline bool
Worker_message<T>::is_success() const
{
    return !errorp;
}


template<class T>
inline Worker_message<T>
Worker_message<T>::success(T&& x)
{
    return Worker_message(optional<T>(std::move(x)), nullptr);
}


template<class T>
inline T&
Worker_message<T>::value()
{
    return *val;
}


/*
    Worker Dispatcher
*/
template<class T>
void
Worker_dispatcher::deliver(const Channel<Worker_message<T>>& port, const Registry_ptr& registryp, Worker_id id, const std::string& name, const Result_promise<T>& result, spdlog::level::level_enum level)
{
    using std::move;

    Worker_message<T> message = port.receive();

    port.close();

    if (!registryp->erase(id))
        logger()->warn("discarded result of killed worker '{}'", name);
    else if (message.is_success()) {
        logger()->log(level, "worker '{}' finished", name);
        result.fulfill(move(message.value()));
    } else {
        logger()->log(level, "worker '{}' failed: {}", name, describe(message.error()));
        result.fail(message.error());
    }
}


template<class Fun>
inline Result_promise<std::result_of_t<Fun()>>
Worker_dispatcher::launch(Fun task) const
{
    return launch(std::move(task), pimpl->make_name());
}


template<class Fun>
Result_promise<std::result_of_t<Fun()>>
Worker_dispatcher::launch(Fun task, const std::string& name) const
{
    using Result    = std::result_of_t<Fun()>;
    using Message   = Worker_message<Result>;
    using Delivery  = Detail::Delivery_loop::Delivery;

    static_assert(!std::is_void<Result>::value, "a worker task must return a value");

    const Result_promise<Result>    result;
    const Registry_ptr              registryp   = pimpl->registryp;
    const Worker_id                 id          = registryp->insert(name);
    const Channel<Message>          port        = make_buffered_channel<Message>(1);
    const Channel<Delivery>         inbox       = pimpl->loopp->inbox();
    const auto                      level       = pimpl->opts.lifecycle_level;

    logger()->log(level, "spawning worker '{}'", name);

    try {
        pimpl->platformp->spawn(name, [=]() mutable {
            run<Fun, Result>(task, name, port);

            Delivery delivery = [=]{ deliver(port, registryp, id, name, result, level); };

            if (!inbox.try_send(std::move(delivery)))
                logger()->warn("dispatcher is gone, discarded result of worker '{}'", name);
        });
    } catch (...) {
        registryp->erase(id);
        logger()->error("failed to spawn worker '{}': {}", name, describe(std::current_exception()));
        result.fail(std::current_exception());
    }

    return result;
}


template<class T>
Result_promise<std::vector<T>>
Worker_dispatcher::launch_all(const std::vector<Task<T>>& tasks) const
{
    using Slots = Detail::Result_slots<T>;

    const Result_promise<std::vector<T>> result;

    if (tasks.empty())
        result.fulfill(std::vector<T>());
    else {
        const std::shared_ptr<Slots> slotsp = std::make_shared<Slots>(tasks.size());

        for (std::size_t i = 0; i < tasks.size(); ++i) {
            launch(tasks[i]).on_complete([=](const Result_promise<T>& r) {
                if (r.state() == Promise_state::failed)
                    result.fail(r.error());
                else if (slotsp->store(i, r.get()))
                    result.fulfill(slotsp->release());
            });
        }
    }

    return result;
}


template<class T>
Result_promise<T>
Worker_dispatcher::race(const std::vector<Task<T>>& tasks) const
{
    using Detail::Failure_tally;

    if (tasks.empty())
        throw Usage_error("race requires at least one task");

    const Result_promise<T>                 result;
    const std::shared_ptr<Failure_tally>    tallyp = std::make_shared<Failure_tally>(tasks.size());

    for (const Task<T>& task : tasks) {
        launch(task).on_complete([=](const Result_promise<T>& r) {
            if (r.state() == Promise_state::fulfilled)
                result.fulfill(r.get());
            else if (tallyp->record(r.error()))
                result.fail(std::make_exception_ptr(Aggregate_failure(tallyp->count(), tallyp->last())));
        });
    }

    return result;
}


template<class Fun, class T>
void
Worker_dispatcher::run(Fun& task, const std::string& name, const Channel<Worker_message<T>>& port)
{
    using std::move;
    using Message = Worker_message<T>;

    optional<T>     value;
    exception_ptr   errorp;

    try {
        value = task();
    } catch (...) {
        errorp = std::make_exception_ptr(Task_failure(name, std::current_exception()));
    }

    if (errorp)
        port.send(Message::failure(errorp));
    else
        port.send(Message::success(move(*value)));
}


/*
    Implementation Details
*/
namespace Detail {


/*
    Result Slots
*/
template<class T>
inline
Result_slots<T>::Result_slots(std::size_t n)
    : slots(n)
    , nfilled{0}
{
}


template<class T>
std::vector<T>
Result_slots<T>::release()
{
    using std::move;

    std::vector<T>  results;
    const Lock      lock{mutex};

    results.reserve(slots.size());
    for (optional<T>& x : slots)
        results.push_back(move(*x));

    return results;
}


template<class T>
bool
Result_slots<T>::store(std::size_t pos, T&& x)
{
    using std::move;

    const Lock lock{mutex};

    slots[pos] = move(x);
    return ++nfilled == slots.size();
}


}   // Implementation Details
}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
