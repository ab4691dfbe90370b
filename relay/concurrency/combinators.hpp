//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/combinators.hpp
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

#ifndef RELAY_CONCURRENCY_COMBINATORS_HPP
#define RELAY_CONCURRENCY_COMBINATORS_HPP

#include "relay/concurrency/channel.hpp"
#include "relay/concurrency/config.hpp"
#include "relay/concurrency/dispatcher.hpp"
#include "relay/concurrency/error.hpp"
#include "relay/concurrency/promise.hpp"
#include "relay/concurrency/sequence.hpp"
#include "relay/concurrency/types.hpp"
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <type_traits>
#include <vector>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Channel Selection

    Take one value from whichever of several channels is ready first,
    reporting its position in the argument list.  If more than one channel
    is ready, one is chosen at random.  Sources that are closed and drained
    drop out; when all have, blocking selection fails with Channel_closed.

    A pending select waits on a thread of its own.  Releasing every handle
    to its promise cancels the wait, leaving the sources' queues as they
    were, and joins that thread.
*/
template<class T> optional<Selection<T>>        try_select(const std::vector<Channel<T>>&);
template<class T> Selection<T>                  blocking_select(const std::vector<Channel<T>>&);
template<class T> Result_promise<Selection<T>>  select(const std::vector<Channel<T>>&);


/*
    Merging

    Interleave the values of several sources into one sequence which ends
    after every source has ended.  An error raised by a source sequence is
    rethrown to the consumer at its next pull.
*/
template<class T> Sequence<T> merge(const std::vector<Channel<T>>&);
template<class T> Sequence<T> merge(const std::vector<Sequence<T>>&);


/*
    Pipelines
*/
template<class T, class Fun> Sequence<std::result_of_t<Fun(T)>> pipeline(const Channel<T>&, Fun);
template<class T, class Fun> Sequence<std::result_of_t<Fun(T)>> pipeline(const Sequence<T>&, Fun);


/*
    Implementation Details
*/
namespace Detail {


/*
    Sequence Merger

    Pumps each source sequence into a one-slot channel on its own thread,
    so that a source is pulled only as fast as the consumer takes values.
    Destroying the merger closes the channel, which stops the pumps, and
    then joins them.  A pump blocked inside its source is joined once that
    source yields.
*/
template<class T>
class Sequence_merger {
public:
    // Construct/Copy/Destroy
    explicit Sequence_merger(const std::vector<Sequence<T>>& sources);
    Sequence_merger(const Sequence_merger&) = delete;
    Sequence_merger& operator=(const Sequence_merger&) = delete;
    ~Sequence_merger();

    // Traversal
    optional<T> next();

private:
    // Names/Types
    using Mutex = std::mutex;
    using Lock  = std::lock_guard<Mutex>;

    class Output {
    public:
        // Construct/Copy
        explicit Output(Channel_size nsources);
        Output(const Output&) = delete;
        Output& operator=(const Output&) = delete;

        // Pumping
        bool offer(T&&);
        void fail(exception_ptr);
        void finish();
        void close();
        bool is_closed() const;

        // Traversal
        optional<T> next();

    private:
        // Error Handling
        void rethrow_error() const;

        // Data
        Channel<T>                  mergeq;
        Sequence<T>                 merged;
        std::atomic<Channel_size>   nactive;
        exception_ptr               errorp;
        mutable Mutex               mutex;
    };

    using Output_ptr = std::shared_ptr<Output>;

    // Pumping
    static void pump(const Output_ptr&, const Sequence<T>& source);

    // Data
    Output_ptr      outp;
    Thread_platform pumps;
};


}   // Implementation Details
}   // Concurrency
}   // Relay

#include "relay/concurrency/combinators.inl"

#endif  // RELAY_CONCURRENCY_COMBINATORS_HPP

//  $CUSTOM_FOOTER$
