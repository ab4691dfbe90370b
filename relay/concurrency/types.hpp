//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/types.hpp
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

#ifndef RELAY_CONCURRENCY_TYPES_HPP
#define RELAY_CONCURRENCY_TYPES_HPP

#include "relay/concurrency/config.hpp"
#include "boost/none.hpp"
#include "boost/optional.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <utility>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Names/Types
*/
template<class T>   class Channel;
template<class T>   class Linked_channel;
template<class T>   class Result_promise;
template<class T>   class Sequence;
class Semaphore;
class Worker_dispatcher;
using Channel_size  = std::ptrdiff_t;
using Duration      = std::chrono::nanoseconds;
using Worker_id     = std::uint64_t;
using boost::none;
using boost::optional;
using std::exception_ptr;

template<class T> using Task        = std::function<T()>;
template<class T> using Selection   = std::pair<Channel_size, T>;


}   // Concurrency
}   // Relay

#endif  // RELAY_CONCURRENCY_TYPES_HPP

//  $CUSTOM_FOOTER$
