//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency.hpp
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

#ifndef RELAY_CONCURRENCY_HPP
#define RELAY_CONCURRENCY_HPP

#include "relay/concurrency/builders.hpp"
#include "relay/concurrency/channel.hpp"
#include "relay/concurrency/combinators.hpp"
#include "relay/concurrency/dispatcher.hpp"
#include "relay/concurrency/error.hpp"
#include "relay/concurrency/limiter.hpp"
#include "relay/concurrency/linked_channel.hpp"
#include "relay/concurrency/log.hpp"
#include "relay/concurrency/promise.hpp"
#include "relay/concurrency/semaphore.hpp"
#include "relay/concurrency/sequence.hpp"
#include "relay/concurrency/types.hpp"


#endif  // RELAY_CONCURRENCY_HPP

//  $CUSTOM_FOOTER$
