//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/config.hpp
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

#ifndef RELAY_CONCURRENCY_CONFIG_HPP
#define RELAY_CONCURRENCY_CONFIG_HPP

#include "relay/config.hpp"


/*
    Detect API usage.
*/
# if !defined RELAY_CONCURRENCY_EXPORTS
#   define RELAY_CONCURRENCY_DECL
# else
#   if defined RELAY_CONCURRENCY_SOURCE
#       define RELAY_CONCURRENCY_DECL RELAY_EXPORT_DECL
#   else
#       define RELAY_CONCURRENCY_DECL RELAY_IMPORT_DECL
#   endif
# endif


#endif  // RELAY_CONCURRENCY_CONFIG_HPP

//  $CUSTOM_FOOTER$
