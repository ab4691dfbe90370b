//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/config.hpp
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

#ifndef RELAY_CONFIG_HPP
#define RELAY_CONFIG_HPP


/*
    Detect the platform's symbol visibility conventions.
*/
# if defined _WIN32 || defined __CYGWIN__
#   define RELAY_EXPORT_DECL    __declspec(dllexport)
#   define RELAY_IMPORT_DECL    __declspec(dllimport)
# elif defined __GNUC__
#   define RELAY_EXPORT_DECL    __attribute__((visibility("default")))
#   define RELAY_IMPORT_DECL    __attribute__((visibility("default")))
# else
#   define RELAY_EXPORT_DECL
#   define RELAY_IMPORT_DECL
# endif


#endif  // RELAY_CONFIG_HPP

//  $CUSTOM_FOOTER$
