//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/sequence.hpp
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

#ifndef RELAY_CONCURRENCY_SEQUENCE_HPP
#define RELAY_CONCURRENCY_SEQUENCE_HPP

#include "relay/concurrency/config.hpp"
#include "relay/concurrency/types.hpp"
#include "boost/operators.hpp"
#include "boost/optional.hpp"
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>


/*
    Relay Concurrency Library
*/
namespace Relay         {
namespace Concurrency   {


/*
    Sequence

    A lazy, single-pass stream of values pulled from a generator.  The
    generator yields none to end the stream and may throw to fail it.
    Copies share the same position.
*/
template<class T>
class Sequence {
public:
    // Names/Types
    class Iterator;
    using Value     = T;
    using Generator = std::function<optional<T>()>;

    // Construct/Copy
    Sequence() = default;
    explicit Sequence(Generator);

    // Traversal
    optional<T> next() const;
    Iterator    begin() const;
    Iterator    end() const;

    // Conversions
    explicit operator bool() const;

private:
    // Names/Types
    using Generator_ptr = std::shared_ptr<Generator>;

    // Data
    Generator_ptr genp;
};


/*
    Sequence Iterator
*/
template<class T>
class Sequence<T>::Iterator : boost::equality_comparable<typename Sequence<T>::Iterator> {
public:
    // Names/Types
    using iterator_category = std::input_iterator_tag;
    using value_type        = T;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const T*;
    using reference         = const T&;

    // Construct
    Iterator() = default;
    explicit Iterator(const Sequence&);

    // Access
    reference   operator*() const;
    pointer     operator->() const;

    // Traversal
    Iterator& operator++();

    // Comparisons
    inline friend bool operator==(const Iterator& x, const Iterator& y) {
        return !x.current == !y.current;
    }

private:
    // Data
    Sequence    seq;
    optional<T> current;
};


}   // Concurrency
}   // Relay

#include "relay/concurrency/sequence.inl"

#endif  // RELAY_CONCURRENCY_SEQUENCE_HPP

//  $CUSTOM_FOOTER$
