//  $IAPPA_COPYRIGHT:2008$
//  $CUSTOM_HEADER$

//
//  relay/concurrency/sequence.inl
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
    Sequence Iterator
*/
template<class T>
inline
Sequence<T>::Iterator::Iterator(const Sequence& s)
    : seq{s}
    , current{s.next()}
{
}


template<class T>
inline typename Sequence<T>::Iterator::reference
Sequence<T>::Iterator::operator*() const
{
    return *current;
}


template<class T>
inline typename Sequence<T>::Iterator&
Sequence<T>::Iterator::operator++()
{
    current = seq.next();
    return *this;
}


template<class T>
inline typename Sequence<T>::Iterator::pointer
Sequence<T>::Iterator::operator->() const
{
    return current.get_ptr();
}


/*
    Sequence
*/
template<class T>
inline
Sequence<T>::Sequence(Generator g)
    : genp{std::make_shared<Generator>(std::move(g))}
{
}


template<class T>
inline typename Sequence<T>::Iterator
Sequence<T>::begin() const
{
    return Iterator(*this);
}


template<class T>
inline typename Sequence<T>::Iterator
Sequence<T>::end() const
{
    return Iterator();
}


template<class T>
optional<T>
Sequence<T>::next() const
{
    optional<T> value;

    if (genp && *genp)
        value = (*genp)();

    return value;
}


template<class T>
inline
Sequence<T>::operator bool() const
{
    return genp != nullptr;
}


}   // Concurrency
}   // Relay

//  $CUSTOM_FOOTER$
