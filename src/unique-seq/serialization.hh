#pragma once

#include <unique-seq/strict_unique_sequence.hh>
#include <unique-seq/unique_sequence.hh>
#include <unique-seq/vector.hh>

#include <boost/archive/archive_exception.hpp>
#include <boost/core/addressof.hpp>
#include <boost/serialization/collection_size_type.hpp>
#include <boost/serialization/collections_save_imp.hpp>
#include <boost/serialization/detail/stack_constructor.hpp>
#include <boost/serialization/item_version_type.hpp>
#include <boost/serialization/library_version_type.hpp>
#include <boost/serialization/nvp.hpp>
#include <boost/serialization/split_free.hpp>
#include <boost/serialization/throw_exception.hpp>

#include <cstddef>

// Boost.Serialization support (non-intrusive)
//
// All three containers use the collection layout Boost uses for std::list and non-arithmetic std::vector:
//   count, item_version, then every element as "item"
//
// A unique_sequence<T> writes exactly what a uq::vector<T> with the same elements writes.
// Loading a unique_sequence<T> checks the payload: two equal elements throw
// boost::archive::archive_exception (other_exception) and leave the target untouched.
// Element types without a default constructor work via load_construct_data / save_construct_data.
//
// Usage:
//
//   #include <boost/archive/text_oarchive.hpp>
//   #include <unique-seq/serialization.hh>
//
//   boost::archive::text_oarchive oa(stream);
//   oa << seq;

namespace boost::serialization
{
// uq::vector<T>

template <class Archive, class T>
void save(Archive& ar, uq::vector<T> const& v, unsigned int /* version */)
{
    stl::save_collection(ar, v);
}

template <class Archive, class T>
void load(Archive& ar, uq::vector<T>& v, unsigned int /* version */)
{
    library_version_type const library_version(ar.get_library_version());
    item_version_type item_version(0);
    collection_size_type count;
    ar >> BOOST_SERIALIZATION_NVP(count);
    if (library_version_type(3) < library_version)
        ar >> BOOST_SERIALIZATION_NVP(item_version);

    // loads into a fresh vector so a throwing element leaves v as it was
    auto loaded = uq::vector<T>::create_with_capacity(uq::isize(std::size_t(count)));
    for (std::size_t i = 0; i < std::size_t(count); ++i)
    {
        detail::stack_construct<Archive, T> u(ar, item_version);
        ar >> make_nvp("item", u.reference());
        loaded.push_back(uq::move(u.reference()));
        ar.reset_object_address(boost::addressof(loaded.back()), u.address());
    }

    v = uq::move(loaded);
}

template <class Archive, class T>
void serialize(Archive& ar, uq::vector<T>& v, unsigned int version)
{
    split_free(ar, v, version);
}

// uq::unique_sequence<T>

template <class Archive, class T>
void save(Archive& ar, uq::unique_sequence<T> const& s, unsigned int /* version */)
{
    stl::save_collection(ar, s.elements());
}

template <class Archive, class T>
void load(Archive& ar, uq::unique_sequence<T>& s, unsigned int version)
{
    uq::vector<T> elements;
    boost::serialization::load(ar, elements, version);

    // elements are adopted in place, the addresses registered above stay valid
    auto loaded = uq::unique_sequence<T>::try_create_from_unique(uq::move(elements));
    if (!loaded.has_value())
        boost::serialization::throw_exception(
            boost::archive::archive_exception(boost::archive::archive_exception::other_exception,
                                              "unique_sequence payload contains equal elements"));

    s = uq::move(loaded).value();
}

template <class Archive, class T>
void serialize(Archive& ar, uq::unique_sequence<T>& s, unsigned int version)
{
    split_free(ar, s, version);
}

// uq::strict_unique_sequence<T>

template <class Archive, class T>
void save(Archive& ar, uq::strict_unique_sequence<T> const& s, unsigned int version)
{
    boost::serialization::save(ar, s.as_unique_sequence(), version);
}

template <class Archive, class T>
void load(Archive& ar, uq::strict_unique_sequence<T>& s, unsigned int version)
{
    uq::unique_sequence<T> sequence;
    boost::serialization::load(ar, sequence, version);
    s = uq::strict_unique_sequence<T>(uq::move(sequence));
}

template <class Archive, class T>
void serialize(Archive& ar, uq::strict_unique_sequence<T>& s, unsigned int version)
{
    split_free(ar, s, version);
}
} // namespace boost::serialization
