#pragma once

#include <unique-seq/equality.hh>
#include <unique-seq/unique_sequence.hh>

#include <initializer_list>
#include <type_traits>


/// unique_sequence<T> for types whose operator== is an equivalence relation, plus mutable element access.
///
/// Holds the same guarantees as unique_sequence<T> (no two elements compare equal, insertion order is kept)
/// and forwards every read and insertion operation to it.
/// On top of that it hands out mutable references, iterators, and a mutable span.
///
/// Writing through those is the caller's responsibility: assigning a value that equals another stored element
/// breaks uniqueness. The container does not detect that. Later operations stay memory safe,
/// but duplicate detection results are unspecified until the duplicate is gone.
///
///     auto seq = uq::strict_unique_sequence<int>(uq::unique_sequence<int>());
///     seq.push_back(1);
///     seq.push_back(2);
///     seq[0] = 10;                      // fine, 10 is not present
///
/// T must satisfy strict_equality_comparable, i.e. specialize uq::strict_equality<T> (see equality.hh).
/// double and float never qualify because NaN != NaN.
///
/// Converts to and from unique_sequence<T> by moving the backing storage, no element is touched.
/// There is no default constructor: a strict sequence always starts out as a wrapped unique_sequence<T>,
/// e.g. uq::strict_unique_sequence<int>(uq::unique_sequence<int>()).
template <class T>
struct uq::strict_unique_sequence
{
    static_assert(strict_equality_comparable<T>,
                  "strict_unique_sequence<T> requires an operator== that is an equivalence relation, "
                  "specialize uq::strict_equality<T> if T has one");

    using value_type = T;
    using iterator = T*;
    using const_iterator = T const*;

    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T& operator[](isize i) { return _sequence._elements[i]; }
    [[nodiscard]] T const& operator[](isize i) const { return _sequence[i]; }

    /// Precondition: !empty().
    [[nodiscard]] T& front() { return _sequence._elements.front(); }
    [[nodiscard]] T const& front() const { return _sequence.front(); }

    /// Precondition: !empty().
    [[nodiscard]] T& back() { return _sequence._elements.back(); }
    [[nodiscard]] T const& back() const { return _sequence.back(); }

    [[nodiscard]] T* data() { return _sequence._elements.data(); }
    [[nodiscard]] T const* data() const { return _sequence.data(); }

    // iterators
public:
    [[nodiscard]] T* begin() { return _sequence._elements.begin(); }
    [[nodiscard]] T* end() { return _sequence._elements.end(); }
    [[nodiscard]] T const* begin() const { return _sequence.begin(); }
    [[nodiscard]] T const* end() const { return _sequence.end(); }

    // queries
public:
    [[nodiscard]] isize size() const { return _sequence.size(); }
    [[nodiscard]] bool empty() const { return _sequence.empty(); }
    [[nodiscard]] isize capacity() const { return _sequence.capacity(); }
    [[nodiscard]] bool contains(T const& value) const { return _sequence.contains(value); }
    [[nodiscard]] isize index_of(T const& value) const { return _sequence.index_of(value); }

    // views
public:
    [[nodiscard]] uq::span<T const> as_span() const { return _sequence.as_span(); }
    [[nodiscard]] uq::span<T> as_mutable_span()
    {
        return uq::span<T>(_sequence._elements.data(), _sequence._elements.size());
    }
    [[nodiscard]] uq::vector<T> const& elements() const { return _sequence.elements(); }

    // insertion
public:
    /// See unique_sequence<T>::push_back.
    uq::optional<T> push_back(T value) { return _sequence.push_back(uq::move(value)); }

    /// See unique_sequence<T>::extend_from.
    template <class Range>
        requires impl::element_range_of<Range, T>
    uq::vector<T> extend_from(Range&& range)
    {
        return _sequence.extend_from(uq::forward<Range>(range));
    }
    uq::vector<T> extend_from(std::initializer_list<T> init) { return _sequence.extend_from(init); }

    template <class Range>
        requires impl::element_range_of<Range, T>
    void push_back_range(Range&& range)
    {
        _sequence.push_back_range(uq::forward<Range>(range));
    }
    void push_back_range(std::initializer_list<T> init) { _sequence.push_back_range(init); }

    // removal
public:
    uq::optional<T> pop_back() { return _sequence.pop_back(); }
    void clear() { _sequence.clear(); }

    // capacity
public:
    void reserve(isize count) { _sequence.reserve(count); }

    // conversion
public:
    /// Moves the contents out as a (non-strict) unique_sequence, leaving this one empty.
    [[nodiscard]] unique_sequence<T> extract_unique_sequence() { return uq::move(_sequence); }

    /// Read-only view of the contents as a (non-strict) unique_sequence.
    [[nodiscard]] unique_sequence<T> const& as_unique_sequence() const { return _sequence; }

    /// Moves all elements out as a plain vector, leaving the sequence empty.
    [[nodiscard]] uq::vector<T> extract_vector() { return _sequence.extract_vector(); }

    // comparison
public:
    [[nodiscard]] friend bool operator==(strict_unique_sequence const& lhs, strict_unique_sequence const& rhs)
    {
        return lhs._sequence == rhs._sequence;
    }

    // ctors
public:
    /// Takes over the storage of an existing unique sequence.
    explicit strict_unique_sequence(unique_sequence<T> sequence) : _sequence(uq::move(sequence)) {}

    strict_unique_sequence(strict_unique_sequence&&) noexcept = default;
    strict_unique_sequence& operator=(strict_unique_sequence&&) noexcept = default;
    strict_unique_sequence(strict_unique_sequence const&) = default;
    strict_unique_sequence& operator=(strict_unique_sequence const&) = default;
    ~strict_unique_sequence() = default;

private:
    unique_sequence<T> _sequence;
};
