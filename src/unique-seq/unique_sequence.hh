#pragma once

#include <unique-seq/equality.hh>
#include <unique-seq/fwd.hh>
#include <unique-seq/optional.hh>
#include <unique-seq/span.hh>
#include <unique-seq/vector.hh>

#include <initializer_list>
#include <ranges>
#include <type_traits>


namespace uq::impl
{
/// Range whose elements can be turned into T (by copy or by move).
template <class Range, class T>
concept element_range_of = std::ranges::input_range<Range> && std::convertible_to<std::ranges::range_reference_t<Range>, T>;

/// A range passed as Range&& hands its elements over if it owns them (rvalue container)
/// or if it yields prvalues or rvalue references.
/// Views and borrowed ranges (std::span, uq::span, subrange, views::take, ...) refer to elements
/// owned by someone else, possibly by the sequence itself. Those are copied.
template <class Range>
inline constexpr bool moves_elements_out
    = !std::is_lvalue_reference_v<std::ranges::range_reference_t<Range>>
      || (!std::is_lvalue_reference_v<Range> && !std::ranges::borrowed_range<Range>
          && !std::ranges::view<std::remove_cvref_t<Range>>);

template <class Range, class E>
[[nodiscard]] constexpr decltype(auto) forward_element(E& element)
{
    if constexpr (moves_elements_out<Range> && !std::is_const_v<E>)
        return static_cast<E&&>(element);
    else
        return static_cast<E const&>(element);
}
} // namespace uq::impl


/// Ordered container that never holds two elements comparing equal under T's operator==.
///
/// Elements keep their insertion order. Every insertion does a linear membership scan,
/// so single insertion is O(n) and bulk insertion O(n^2). This is intentional: there is no hashing,
/// which keeps the container usable for types whose operator== is not hash-compatible (e.g. floating point).
///
/// Duplicates are not errors. Every insertion reports rejected elements through its return value:
///
///     uq::unique_sequence<int> seq;
///     seq.push_back(1);                 // empty optional: accepted
///     auto r = seq.push_back(1);        // r.value() == 1: rejected, handed back
///
///     auto [unique, rejected] = uq::unique_sequence<int>::create_from({1, 33, 2, 0, 33, 4, 56, 2});
///     // unique:   [1, 33, 2, 0, 4, 56]
///     // rejected: [33, 2]
///
/// Read access behaves like a const uq::vector<T> (indexing, size, iteration, span).
/// There is no mutable element access: changing an element in place could create a duplicate.
/// Types whose operator== is an equivalence relation can opt into mutable access via strict_unique_sequence<T>.
///
/// Not thread-safe. Callers sharing an instance between threads must guard it with their own mutex.
template <class T>
struct uq::unique_sequence
{
    static_assert(std::is_object_v<T> && !std::is_const_v<T>, "unique_sequence elements must be non-const objects");

    using value_type = T;
    using const_iterator = T const*;

    // element access (read-only)
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] T const& operator[](isize i) const { return _elements[i]; }

    /// Precondition: !empty().
    [[nodiscard]] T const& front() const { return _elements.front(); }

    /// Precondition: !empty().
    [[nodiscard]] T const& back() const { return _elements.back(); }

    [[nodiscard]] T const* data() const { return _elements.data(); }

    // iterators (read-only)
public:
    [[nodiscard]] T const* begin() const { return _elements.begin(); }
    [[nodiscard]] T const* end() const { return _elements.end(); }

    // queries
public:
    [[nodiscard]] isize size() const { return _elements.size(); }
    [[nodiscard]] bool empty() const { return _elements.empty(); }
    [[nodiscard]] isize capacity() const { return _elements.capacity(); }

    [[nodiscard]] bool contains(T const& value) const
        requires approximately_equality_comparable<T>
    {
        return _elements.contains(value);
    }

    /// Position of the element equal to value, -1 if there is none.
    [[nodiscard]] isize index_of(T const& value) const
        requires approximately_equality_comparable<T>
    {
        return _elements.index_of(value);
    }

    // views
public:
    [[nodiscard]] uq::span<T const> as_span() const { return uq::span<T const>(_elements.data(), _elements.size()); }

    /// The backing array, read-only.
    /// This is also the stable element sequence that serialization walks.
    [[nodiscard]] uq::vector<T> const& elements() const { return _elements; }

    // factories
public:
    /// Builds a sequence from a range, in order.
    /// Elements equal to an already accepted element go to `rejected`, in the order they were encountered.
    /// Elements of an owning rvalue range are moved, elements of lvalue ranges and views are copied.
    template <class Range>
        requires approximately_equality_comparable<T> && impl::element_range_of<Range, T>
    [[nodiscard]] static dedup_result<T> create_from(Range&& range)
    {
        dedup_result<T> result;
        result.rejected = result.unique.extend_from(uq::forward<Range>(range));
        return result;
    }
    [[nodiscard]] static dedup_result<T> create_from(std::initializer_list<T> init)
        requires approximately_equality_comparable<T>
    {
        return unique_sequence::create_from(uq::span<T const>(init.begin(), isize(init.size())));
    }

    /// Like create_from, but drops the rejected elements.
    template <class Range>
        requires approximately_equality_comparable<T> && impl::element_range_of<Range, T>
    [[nodiscard]] static unique_sequence create_deduplicated(Range&& range)
    {
        unique_sequence result;
        result.push_back_range(uq::forward<Range>(range));
        return result;
    }
    [[nodiscard]] static unique_sequence create_deduplicated(std::initializer_list<T> init)
        requires approximately_equality_comparable<T>
    {
        return unique_sequence::create_deduplicated(uq::span<T const>(init.begin(), isize(init.size())));
    }

    /// Adopts `elements` as-is if no two of them compare equal, without moving any element.
    /// Returns an empty optional (and drops `elements`) otherwise.
    [[nodiscard]] static uq::optional<unique_sequence> try_create_from_unique(uq::vector<T> elements)
        requires approximately_equality_comparable<T>
    {
        for (isize i = 1; i < elements.size(); ++i)
            for (isize j = 0; j < i; ++j)
                if (elements[j] == elements[i])
                    return uq::nullopt;

        unique_sequence result;
        result._elements = uq::move(elements);
        return uq::optional<unique_sequence>(uq::move(result));
    }

    // insertion
public:
    /// Appends value unless an equal element is already present.
    /// Returns an empty optional if value was appended, or value itself (untouched) if it was rejected.
    /// The sequence is unchanged on rejection.
    uq::optional<T> push_back(T value)
        requires approximately_equality_comparable<T>
    {
        if (_elements.contains(value))
            return uq::optional<T>(uq::move(value));

        _elements.push_back(uq::move(value));
        return {};
    }

    /// Appends every element of range that is not yet present, checking against the current state,
    /// i.e. including elements accepted earlier in the same call.
    /// Returns the rejected elements in the order they were encountered.
    /// Same result as calling push_back per element and collecting what it hands back.
    ///
    /// Accepted elements are appended after range was fully iterated,
    /// so range may view the sequence's own elements.
    template <class Range>
        requires approximately_equality_comparable<T> && impl::element_range_of<Range, T>
    uq::vector<T> extend_from(Range&& range)
    {
        uq::vector<T> accepted;
        uq::vector<T> duplicates;
        for (auto&& element : range)
        {
            T value(impl::forward_element<Range>(element));
            if (_elements.contains(value) || accepted.contains(value))
                duplicates.push_back(uq::move(value));
            else
                accepted.push_back(uq::move(value));
        }

        if (_elements.empty() && _elements.capacity() < accepted.size())
            _elements = uq::move(accepted);
        else
        {
            _elements.reserve(_elements.size() + accepted.size());
            for (auto& value : accepted)
                _elements.push_back(uq::move(value));
        }
        return duplicates;
    }
    uq::vector<T> extend_from(std::initializer_list<T> init)
        requires approximately_equality_comparable<T>
    {
        return extend_from(uq::span<T const>(init.begin(), isize(init.size())));
    }

    /// Appends every element of range that is not yet present, dropping the rest.
    /// Use extend_from to get the duplicates back.
    template <class Range>
        requires approximately_equality_comparable<T> && impl::element_range_of<Range, T>
    void push_back_range(Range&& range)
    {
        extend_from(uq::forward<Range>(range));
    }
    void push_back_range(std::initializer_list<T> init)
        requires approximately_equality_comparable<T>
    {
        push_back_range(uq::span<T const>(init.begin(), isize(init.size())));
    }

    // removal
public:
    /// Removes and returns the last element, or returns an empty optional if the sequence is empty.
    uq::optional<T> pop_back()
    {
        if (_elements.empty())
            return uq::nullopt;

        return uq::optional<T>(_elements.pop_back());
    }

    /// Removes all elements, keeps the capacity.
    void clear() { _elements.clear(); }

    // capacity
public:
    void reserve(isize count) { _elements.reserve(count); }

    // conversion
public:
    /// Moves all elements out as a plain vector, in stored order, leaving the sequence empty.
    /// No element is copied or moved, the vector adopts the storage.
    [[nodiscard]] uq::vector<T> extract_vector() { return uq::move(_elements); }

    // comparison
public:
    /// Same elements in the same order.
    [[nodiscard]] friend bool operator==(unique_sequence const& lhs, unique_sequence const& rhs)
        requires approximately_equality_comparable<T>
    {
        return lhs._elements == rhs._elements;
    }

    // ctors
public:
    unique_sequence() = default;
    ~unique_sequence() = default;

    unique_sequence(unique_sequence&&) noexcept = default;
    unique_sequence& operator=(unique_sequence&&) noexcept = default;
    unique_sequence(unique_sequence const&) = default;
    unique_sequence& operator=(unique_sequence const&) = default;

private:
    friend struct strict_unique_sequence<T>;

    uq::vector<T> _elements;
};

/// Result of unique_sequence<T>::create_from.
/// Supports structured bindings: auto [unique, rejected] = uq::unique_sequence<int>::create_from(...);
template <class T>
struct uq::dedup_result
{
    unique_sequence<T> unique;
    vector<T> rejected;
};
