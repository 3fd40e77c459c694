#pragma once

#include <unique-seq/assert.hh>
#include <unique-seq/fwd.hh>

#include <concepts>
#include <initializer_list>
#include <ranges>
#include <type_traits>

/// Pointer + size view into contiguous elements owned by someone else.
///
/// The sequences hand these out as their "slice" view:
///   unique_sequence<T>::as_span()               -> span<T const>
///   strict_unique_sequence<T>::as_mutable_span() -> span<T>
/// Any insertion may reallocate the sequence and dangle previously obtained spans.
///
/// Accessors are const because constness of the view does not propagate to the elements (like std::span).
template <class T>
struct uq::span
{
    // element access
public:
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        UQ_ASSERT(0 <= i && i < _size, "span index out of bounds");
        return _data[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front() const
    {
        UQ_ASSERT(_size > 0, "front() on empty span");
        return _data[0];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back() const
    {
        UQ_ASSERT(_size > 0, "back() on empty span");
        return _data[_size - 1];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }

    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    // ctors
public:
    constexpr span() = default;

    constexpr explicit span(T* data, isize size) : _data(data), _size(size)
    {
        UQ_ASSERT(size >= 0, "negative span size");
    }

    constexpr explicit span(T* first, T* last) : _data(first), _size(last - first)
    {
        UQ_ASSERT(first <= last, "span range ends before it starts");
    }

    /// span<T> -> span<T const>
    template <class U>
        requires(std::is_const_v<T> && std::is_same_v<T, U const>)
    constexpr span(span<U> rhs) : _data(rhs.data()), _size(rhs.size())
    {
    }

    /// Read-only view of a braced list, e.g. for a `span<int const>` parameter called as f({1, 2, 3}).
    /// The list only lives until the end of the full expression.
    constexpr span(std::initializer_list<std::remove_const_t<T>> list)
        requires std::is_const_v<T>
      : _data(list.begin()), _size(isize(list.size()))
    {
    }

    /// Views any contiguous container with data() and size().
    template <class Container>
        requires requires(Container& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr explicit span(Container& c) : _data(c.data()), _size(isize(c.size()))
    {
    }

private:
    T* _data = nullptr;
    isize _size = 0;
};

// a span never owns its elements, iterators stay valid after the span itself is gone
namespace std::ranges
{
template <class T>
inline constexpr bool enable_borrowed_range<uq::span<T>> = true;
} // namespace std::ranges
