#pragma once

#include <unique-seq/allocation.hh>
#include <unique-seq/assertf.hh>
#include <unique-seq/span.hh>

#include <initializer_list>
#include <type_traits>


/// Dynamically allocated vector of T elements with value semantics.
/// Similar to std::vector with back-only growth (push, pop, reserve).
/// Owns the underlying memory through uq::allocation<T>.
///
/// This is the "plain ordered array" of the library: unique_sequence<T> stores one, exposes it read-only,
/// and hands it back out via extract_vector(). Rejected and duplicate elements are returned in one, too.
///
/// Exception guarantees for push/emplace:
/// - Allocation failures (std::bad_alloc) leave the vector unchanged.
/// - Element construction failures leave size and live range unchanged.
/// - Reallocation always uses move construction. The new element is constructed before the
///   old elements are moved, so `v.push_back(v[0])` is safe during growth.
/// - Any reallocation invalidates pointers, references, and iterators.
template <class T>
struct uq::vector
{
    static_assert(std::is_object_v<T> && !std::is_const_v<T>, "vector elements must be non-const objects");

    using value_type = T;
    using iterator = T*;
    using const_iterator = T const*;

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        UQ_ASSERTF(0 <= i && i < size(), "index {} out of bounds (size: {})", i, size());
        return _data.obj_start[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        UQ_ASSERTF(0 <= i && i < size(), "index {} out of bounds (size: {})", i, size());
        return _data.obj_start[i];
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& front()
    {
        UQ_ASSERT(!empty(), "front() called on empty vector");
        return *_data.obj_start;
    }
    [[nodiscard]] constexpr T const& front() const
    {
        UQ_ASSERT(!empty(), "front() called on empty vector");
        return *_data.obj_start;
    }

    /// Precondition: !empty().
    [[nodiscard]] constexpr T& back()
    {
        UQ_ASSERT(!empty(), "back() called on empty vector");
        return *(_data.obj_end - 1);
    }
    [[nodiscard]] constexpr T const& back() const
    {
        UQ_ASSERT(!empty(), "back() called on empty vector");
        return *(_data.obj_end - 1);
    }

    /// May be nullptr if the vector never allocated.
    [[nodiscard]] constexpr T* data() { return _data.obj_start; }
    [[nodiscard]] constexpr T const* data() const { return _data.obj_start; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data.obj_start; }
    [[nodiscard]] constexpr T* end() { return _data.obj_end; }
    [[nodiscard]] constexpr T const* begin() const { return _data.obj_start; }
    [[nodiscard]] constexpr T const* end() const { return _data.obj_end; }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] constexpr bool empty() const { return _data.obj_start == _data.obj_end; }

    /// Number of elements that can be stored without reallocation.
    [[nodiscard]] constexpr isize capacity() const { return size() + _data.capacity_back(); }

    /// Index of the first element that compares equal to value, -1 if there is none.
    /// Linear scan using T's operator==.
    [[nodiscard]] constexpr isize index_of(T const& value) const
        requires requires(T const& v) { bool(v == v); }
    {
        for (auto p = _data.obj_start; p != _data.obj_end; ++p)
            if (*p == value)
                return p - _data.obj_start;
        return -1;
    }

    /// True if any element compares equal to value.
    [[nodiscard]] constexpr bool contains(T const& value) const
        requires requires(T const& v) { bool(v == v); }
    {
        return index_of(value) >= 0;
    }

    // factories
public:
    /// Empty vector that can take `capacity` elements without reallocating.
    [[nodiscard]] static vector create_with_capacity(isize capacity)
    {
        return vector::create_from_allocation(uq::allocation<T>::create_empty(capacity));
    }

    /// Deep copy of the provided span.
    [[nodiscard]] static vector create_copy_of(uq::span<T const> source)
    {
        return vector::create_from_allocation(uq::allocation<T>::create_copy_of(source));
    }

    /// Adopts an allocation, its live objects become the vector's elements.
    [[nodiscard]] static vector create_from_allocation(uq::allocation<T> data)
    {
        vector v;
        v._data = uq::move(data);
        return v;
    }

    // appending
public:
    /// Constructs a new element at the back, allocating if necessary.
    /// Amortized O(1).
    template <class... Args>
    constexpr T& emplace_back(Args&&... args)
    {
        static_assert(
            requires { T(uq::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                         "the provided argument types");

        if (_data.capacity_back() < 1) [[unlikely]]
            return emplace_back_with_growth(uq::forward<Args>(args)...);

        auto const p = new (uq::placement_new, _data.obj_end) T(uq::forward<Args>(args)...);
        _data.obj_end++; // _after_ so exceptions in T(...) leave state valid
        return *p;
    }

    constexpr T& push_back(T const& value) { return emplace_back(value); }
    constexpr T& push_back(T&& value) { return emplace_back(uq::move(value)); }

    // removals
public:
    /// Removes and returns the last element by move.
    /// Precondition: !empty().
    [[nodiscard]] constexpr T pop_back()
    {
        UQ_ASSERT(!empty(), "cannot pop from empty vector");
        auto value = uq::move(*(_data.obj_end - 1));
        (_data.obj_end - 1)->~T();
        _data.obj_end--;
        return value;
    }

    /// Destroys all elements, keeps the capacity.
    constexpr void clear()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    // capacity management
public:
    /// Ensures at least `count` elements can be stored without reallocation.
    void reserve(isize count)
    {
        if (count <= capacity())
            return;

        auto new_data = uq::allocation<T>::create_empty(count);
        new_data.obj_start += size();
        new_data.obj_end = new_data.obj_start;
        impl::move_create_objects_to_reverse(new_data.obj_start, _data.obj_start, _data.obj_end);
        _data = uq::move(new_data);
    }

    // comparison
public:
    /// Element-wise equality, in order.
    [[nodiscard]] friend bool operator==(vector const& lhs, vector const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.size() != rhs.size())
            return false;
        for (isize i = 0; i < lhs.size(); ++i)
            if (!(lhs._data.obj_start[i] == rhs._data.obj_start[i]))
                return false;
        return true;
    }

    // ctors
public:
    vector() = default;
    ~vector() = default;

    vector(std::initializer_list<T> init)
      : _data(uq::allocation<T>::create_copy_of(uq::span<T const>(init.begin(), isize(init.size()))))
    {
    }

    vector(vector&&) noexcept = default;
    vector& operator=(vector&&) noexcept = default;

    vector(vector const& rhs)
        requires std::is_copy_constructible_v<T>
      : _data(uq::allocation<T>::create_copy_of(uq::span<T const>(rhs.data(), rhs.size())))
    {
    }
    vector& operator=(vector const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
            _data = uq::allocation<T>::create_copy_of(uq::span<T const>(rhs.data(), rhs.size()));
        return *this;
    }

private:
    /// Doubles the capacity (at least 4 elements), then constructs the new element in the new
    /// allocation before moving the old elements over.
    /// The old elements stay valid during construction, so args may refer to them.
    template <class... Args>
    UQ_COLD_FUNC T& emplace_back_with_growth(Args&&... args)
    {
        auto const new_capacity = uq::max(uq::max(capacity() * 2, size() + 1), isize(4));
        auto new_data = uq::allocation<T>::create_empty(new_capacity);

        // new element goes right behind where the old elements will be
        new_data.obj_start += size();
        new_data.obj_end = new_data.obj_start;
        auto const p = new (uq::placement_new, new_data.obj_end) T(uq::forward<Args>(args)...);
        new_data.obj_end++;

        impl::move_create_objects_to_reverse(new_data.obj_start, _data.obj_start, _data.obj_end);

        // destroys the moved-from old elements
        _data = uq::move(new_data);
        return *p;
    }

    uq::allocation<T> _data;
};
