#pragma once

#include <unique-seq/assert.hh>
#include <unique-seq/fwd.hh>

#include <type_traits>

// Small helpers used by the containers, kept here so the headers don't need <utility>, <algorithm> or <new>:
// move/forward/exchange, max, is_power_of_two, and a tagged placement new with storage_for<T>.

namespace uq
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

template <class T>
[[nodiscard]] UQ_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] UQ_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] UQ_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// e.g. obj_start = uq::exchange(rhs.obj_start, nullptr);
template <class T, class U = T>
[[nodiscard]] UQ_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = uq::forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Comparison
// =========================================================================================================

/// b if neither is larger
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    static_assert(requires { a < b; }, "T must support operator<");
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

// =========================================================================================================
// Alignment
// =========================================================================================================

template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    return value > 0 && (value & (value - 1)) == 0;
}

// =========================================================================================================
// Object storage
// =========================================================================================================

struct placement_new_t
{
};

/// Tag selecting the placement operator new below
/// Usage:
///   new (uq::placement_new, ptr) T(args...);
inline constexpr placement_new_t placement_new = {};

/// Uninitialized storage for exactly one T
/// The owner decides when `value` is alive and is responsible for constructing/destroying it.
/// Trivially destructible (and trivially copyable) whenever T is.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {}

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};
} // namespace uq

[[nodiscard]] UQ_FORCE_INLINE void* operator new(std::size_t, uq::placement_new_t, void* p) noexcept
{
    return p;
}

// only called if a constructor invoked via uq::placement_new throws
UQ_FORCE_INLINE void operator delete(void*, uq::placement_new_t, void*) noexcept {}
