#pragma once

#include <unique-seq/fwd.hh>
#include <unique-seq/utility.hh>

#include <cstring>
#include <type_traits>

// Raw object range helpers for uq::allocation<T> and uq::vector<T>.
// All of them keep a live range [start, end) consistent if a constructor throws midway:
// the pointer passed by reference is only advanced after an object was constructed.

namespace uq::impl
{
/// Ends the lifetime of [start, end), last object first. Null or empty ranges are fine.
template <class T>
constexpr void destroy_objects_in_reverse(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "incomplete element type");

    if constexpr (!std::is_trivially_destructible_v<T>)
        while (end != start)
            (--end)->~T();
}

/// Copies [src_start, src_end) into raw memory at dest_end, growing dest_end by one per object.
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(std::is_copy_constructible_v<T>, "element type is not copyable");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        if (src_start != src_end)
        {
            std::memcpy(static_cast<void*>(dest_end), src_start, sizeof(T) * (src_end - src_start));
            dest_end += src_end - src_start;
        }
    }
    else
    {
        for (; src_start != src_end; ++src_start, ++dest_end)
            new (uq::placement_new, dest_end) T(*src_start);
    }
}

/// Moves [src_start, src_end) into the raw memory right before dest_start, back to front,
/// shrinking dest_start by one per object.
/// This is how the vector grows: the new element (or nothing) already sits at dest_start
/// and the old elements are prepended to it.
/// The moved-from sources stay alive; the caller destroys them.
template <class T>
constexpr void move_create_objects_to_reverse(T*& dest_start, T* src_start, T* src_end)
{
    while (src_end != src_start)
    {
        --src_end;
        new (uq::placement_new, dest_start - 1) T(uq::move(*src_end));
        --dest_start;
    }
}
} // namespace uq::impl
