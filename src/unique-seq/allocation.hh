#pragma once

#include <unique-seq/fwd.hh>
#include <unique-seq/impl/object_lifetime_util.hh>
#include <unique-seq/span.hh>
#include <unique-seq/utility.hh>

namespace uq::impl
{
/// Aligned raw storage. Returns nullptr for 0 bytes, throws std::bad_alloc on failure.
/// Preconditions: bytes >= 0, alignment is a power of two.
[[nodiscard]] byte* allocate_bytes(isize bytes, isize alignment);

/// Releases storage from allocate_bytes, called with the same bytes and alignment. Accepts nullptr.
void deallocate_bytes(byte* p, isize bytes, isize alignment) noexcept;
} // namespace uq::impl

/// Owning block of raw storage together with the window of live T objects inside it.
///
///   alloc_start      obj_start          obj_end           alloc_end
///   |  (unused)      |   live objects   |  capacity_back  |
///
/// Destruction destroys the live objects, then frees the block.
/// A move hands over block and objects as they are. This is the only thing that happens
/// when a vector becomes a unique_sequence, a unique_sequence becomes a strict one, or any of them
/// gives its elements back as a vector.
///
/// Not copyable. Containers copy explicitly via create_copy_of.
template <class T>
struct uq::allocation
{
    T* obj_start = nullptr;
    T* obj_end = nullptr;

    byte* alloc_start = nullptr;
    byte* alloc_end = nullptr;

    isize alignment = 0;

    // queries
public:
    /// Free slots behind the last live object.
    [[nodiscard]] isize capacity_back() const
    {
        return (alloc_end - reinterpret_cast<byte const*>(obj_end)) / isize(sizeof(T));
    }

    // factories
public:
    /// Room for `capacity` objects, none of them alive yet.
    [[nodiscard]] static allocation create_empty(isize capacity, isize alignment = alignof(T))
    {
        UQ_ASSERT(capacity >= 0, "negative capacity");
        UQ_ASSERT(alignment >= isize(alignof(T)), "alignment below alignof(T)");

        auto const bytes = capacity * isize(sizeof(T));

        allocation a;
        a.alloc_start = impl::allocate_bytes(bytes, alignment);
        a.alloc_end = a.alloc_start + bytes;
        a.alignment = alignment;
        a.obj_start = reinterpret_cast<T*>(a.alloc_start);
        a.obj_end = a.obj_start;
        return a;
    }

    /// Exactly sized block holding copies of `source`.
    [[nodiscard]] static allocation create_copy_of(span<T const> source)
    {
        auto a = allocation::create_empty(source.size());
        impl::copy_create_objects_to(a.obj_end, source.begin(), source.end());
        return a;
    }

    // ctors
public:
    allocation() = default;
    ~allocation() { release(); }

    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    allocation(allocation&& rhs) noexcept { take(rhs); }
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            // rhs might live inside one of our objects, detach it before destroying them
            allocation incoming;
            incoming.take(rhs);
            release();
            take(incoming);
        }
        return *this;
    }

private:
    void take(allocation& rhs) noexcept
    {
        obj_start = uq::exchange(rhs.obj_start, nullptr);
        obj_end = uq::exchange(rhs.obj_end, nullptr);
        alloc_start = uq::exchange(rhs.alloc_start, nullptr);
        alloc_end = uq::exchange(rhs.alloc_end, nullptr);
        alignment = uq::exchange(rhs.alignment, 0);
    }

    void release() noexcept
    {
        impl::destroy_objects_in_reverse(obj_start, obj_end);
        impl::deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment);
    }
};
