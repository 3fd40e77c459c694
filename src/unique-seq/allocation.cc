#include "allocation.hh"

#include <unique-seq/assertf.hh>

#include <new>

uq::byte* uq::impl::allocate_bytes(isize bytes, isize alignment)
{
    UQ_ASSERTF(bytes >= 0, "cannot allocate a negative number of bytes ({})", bytes);
    UQ_ASSERTF(uq::is_power_of_two(alignment), "alignment must be a power of 2, got {}", alignment);

    // Contract: bytes == 0 always returns nullptr
    if (bytes == 0)
        return nullptr;

    // throws std::bad_alloc on failure
    return static_cast<byte*>(::operator new(std::size_t(bytes), std::align_val_t(alignment)));
}

void uq::impl::deallocate_bytes(byte* p, isize bytes, isize alignment) noexcept
{
    if (p == nullptr)
        return;

    ::operator delete(p, std::size_t(bytes), std::align_val_t(alignment));
}
