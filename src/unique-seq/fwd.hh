#pragma once

#include <cstddef>
#include <cstdint>

// Forward declarations of all unique-seq types plus the integer vocabulary.
// Types are defined outside the namespace as `struct uq::name`, so every header includes this one first.

namespace uq
{
using i64 = std::int64_t;
using byte = std::byte;

/// Sizes and indices are signed. index_of() returns -1 for "not found".
using isize = i64;

// storage
template <class T>
struct allocation;
template <class T>
struct span;
template <class T>
struct vector;

// vocabulary
struct nullopt_t;
template <class T>
struct optional;

// sequences
template <class T>
struct unique_sequence;
template <class T>
struct strict_unique_sequence;
template <class T>
struct dedup_result;
} // namespace uq
