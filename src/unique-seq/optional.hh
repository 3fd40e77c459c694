#pragma once

#include <unique-seq/assert.hh>
#include <unique-seq/fwd.hh>
#include <unique-seq/utility.hh>

#include <type_traits>

/// Tag for "no value", see uq::nullopt.
struct uq::nullopt_t
{
    enum class _tag // NOLINT(readability-identifier-naming)
    {
        value
    };
    explicit constexpr nullopt_t(_tag) {}
};

namespace uq
{
inline constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_tag::value};
} // namespace uq

/// Maybe-a-T, the result type of sequence operations that might hand an element back:
///
///   push_back(x)  -> empty if x was accepted, x itself if it was a duplicate
///   pop_back()    -> the removed last element, empty if the sequence was empty
///
/// Access is only through value(), which asserts engagement. There is no operator* or operator->.
/// Trivially copyable and destructible whenever T is.
/// Otherwise moving from an engaged optional leaves the source empty (unlike std::optional).
template <class T>
struct uq::optional
{
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "optional<T> needs a non-array object type");

    // access
public:
    [[nodiscard]] bool has_value() const { return _engaged; }

    /// Precondition: has_value().
    [[nodiscard]] T& value() &
    {
        UQ_ASSERT(_engaged, "value() on empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        UQ_ASSERT(_engaged, "value() on empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        UQ_ASSERT(_engaged, "value() on empty optional");
        return uq::move(_storage.value);
    }

    // comparison
public:
    /// Equal if both are empty or both hold equal values.
    [[nodiscard]] friend bool operator==(optional const& lhs, optional const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs._engaged != rhs._engaged)
            return false;
        return !lhs._engaged || lhs._storage.value == rhs._storage.value;
    }

    /// e.g. seq.push_back(2) == 2 checks that 2 was rejected
    [[nodiscard]] friend bool operator==(optional const& lhs, T const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._engaged && lhs._storage.value == rhs;
    }

    [[nodiscard]] friend bool operator==(optional const& lhs, nullopt_t) { return !lhs._engaged; }

    // opt == true would silently convert
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

    // ctors
public:
    optional() = default;
    optional(nullopt_t) {}

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) : _engaged(true) // NOLINT
    {
        new (uq::placement_new, &_storage.value) T(uq::forward<U>(value));
    }

    // trivially copyable T: everything defaulted
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    // everything else
    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (rhs._engaged)
            emplace(rhs._storage.value);
    }
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._engaged)
        {
            emplace(uq::move(rhs._storage.value));
            rhs.reset();
        }
    }
    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (this != &rhs)
        {
            reset();
            if (rhs._engaged)
                emplace(rhs._storage.value);
        }
        return *this;
    }
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (this != &rhs)
        {
            reset();
            if (rhs._engaged)
            {
                emplace(uq::move(rhs._storage.value));
                rhs.reset();
            }
        }
        return *this;
    }
    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        reset();
    }

private:
    template <class... Args>
    void emplace(Args&&... args)
    {
        new (uq::placement_new, &_storage.value) T(uq::forward<Args>(args)...);
        _engaged = true;
    }

    void reset()
    {
        if (_engaged)
        {
            _storage.value.~T();
            _engaged = false;
        }
    }

    uq::storage_for<T> _storage;
    bool _engaged = false;
};
