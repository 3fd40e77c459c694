#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

// =========================================================================================================
// Equality strength of element types
// =========================================================================================================
//
// unique_sequence<T> only needs T's operator== to decide "is this a duplicate?".
// That operator does not have to be an equivalence relation: for floating point, NaN == NaN is false,
// so a sequence of doubles can hold several NaNs and still be "unique" under its own comparison.
//
// strict_unique_sequence<T> additionally hands out mutable element access. It requires that T's
// operator== is reflexive, symmetric and transitive. C++ cannot detect that, so it is an opt-in trait:
//
//   struct point { int x, y; bool operator==(point const&) const = default; };
//   template <>
//   struct uq::strict_equality<point> : std::true_type {};
//
// Opted in by default:
//   integers (incl. bool and character types), enums, pointers, member pointers, nullptr_t
//   std::basic_string and std::basic_string_view (compare characters, which are integers)
//   std::pair<A, B> if both A and B are strict
// Floating point types never are, neither is anything containing them.

namespace uq
{
/// T provides an operator== usable for duplicate detection.
template <class T>
concept approximately_equality_comparable = requires(T const& a, T const& b) {
    { a == b } -> std::convertible_to<bool>;
};

/// Customization point: specialize as std::true_type for types whose operator== is an equivalence relation.
template <class T>
struct strict_equality
  : std::bool_constant<std::is_integral_v<T> || std::is_enum_v<T> || std::is_pointer_v<T>
                       || std::is_member_pointer_v<T> || std::is_null_pointer_v<T>>
{
};

template <class CharT, class Traits, class Alloc>
struct strict_equality<std::basic_string<CharT, Traits, Alloc>> : strict_equality<CharT>
{
};

template <class CharT, class Traits>
struct strict_equality<std::basic_string_view<CharT, Traits>> : strict_equality<CharT>
{
};

template <class A, class B>
struct strict_equality<std::pair<A, B>> : std::bool_constant<strict_equality<A>::value && strict_equality<B>::value>
{
};

/// T provides an operator== that is a full equivalence relation.
template <class T>
concept strict_equality_comparable = approximately_equality_comparable<T> && strict_equality<std::remove_cv_t<T>>::value;
} // namespace uq
