#pragma once

#include <concepts>
#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include "boost/pfr.hpp"

namespace kvlog
{

//=============================================================================
// Implementation details - not part of the public API
//=============================================================================
namespace detail
{
/// Helper for static_asserts in discarded if constexpr branches
template <typename T> inline constexpr bool kAlwaysFalse = false;

//-----------------------------------------------------------------------------
// Scalar classification
//
// bool and the character types are integral in the standard library's sense,
// but they are captured as their own primitive kinds and must never be picked
// up by the integer overloads.
//-----------------------------------------------------------------------------

template <typename T>
concept Character = std::same_as<T, char>     || std::same_as<T, wchar_t>
                 || std::same_as<T, char8_t>  || std::same_as<T, char16_t>
                 || std::same_as<T, char32_t>;

template <typename T>
concept Boolean = std::same_as<T, bool>;

template <typename T>
concept SignedInteger = std::signed_integral<T> && (! Character<T>);

template <typename T>
concept UnsignedInteger = std::unsigned_integral<T> && (! Character<T>) && (! Boolean<T>);

/// Only float and double are widened; long double would lose precision
template <typename T>
concept FloatingPoint = std::same_as<T, float> || std::same_as<T, double>;

template <typename T>
concept BorrowedString = std::same_as<T, std::string_view> || std::same_as<T, char const*>;

/// Types that convert to a Primitive without looking at anything but their value
template <typename T>
concept PrimitiveSource = SignedInteger<T> || UnsignedInteger<T> || FloatingPoint<T>
                       || Boolean<T> || Character<T> || BorrowedString<T>;

/// Widens a character without sign-extending the narrow character types
template <Character T>
constexpr char32_t toChar32(T c) noexcept
{
    return static_cast<char32_t>(static_cast<std::make_unsigned_t<T>>(c));
}

//-----------------------------------------------------------------------------
// Types that capture* can turn into a primitive instead of erasing them
//-----------------------------------------------------------------------------

template <typename T> struct is_optional : std::false_type {};
template <typename T> struct is_optional<std::optional<T>> : std::true_type {};

template <typename T> inline constexpr bool kIsKnownPrimitive = PrimitiveSource<T>;
template <> inline constexpr bool kIsKnownPrimitive<std::string> = true;
template <std::size_t N> inline constexpr bool kIsKnownPrimitive<char[N]> = true;
template <typename T> inline constexpr bool kIsKnownPrimitive<std::optional<T>> = kIsKnownPrimitive<T>;

//-----------------------------------------------------------------------------
// Structure detection for the Boost.PFR integration
//-----------------------------------------------------------------------------

template <typename T>
concept StringLike = std::is_convertible_v<T const&, std::string_view>;

/// A range that is streamed as a sequence (strings are leaves, not sequences)
template <typename T>
concept Sequence = std::ranges::input_range<T const> && (! StringLike<T>);

template <typename T> struct is_pair : std::false_type {};
template <typename K, typename V> struct is_pair<std::pair<K, V>> : std::true_type {};

/// A range of key-value pairs (std::map, std::unordered_map, ...) that is streamed as a map
template <typename T>
concept MapLike = Sequence<T> && is_pair<std::remove_cv_t<std::ranges::range_value_t<T const>>>::value;

/**
 * @brief An aggregate whose fields Boost.PFR can enumerate together with their names
 *
 * Boost.PFR rejects aggregates with base classes with a hard error, so check
 * Streamable first wherever a derived aggregate may legitimately turn up.
 */
template <typename T>
concept Reflectable = std::is_class_v<T> && std::is_aggregate_v<T> && (! Sequence<T>)
                   && (boost::pfr::tuple_size_v<T> >= 1);

template <typename T>
concept Streamable = requires (std::ostream& os, T const& v) { os << v; };

//-----------------------------------------------------------------------------
// Numeric helpers
//-----------------------------------------------------------------------------

/**
 * @brief Converts a double to an integer type, saturating at the bounds
 *
 * Out of range float to integer conversions are undefined in C++. They
 * saturate here instead and NaN converts to zero.
 */
template <std::integral To>
constexpr To saturatingCast(double v) noexcept
{
    if (v != v)
        return 0;

    if (v <= static_cast<double>(std::numeric_limits<To>::lowest()))
        return std::numeric_limits<To>::lowest();

    // max() of a 64 bit type is not representable as a double and rounds up
    if (v >= static_cast<double>(std::numeric_limits<To>::max()))
        return std::numeric_limits<To>::max();

    return static_cast<To>(v);
}

/// Writes a unicode scalar value as UTF-8
void writeUtf8(std::ostream& os, char32_t c);

/**
 * @brief Writes a quoted character or string the way a debugger shows it
 *
 * The quote character, backslashes and control characters are escaped
 * (\n, \t, \r, \0, otherwise \u{hex}). Everything else is written as UTF-8.
 */
void writeQuoted(std::ostream& os, char32_t c);
void writeQuoted(std::ostream& os, std::string_view s);

} // namespace detail
} // namespace kvlog
