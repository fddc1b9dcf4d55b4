//===----------------------------------------------------------------------===//
//
// Part of the Sentinel project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/common/IntegerHelpers.hpp
// Purpose: Provide reusable helpers for manipulating fixed-width integers while
//          preserving two's-complement semantics.
// Key invariants: Helper functions never trigger undefined behaviour when
//                 operating on signed integers; conversions honour the selected
//                 overflow policy.
// Ownership/Lifetime: Header-only utilities with no dynamic ownership.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace sentinel::common::integer
{

using Value = long long;

/// @brief Indicates how sign-extension should be applied when widening values.
enum class Signedness
{
    Signed,
    Unsigned,
};

/// @brief Selects the behaviour used when narrowing would overflow.
enum class OverflowPolicy
{
    Wrap, ///< Wrap around modulo 2^n.
    Trap, ///< Throw std::overflow_error when the value does not fit.
};

namespace detail
{

[[nodiscard]] inline std::uint64_t mask_for(int bits) noexcept
{
    if (bits <= 0)
    {
        return 0;
    }
    if (bits >= 64)
    {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return (std::uint64_t{1} << static_cast<unsigned>(bits)) - 1U;
}

[[nodiscard]] inline Value min_for(int bits) noexcept
{
    if (bits <= 0)
    {
        return 0;
    }
    if (bits >= 64)
    {
        return std::numeric_limits<Value>::min();
    }
    const std::uint64_t sign = std::uint64_t{1} << static_cast<unsigned>(bits - 1);
    return -static_cast<Value>(sign);
}

[[nodiscard]] inline Value max_for(int bits) noexcept
{
    if (bits <= 0)
    {
        return 0;
    }
    if (bits >= 64)
    {
        return std::numeric_limits<Value>::max();
    }
    const std::uint64_t payload = (std::uint64_t{1} << static_cast<unsigned>(bits - 1)) - 1U;
    return static_cast<Value>(payload);
}

} // namespace detail

/// @brief Widen @p value from @p bits to 64 bits using the requested signedness.
[[nodiscard]] inline Value widen_to(Value value, int bits, Signedness signedness) noexcept
{
    if (bits >= 64)
    {
        return value;
    }

    const std::uint64_t mask = detail::mask_for(bits);
    const std::uint64_t truncated = static_cast<std::uint64_t>(value) & mask;
    if (signedness == Signedness::Unsigned)
    {
        return static_cast<Value>(truncated);
    }
    if (bits <= 0)
    {
        return 0;
    }
    const std::uint64_t signBit = std::uint64_t{1} << static_cast<unsigned>(bits - 1);
    if ((truncated & signBit) == 0)
    {
        return static_cast<Value>(truncated);
    }
    const std::uint64_t extend = detail::mask_for(64) ^ mask;
    return static_cast<Value>(truncated | extend);
}

/// @brief Narrow @p value to @p bits while applying @p policy on overflow.
/// @details Wrap reinterprets the low @p bits as a signed value; Trap throws
///          std::overflow_error when @p value is outside the signed range.
[[nodiscard]] inline Value narrow_to(Value value, int bits, OverflowPolicy policy)
{
    if (bits >= 64)
    {
        return value;
    }

    if (policy == OverflowPolicy::Wrap)
    {
        return widen_to(value, bits, Signedness::Signed);
    }

    if (value < detail::min_for(bits))
    {
        throw std::overflow_error("integer narrowing underflow");
    }
    if (value > detail::max_for(bits))
    {
        throw std::overflow_error("integer narrowing overflow");
    }
    return value;
}

/// @brief Return true when @p value is representable as a signed @p bits integer.
[[nodiscard]] inline bool fits_signed(Value value, int bits) noexcept
{
    return value >= detail::min_for(bits) && value <= detail::max_for(bits);
}

/// @brief Add two 64-bit values modulo 2^64 without signed overflow UB.
[[nodiscard]] inline Value wrapping_add(Value lhs, Value rhs) noexcept
{
    return static_cast<Value>(static_cast<std::uint64_t>(lhs) + static_cast<std::uint64_t>(rhs));
}

/// @brief Subtract two 64-bit values modulo 2^64 without signed overflow UB.
[[nodiscard]] inline Value wrapping_sub(Value lhs, Value rhs) noexcept
{
    return static_cast<Value>(static_cast<std::uint64_t>(lhs) - static_cast<std::uint64_t>(rhs));
}

/// @brief Multiply two 64-bit values modulo 2^64 without signed overflow UB.
[[nodiscard]] inline Value wrapping_mul(Value lhs, Value rhs) noexcept
{
    return static_cast<Value>(static_cast<std::uint64_t>(lhs) * static_cast<std::uint64_t>(rhs));
}

} // namespace sentinel::common::integer
