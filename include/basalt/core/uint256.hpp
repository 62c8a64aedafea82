#pragma once

#include <basalt/config.hpp>
#include <basalt/core/int.hpp>

#include <cstdint>

BASALT_NAMESPACE_BEGIN

// All operations below wrap modulo 2^256. The signed variants reinterpret the
// bit pattern as two's complement and return the unsigned bit pattern of the
// result.

inline constexpr bool is_negative(uint256_t const &x) noexcept
{
    return static_cast<int64_t>(x[3]) < 0;
}

inline constexpr uint256_t udiv(uint256_t const &x, uint256_t const &y) noexcept
{
    return y != 0 ? x / y : 0;
}

inline constexpr uint256_t umod(uint256_t const &x, uint256_t const &y) noexcept
{
    return y != 0 ? x % y : 0;
}

// -2^255 / -1 overflows back to -2^255, which is what sdivrem yields
inline constexpr uint256_t sdiv(uint256_t const &x, uint256_t const &y) noexcept
{
    return y != 0 ? intx::sdivrem(x, y).quot : 0;
}

// the sign of the result follows the dividend
inline constexpr uint256_t smod(uint256_t const &x, uint256_t const &y) noexcept
{
    return y != 0 ? intx::sdivrem(x, y).rem : 0;
}

// (x + y) mod m computed on the 257 bit sum
inline constexpr uint256_t
addmod(uint256_t const &x, uint256_t const &y, uint256_t const &m) noexcept
{
    return m != 0 ? intx::addmod(x, y, m) : 0;
}

// (x * y) mod m computed on the 512 bit product
inline constexpr uint256_t
mulmod(uint256_t const &x, uint256_t const &y, uint256_t const &m) noexcept
{
    return m != 0 ? intx::mulmod(x, y, m) : 0;
}

inline constexpr uint256_t
exp(uint256_t const &base, uint256_t const &exponent) noexcept
{
    return intx::exp(base, exponent);
}

inline constexpr bool slt(uint256_t const &x, uint256_t const &y) noexcept
{
    return intx::slt(x, y);
}

inline constexpr bool sgt(uint256_t const &x, uint256_t const &y) noexcept
{
    return intx::slt(y, x);
}

// Extends the sign bit of byte b (counting from the least significant byte)
// into all higher bytes. b >= 31 leaves x unchanged.
inline constexpr uint256_t
signextend(uint256_t const &b, uint256_t const &x) noexcept
{
    if (b >= 31) {
        return x;
    }
    auto const sign_bit_index = 8 * static_cast<unsigned>(b[0]) + 7;
    auto const sign_bit = uint256_t{1} << sign_bit_index;
    auto const value_mask = sign_bit - 1;
    return ((x & sign_bit) != 0) ? (x | ~value_mask) : (x & value_mask);
}

// Byte i of x, where i = 0 is the most significant byte
inline constexpr uint256_t byte(uint256_t const &i, uint256_t const &x) noexcept
{
    if (i >= 32) {
        return 0;
    }
    auto const index = 31 - static_cast<unsigned>(i[0]);
    auto const word = x[index / 8];
    auto const byte_index = index % 8;
    return (word >> (byte_index * 8)) & 0xff;
}

inline constexpr uint256_t
shl(uint256_t const &shift, uint256_t const &value) noexcept
{
    return value << shift;
}

inline constexpr uint256_t
shr(uint256_t const &shift, uint256_t const &value) noexcept
{
    return value >> shift;
}

inline constexpr uint256_t
sar(uint256_t const &shift, uint256_t const &value) noexcept
{
    auto const sign_mask = is_negative(value) ? ~uint256_t{} : uint256_t{};
    auto const mask_shift = (shift < 256) ? (256 - shift[0]) : 0;
    return (value >> shift) | (sign_mask << mask_shift);
}

BASALT_NAMESPACE_END
