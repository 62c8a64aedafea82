#pragma once

#include <basalt/config.hpp>
#include <basalt/core/int.hpp>

#include <evmc/evmc.hpp>

BASALT_NAMESPACE_BEGIN

using bytes32_t = ::evmc::bytes32;

static_assert(sizeof(bytes32_t) == 32);
static_assert(alignof(bytes32_t) == 1);

inline constexpr bytes32_t to_bytes(uint256_t const &n) noexcept
{
    return intx::be::store<bytes32_t>(n);
}

BASALT_NAMESPACE_END
