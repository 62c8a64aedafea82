#pragma once

#include <basalt/core/int.hpp>
#include <basalt/evm/config.hpp>

#include <cstddef>

BASALT_EVM_NAMESPACE_BEGIN

constexpr auto word_size = sizeof(uint256_t);
static_assert(word_size == 32);

// returns in units of words
constexpr size_t round_up_bytes_to_words(size_t const n) noexcept
{
    return (n + word_size - 1) / word_size;
}

BASALT_EVM_NAMESPACE_END
