#pragma once

#include <basalt/core/int.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/revision.hpp>
#include <basalt/evm/words.hpp>

#include <cstdint>

BASALT_EVM_NAMESPACE_BEGIN

// Appendix G

// G_zero
constexpr uint64_t zero_cost = 0;

// G_jumpdest
constexpr uint64_t jumpdest_cost = 1;

// G_base
constexpr uint64_t base_cost = 2;

// G_verylow
constexpr uint64_t very_low_cost = 3;

// G_low
constexpr uint64_t low_cost = 5;

// G_mid
constexpr uint64_t mid_cost = 8;

// G_high
constexpr uint64_t high_cost = 10;

// G_blockhash
constexpr uint64_t blockhash_cost = 20;

// G_memory
constexpr uint64_t memory_cost = 3;

// G_copy
constexpr uint64_t copy_cost = 3;

// G_exp
constexpr uint64_t exp_cost = 10;

// G_sset
constexpr uint64_t sset_cost = 20000;

// G_sreset
constexpr uint64_t sreset_cost = 5000;

// G_expbyte
template <Revision rev>
constexpr uint64_t exp_byte_cost()
{
    if constexpr (rev < Revision::SpuriousDragon) {
        return 10;
    }
    else {
        return 50;
    }
}

template <Revision rev>
constexpr uint64_t sload_cost()
{
    if constexpr (rev < Revision::TangerineWhistle) {
        return 50;
    }
    else if constexpr (rev < Revision::Istanbul) {
        return 200;
    }
    else if constexpr (rev == Revision::Istanbul) {
        return 800;
    }
    else {
        // no access lists, every slot is cold
        return 2100;
    }
}

template <Revision rev>
constexpr uint64_t balance_cost()
{
    if constexpr (rev < Revision::TangerineWhistle) {
        return 20;
    }
    else if constexpr (rev < Revision::Istanbul) {
        return 400;
    }
    else if constexpr (rev == Revision::Istanbul) {
        return 700;
    }
    else {
        return 2600;
    }
}

// Eq. 326 - total cost of a memory of the given size in words
constexpr uint64_t memory_words_cost(uint64_t const words) noexcept
{
    return memory_cost * words + words * words / 512;
}

// cost of growing memory from curr_size to new_size bytes, zero if no growth
constexpr uint64_t
memory_expansion_cost(size_t const curr_size, size_t const new_size) noexcept
{
    if (new_size <= curr_size) {
        return 0;
    }
    return memory_words_cost(round_up_bytes_to_words(new_size)) -
           memory_words_cost(round_up_bytes_to_words(curr_size));
}

constexpr uint64_t copy_words_cost(size_t const size) noexcept
{
    return copy_cost * round_up_bytes_to_words(size);
}

BASALT_EVM_NAMESPACE_END
