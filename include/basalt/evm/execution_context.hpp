#pragma once

#include <basalt/core/address.hpp>
#include <basalt/core/byte_string.hpp>
#include <basalt/core/bytes.hpp>
#include <basalt/core/int.hpp>
#include <basalt/evm/config.hpp>

#include <cstdint>

BASALT_EVM_NAMESPACE_BEGIN

// 4.3 - the subset of the block header visible to execution
struct BlockEnv
{
    uint64_t number{0}; // H_i
    uint64_t timestamp{0}; // H_s
    Address coinbase{}; // H_c
    uint64_t gas_limit{0}; // H_l
    uint256_t base_fee{0}; // H_f
    uint256_t chain_id{1};
    bytes32_t block_hash{}; // hash of block number - 1
};

// 4.2
struct Transaction
{
    Address sender{}; // T_s
    Address to{}; // T_t, zero signals contract creation
    uint256_t value{0}; // T_v
    uint64_t nonce{0}; // T_n
    byte_string data{}; // T_d or T_i
    uint64_t gas_limit{0}; // T_g
    uint256_t gas_price{0}; // T_p
};

// Immutable inputs of a run. Must outlive every interpreter built on it.
struct Context
{
    BlockEnv block;
    Transaction tx;

    bool is_creation() const noexcept
    {
        return tx.to == Address{};
    }
};

BASALT_EVM_NAMESPACE_END
