#pragma once

#include <basalt/core/int.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/stack_pointer.hpp>

#include <intx/intx.hpp>

BASALT_EVM_NAMESPACE_BEGIN

// Only the parent hash is known, every other block number reads as zero.
inline Result<void> blockhash(StackPointer sp, ExecutionState &state) noexcept
{
    auto const n = sp.pop();
    auto const &header = state.env.header;
    if (header.number > 0 && n == header.number - 1) {
        sp.push(intx::be::load<uint256_t>(header.block_hash));
    }
    else {
        sp.push(0);
    }
    return success();
}

inline Result<void> coinbase(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(intx::be::load<uint256_t>(state.env.header.coinbase));
    return success();
}

inline Result<void> timestamp(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.env.header.timestamp);
    return success();
}

inline Result<void> number(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.env.header.number);
    return success();
}

inline Result<void> gaslimit(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.env.header.gas_limit);
    return success();
}

inline Result<void> chainid(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.env.header.chain_id);
    return success();
}

inline Result<void> selfbalance(StackPointer sp, ExecutionState &state)
{
    sp.push(state.storage.balance_of(state.env.address));
    return success();
}

inline Result<void> basefee(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.env.header.base_fee);
    return success();
}

BASALT_EVM_NAMESPACE_END
