#pragma once

#include <basalt/core/int.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/error.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/fee_schedule.hpp>
#include <basalt/evm/stack_pointer.hpp>
#include <basalt/evm/words.hpp>

#include <cstddef>

BASALT_EVM_NAMESPACE_BEGIN

inline Result<void> pop(StackPointer sp, ExecutionState &) noexcept
{
    sp.pop();
    return success();
}

inline Result<void> mload(StackPointer sp, ExecutionState &state)
{
    auto const offset = sp.pop();
    BOOST_OUTCOME_TRY(state.charge_memory(offset, word_size));
    BOOST_OUTCOME_TRY(auto const value, state.mstate.memory.load_word(offset));
    sp.push(value);
    return success();
}

// MSTORE(value, offset)
inline Result<void> mstore(StackPointer sp, ExecutionState &state)
{
    auto const offset = sp.pop();
    auto const value = sp.pop();
    BOOST_OUTCOME_TRY(state.charge_memory(offset, word_size));
    return state.mstate.memory.store_word(offset, value);
}

// MSTORE8(value, offset) stores the low byte of value
inline Result<void> mstore8(StackPointer sp, ExecutionState &state)
{
    auto const offset = sp.pop();
    auto const value = sp.pop();
    BOOST_OUTCOME_TRY(state.charge_memory(offset, 1));
    return state.mstate.memory.store_byte(
        offset, static_cast<uint8_t>(value[0] & 0xff));
}

inline Result<void> sload(StackPointer sp, ExecutionState &state)
{
    auto const key = sp.pop();
    sp.push(state.storage.load_slot(state.env.address, key));
    return success();
}

// SSTORE(value, key)
inline Result<void> sstore(StackPointer sp, ExecutionState &state)
{
    auto const key = sp.pop();
    auto const value = sp.pop();
    auto const current = state.storage.load_slot(state.env.address, key);
    BOOST_OUTCOME_TRY(state.consume_gas(
        (current == 0 && value != 0) ? sset_cost : sreset_cost));
    state.storage.store_slot(state.env.address, key, value);
    return success();
}

namespace detail
{
    inline Result<void>
    jump_to(uint256_t const &target, ExecutionState &state) noexcept
    {
        if (target >= state.analysis.code_size ||
            !state.analysis.is_valid_jump_dest(static_cast<size_t>(target))) {
            return Error::BadJumpDest;
        }
        state.mstate.pc = static_cast<size_t>(target);
        return success();
    }
}

inline Result<void> jump(StackPointer sp, ExecutionState &state) noexcept
{
    auto const target = sp.pop();
    return detail::jump_to(target, state);
}

// JUMPI(condition, target)
inline Result<void> jumpi(StackPointer sp, ExecutionState &state) noexcept
{
    auto const target = sp.pop();
    auto const condition = sp.pop();
    if (condition != 0) {
        return detail::jump_to(target, state);
    }
    ++state.mstate.pc;
    return success();
}

inline Result<void> pc(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.mstate.pc);
    return success();
}

inline Result<void> msize(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.mstate.memory.size());
    return success();
}

// gas remaining after the cost of GAS itself
inline Result<void> gas(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.mstate.gas_left);
    return success();
}

inline Result<void> jumpdest(StackPointer, ExecutionState &) noexcept
{
    return success();
}

// MCOPY(size, src, dst)
inline Result<void> mcopy(StackPointer sp, ExecutionState &state)
{
    auto const dst = sp.pop();
    auto const src = sp.pop();
    auto const size = sp.pop();
    if (size == 0) {
        return success();
    }
    BOOST_OUTCOME_TRY(state.charge_memory(src > dst ? src : dst, size));
    BOOST_OUTCOME_TRY(
        state.consume_gas(copy_words_cost(static_cast<size_t>(size))));
    return state.mstate.memory.copy(src, dst, size);
}

BASALT_EVM_NAMESPACE_END
