#pragma once

#include <basalt/core/address.hpp>
#include <basalt/core/byte_string.hpp>
#include <basalt/core/bytes.hpp>
#include <basalt/core/int.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/fee_schedule.hpp>
#include <basalt/evm/stack_pointer.hpp>
#include <basalt/evm/words.hpp>

#include <intx/intx.hpp>

#include <algorithm>
#include <cstddef>

BASALT_EVM_NAMESPACE_BEGIN

namespace detail
{
    inline uint256_t to_word(Address const &address) noexcept
    {
        return intx::be::load<uint256_t>(address);
    }

    // bytes of data from offset onwards, empty when offset is past the end
    inline byte_string_view
    tail(byte_string_view const data, uint256_t const &offset) noexcept
    {
        if (offset >= data.size()) {
            return {};
        }
        return data.substr(static_cast<size_t>(offset));
    }

    // (size, src, dst) copy from a read only region into memory
    inline Result<void> copy_to_memory(
        StackPointer &sp, ExecutionState &state, byte_string_view const data)
    {
        auto const dst = sp.pop();
        auto const src = sp.pop();
        auto const size = sp.pop();
        if (size == 0) {
            return success();
        }
        BOOST_OUTCOME_TRY(state.charge_memory(dst, size));
        BOOST_OUTCOME_TRY(
            state.consume_gas(copy_words_cost(static_cast<size_t>(size))));
        return state.mstate.memory.store(dst, size, tail(data, src));
    }
}

inline Result<void> address(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(detail::to_word(state.env.address));
    return success();
}

// the account is named by the low 20 bytes of the operand
inline Result<void> balance(StackPointer sp, ExecutionState &state)
{
    auto const word = sp.pop();
    auto const account = intx::be::trunc<Address>(word);
    sp.push(state.storage.balance_of(account));
    return success();
}

inline Result<void> origin(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(detail::to_word(state.env.origin));
    return success();
}

inline Result<void> caller(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(detail::to_word(state.env.sender));
    return success();
}

inline Result<void> callvalue(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.env.value);
    return success();
}

// 32 bytes of input starting at offset, zero padded on the right
inline Result<void>
calldataload(StackPointer sp, ExecutionState &state) noexcept
{
    auto const offset = sp.pop();
    auto const data = detail::tail(state.env.input_data, offset);
    bytes32_t word{};
    std::copy_n(data.data(), std::min(data.size(), word_size), word.bytes);
    sp.push(intx::be::load<uint256_t>(word));
    return success();
}

inline Result<void>
calldatasize(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.env.input_data.size());
    return success();
}

// CALLDATACOPY(size, src, dst)
inline Result<void> calldatacopy(StackPointer sp, ExecutionState &state)
{
    return detail::copy_to_memory(sp, state, state.env.input_data);
}

inline Result<void> codesize(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.analysis.code_size);
    return success();
}

// CODECOPY(size, src, dst)
inline Result<void> codecopy(StackPointer sp, ExecutionState &state)
{
    return detail::copy_to_memory(
        sp, state, state.analysis.executable_code());
}

inline Result<void> gasprice(StackPointer sp, ExecutionState &state) noexcept
{
    sp.push(state.env.gas_price);
    return success();
}

BASALT_EVM_NAMESPACE_END
