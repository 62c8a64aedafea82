#pragma once

#include <basalt/core/bytes.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/stack_pointer.hpp>

#include <intx/intx.hpp>

#include <cstddef>
#include <cstring>

BASALT_EVM_NAMESPACE_BEGIN

// PUSH0 through PUSH32. The immediate is read big endian from the bytes after
// the opcode; code is padded so a truncated immediate reads as trailing zeros.
template <size_t N>
Result<void> push(StackPointer sp, ExecutionState &state) noexcept
{
    static_assert(N <= 32);
    if constexpr (N == 0) {
        sp.push(0);
    }
    else {
        bytes32_t word{};
        std::memcpy(
            word.bytes + 32 - N,
            state.analysis.code.data() + state.mstate.pc + 1,
            N);
        sp.push(intx::be::load<uint256_t>(word));
    }
    return success();
}

BASALT_EVM_NAMESPACE_END
