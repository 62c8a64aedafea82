#pragma once

#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/stack_pointer.hpp>

#include <cstddef>
#include <utility>

BASALT_EVM_NAMESPACE_BEGIN

// SWAP1 exchanges the top two elements
template <size_t N>
Result<void> swap(StackPointer sp, ExecutionState &) noexcept
{
    static_assert(N >= 1 && N <= 16);
    std::swap(sp.at(0), sp.at(N));
    return success();
}

BASALT_EVM_NAMESPACE_END
