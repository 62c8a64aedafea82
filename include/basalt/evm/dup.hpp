#pragma once

#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/stack_pointer.hpp>

#include <cstddef>

BASALT_EVM_NAMESPACE_BEGIN

// DUP1 copies the top element
template <size_t N>
Result<void> dup(StackPointer sp, ExecutionState &) noexcept
{
    static_assert(N >= 1 && N <= 16);
    auto const value = sp.at(N - 1);
    sp.push(value);
    return success();
}

BASALT_EVM_NAMESPACE_END
