#pragma once

#include <basalt/core/result.hpp>
#include <basalt/core/uint256.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/stack_pointer.hpp>

BASALT_EVM_NAMESPACE_BEGIN

// LT(left, right) pushes left < right, right is on top

inline Result<void> lt(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(left < right);
    return success();
}

inline Result<void> gt(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(left > right);
    return success();
}

inline Result<void> slt(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(basalt::slt(left, right));
    return success();
}

inline Result<void> sgt(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(basalt::sgt(left, right));
    return success();
}

inline Result<void> eq(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(left == right);
    return success();
}

inline Result<void> iszero(StackPointer sp, ExecutionState &) noexcept
{
    auto const a = sp.pop();
    sp.push(a == 0);
    return success();
}

BASALT_EVM_NAMESPACE_END
