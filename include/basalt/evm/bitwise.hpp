#pragma once

#include <basalt/core/result.hpp>
#include <basalt/core/uint256.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/stack_pointer.hpp>

BASALT_EVM_NAMESPACE_BEGIN

inline Result<void> and_(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(left & right);
    return success();
}

inline Result<void> or_(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(left | right);
    return success();
}

inline Result<void> xor_(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(left ^ right);
    return success();
}

inline Result<void> not_(StackPointer sp, ExecutionState &) noexcept
{
    auto const a = sp.pop();
    sp.push(~a);
    return success();
}

// BYTE(x, i)
inline Result<void> byte(StackPointer sp, ExecutionState &) noexcept
{
    auto const i = sp.pop();
    auto const x = sp.pop();
    sp.push(basalt::byte(i, x));
    return success();
}

// SHL(value, shift)
inline Result<void> shl(StackPointer sp, ExecutionState &) noexcept
{
    auto const shift = sp.pop();
    auto const value = sp.pop();
    sp.push(basalt::shl(shift, value));
    return success();
}

inline Result<void> shr(StackPointer sp, ExecutionState &) noexcept
{
    auto const shift = sp.pop();
    auto const value = sp.pop();
    sp.push(basalt::shr(shift, value));
    return success();
}

inline Result<void> sar(StackPointer sp, ExecutionState &) noexcept
{
    auto const shift = sp.pop();
    auto const value = sp.pop();
    sp.push(basalt::sar(shift, value));
    return success();
}

BASALT_EVM_NAMESPACE_END
