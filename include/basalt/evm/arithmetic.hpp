#pragma once

#include <basalt/core/int.hpp>
#include <basalt/core/result.hpp>
#include <basalt/core/uint256.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/fee_schedule.hpp>
#include <basalt/evm/revision.hpp>
#include <basalt/evm/stack_pointer.hpp>
#include <basalt/evm/status.hpp>

#include <intx/intx.hpp>

BASALT_EVM_NAMESPACE_BEGIN

// Operands are pushed left to right, so the right operand is on top of the
// stack and is popped first: PUSH a, PUSH b, SUB leaves a - b.

inline Result<void> stop(StackPointer, ExecutionState &state) noexcept
{
    state.mstate.status = Status::Success;
    return success();
}

inline Result<void> add(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(left + right);
    return success();
}

inline Result<void> mul(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(left * right);
    return success();
}

inline Result<void> sub(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(left - right);
    return success();
}

inline Result<void> div(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(udiv(left, right));
    return success();
}

inline Result<void> sdiv(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(basalt::sdiv(left, right));
    return success();
}

inline Result<void> mod(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(umod(left, right));
    return success();
}

inline Result<void> smod(StackPointer sp, ExecutionState &) noexcept
{
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(basalt::smod(left, right));
    return success();
}

// ADDMOD(a, b, N)
inline Result<void> addmod(StackPointer sp, ExecutionState &) noexcept
{
    auto const m = sp.pop();
    auto const b = sp.pop();
    auto const a = sp.pop();
    sp.push(basalt::addmod(a, b, m));
    return success();
}

// MULMOD(a, b, N)
inline Result<void> mulmod(StackPointer sp, ExecutionState &) noexcept
{
    auto const m = sp.pop();
    auto const b = sp.pop();
    auto const a = sp.pop();
    sp.push(basalt::mulmod(a, b, m));
    return success();
}

// EXP(base, exponent)
template <Revision rev>
Result<void> exp(StackPointer sp, ExecutionState &state) noexcept
{
    auto const exponent = sp.pop();
    auto const base = sp.pop();

    auto const exponent_bytes = intx::count_significant_bytes(exponent);
    BOOST_OUTCOME_TRY(
        state.consume_gas(exponent_bytes * exp_byte_cost<rev>()));

    sp.push(basalt::exp(base, exponent));
    return success();
}

// SIGNEXTEND(x, b)
inline Result<void> signextend(StackPointer sp, ExecutionState &) noexcept
{
    auto const b = sp.pop();
    auto const x = sp.pop();
    sp.push(basalt::signextend(b, x));
    return success();
}

BASALT_EVM_NAMESPACE_END
