#pragma once

#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/error.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/stack_pointer.hpp>
#include <basalt/evm/status.hpp>

#include <cstddef>

BASALT_EVM_NAMESPACE_BEGIN

namespace detail
{
    // (size, offset)
    inline Result<void> halt_with_output(
        StackPointer &sp, ExecutionState &state, Status const status)
    {
        auto const offset = sp.pop();
        auto const size = sp.pop();
        BOOST_OUTCOME_TRY(state.charge_memory(offset, size));
        BOOST_OUTCOME_TRY(state.mstate.memory.grow_if_needed(offset, size));
        if (size != 0) {
            auto const out = state.mstate.memory.substr(
                static_cast<size_t>(offset), static_cast<size_t>(size));
            state.mstate.output.assign(out.begin(), out.end());
        }
        state.mstate.status = status;
        return success();
    }
}

// RETURN(size, offset)
inline Result<void> return_(StackPointer sp, ExecutionState &state)
{
    return detail::halt_with_output(sp, state, Status::Success);
}

// REVERT(size, offset)
inline Result<void> revert(StackPointer sp, ExecutionState &state)
{
    return detail::halt_with_output(sp, state, Status::Revert);
}

// INVALID and every byte without an instruction in the active revision
inline Result<void> invalid(StackPointer, ExecutionState &) noexcept
{
    return Error::UndefinedInstruction;
}

BASALT_EVM_NAMESPACE_END
