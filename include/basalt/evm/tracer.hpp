#pragma once

#include <basalt/core/byte_string.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_context.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/revision.hpp>

#include <cstddef>
#include <cstdint>

BASALT_EVM_NAMESPACE_BEGIN

// Hook interposed between instructions. on_instruction_start runs after the
// opcode is decoded and before the stack is validated or gas is charged.
class Tracer
{
public:
    virtual ~Tracer() = default;

    virtual void on_execution_start(
        Revision, Context const &, byte_string_view code) noexcept = 0;

    virtual void on_instruction_start(
        size_t pc, uint8_t opcode, uint64_t cost,
        ExecutionState const &) noexcept = 0;

    virtual void on_execution_end(
        Result<void> const &, ExecutionState const &) noexcept = 0;
};

BASALT_EVM_NAMESPACE_END
