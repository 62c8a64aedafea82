#pragma once

#include <basalt/core/byte_string.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_context.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/revision.hpp>
#include <basalt/evm/tracer.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>

BASALT_EVM_NAMESPACE_BEGIN

// Writes one JSON object per line: one per instruction, then a summary of the
// run.
class InstructionTracer final : public Tracer
{
    std::ostream &out_;
    uint64_t start_gas_{0};

public:
    explicit InstructionTracer(std::ostream &) noexcept;

    void on_execution_start(
        Revision, Context const &, byte_string_view code) noexcept override;

    void on_instruction_start(
        size_t pc, uint8_t opcode, uint64_t cost,
        ExecutionState const &) noexcept override;

    void on_execution_end(
        Result<void> const &, ExecutionState const &) noexcept override;
};

BASALT_EVM_NAMESPACE_END
