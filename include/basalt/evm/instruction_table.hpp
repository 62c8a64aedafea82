#pragma once

#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/revision.hpp>
#include <basalt/evm/stack_pointer.hpp>

#include <array>
#include <cstdint>

BASALT_EVM_NAMESPACE_BEGIN

using InstrEval = Result<void> (*)(StackPointer, ExecutionState &);

struct Instruction
{
    InstrEval eval;
    uint64_t cost; // baseline, charged before eval
    uint8_t stack_required;
    int8_t stack_change;
    // zero when eval sets pc itself
    uint8_t pc_increment;
};

using InstructionTable = std::array<Instruction, 256>;

template <Revision rev>
InstructionTable const &instruction_table() noexcept;

InstructionTable const &instruction_table(Revision) noexcept;

BASALT_EVM_NAMESPACE_END
