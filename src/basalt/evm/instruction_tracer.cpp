#include <basalt/core/byte_string.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_context.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/instruction_tracer.hpp>
#include <basalt/evm/opcodes.hpp>
#include <basalt/evm/revision.hpp>
#include <basalt/evm/status.hpp>

#include <evmc/hex.hpp>
#include <intx/intx.hpp>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

BASALT_EVM_NAMESPACE_BEGIN

namespace
{
    std::string get_name(uint8_t const opcode)
    {
        auto const name = opcode_name(opcode);
        return name.empty() ? "0x" + evmc::hex(opcode) : std::string{name};
    }

    std::string to_hex(uint64_t const n)
    {
        return "0x" + intx::to_string(uint256_t{n}, 16);
    }
}

InstructionTracer::InstructionTracer(std::ostream &out) noexcept
    : out_{out}
{
}

void InstructionTracer::on_execution_start(
    Revision, Context const &ctx, byte_string_view) noexcept
{
    start_gas_ = ctx.tx.gas_limit;
}

void InstructionTracer::on_instruction_start(
    size_t const pc, uint8_t const opcode, uint64_t const cost,
    ExecutionState const &state) noexcept
{
    auto stack = nlohmann::json::array();
    for (auto const &word : state.mstate.stack.elements()) {
        stack.push_back("0x" + intx::to_string(word, 16));
    }

    nlohmann::json const line{
        {"pc", pc},
        {"op", opcode},
        {"opName", get_name(opcode)},
        {"gas", to_hex(state.mstate.gas_left)},
        {"gasCost", to_hex(cost)},
        {"memSize", state.mstate.memory.size()},
        {"stack", std::move(stack)}};
    out_ << line.dump() << '\n';
}

void InstructionTracer::on_execution_end(
    Result<void> const &result, ExecutionState const &state) noexcept
{
    nlohmann::json summary;
    if (result.has_error()) {
        summary["error"] = result.error().message().c_str();
    }
    else {
        summary["error"] = nullptr;
    }
    summary["gasUsed"] = to_hex(start_gas_ - state.mstate.gas_left);
    summary["output"] = evmc::hex(
        {state.mstate.output.data(), state.mstate.output.size()});
    summary["status"] = std::string{status_name(state.mstate.status)};
    out_ << summary.dump() << '\n';
}

BASALT_EVM_NAMESPACE_END
