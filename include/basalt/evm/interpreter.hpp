#pragma once

#include <basalt/core/byte_string.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/account_storage.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_context.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/instruction_table.hpp>
#include <basalt/evm/memory.hpp>
#include <basalt/evm/revision.hpp>
#include <basalt/evm/stack.hpp>
#include <basalt/evm/status.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

BASALT_EVM_NAMESPACE_BEGIN

class Tracer;

struct InterpreterConfig
{
    Revision revision{latest_revision};
    size_t memory_limit{Memory::default_limit};
    // checked before each dispatch, unbounded when empty
    std::optional<uint64_t> step_limit{};
    // when false no gas is charged and gas_left stays at tx.gas_limit
    bool metered{true};
};

// Executes one piece of code against a borrowed AccountStorage. The context
// and the storage must outlive the interpreter.
class Interpreter
{
    InterpreterConfig config_;
    InstructionTable const &table_;
    ExecutionState state_;
    Result<void> result_;
    uint64_t steps_{0};
    Tracer *tracer_{nullptr};
    Context const &ctx_;
    bool started_{false};

    void halt(Result<void>);

public:
    Interpreter(
        Context const &, AccountStorage &, byte_string_view code,
        InterpreterConfig const & = {});

    Interpreter(Interpreter const &) = delete;
    Interpreter &operator=(Interpreter const &) = delete;

    // not owned, nullptr disables tracing
    void set_tracer(Tracer *) noexcept;

    // executes a single instruction, a no-op once the run has halted
    void step();

    Status run();

    Status status() const noexcept
    {
        return state_.mstate.status;
    }

    // the error that halted the run with Failure, success otherwise
    Result<void> const &result() const noexcept
    {
        return result_;
    }

    size_t pc() const noexcept
    {
        return state_.mstate.pc;
    }

    uint64_t gas_left() const noexcept
    {
        return state_.mstate.gas_left;
    }

    uint64_t steps() const noexcept
    {
        return steps_;
    }

    Stack const &stack() const noexcept
    {
        return state_.mstate.stack;
    }

    Memory const &memory() const noexcept
    {
        return state_.mstate.memory;
    }

    // data of RETURN or REVERT
    byte_string_view output() const noexcept
    {
        return state_.mstate.output;
    }

    ExecutionState const &state() const noexcept
    {
        return state_;
    }
};

// Creation mode executes the transaction payload. A message call executes the
// recipient's code and fails with UnknownAccount if the recipient has no
// record.
Result<byte_string> resolve_code(Context const &, AccountStorage const &);

BASALT_EVM_NAMESPACE_END
