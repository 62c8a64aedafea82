#include <basalt/core/assert.h>
#include <basalt/core/byte_string.hpp>
#include <basalt/core/likely.h>
#include <basalt/core/result.hpp>
#include <basalt/evm/account_storage.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/error.hpp>
#include <basalt/evm/execution_context.hpp>
#include <basalt/evm/instruction_table.hpp>
#include <basalt/evm/interpreter.hpp>
#include <basalt/evm/opcodes.hpp>
#include <basalt/evm/stack.hpp>
#include <basalt/evm/status.hpp>
#include <basalt/evm/tracer.hpp>

#include <evmc/hex.hpp>
#include <quill/Quill.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

BASALT_EVM_NAMESPACE_BEGIN

namespace
{
    Result<void>
    validate_stack(Instruction const &instr, Stack const &stack) noexcept
    {
        if (BASALT_UNLIKELY(stack.size() < instr.stack_required)) {
            return Error::StackUnderflow;
        }
        if (instr.stack_change > 0 &&
            BASALT_UNLIKELY(
                stack.size() + static_cast<size_t>(instr.stack_change) >
                stack_limit)) {
            return Error::StackOverflow;
        }
        return success();
    }
}

Interpreter::Interpreter(
    Context const &ctx, AccountStorage &storage, byte_string_view const code,
    InterpreterConfig const &config)
    : config_{config}
    , table_{instruction_table(config.revision)}
    , state_{ctx, storage, code, config.memory_limit, config.metered}
    , result_{success()}
    , ctx_{ctx}
{
}

void Interpreter::set_tracer(Tracer *const tracer) noexcept
{
    tracer_ = tracer;
}

void Interpreter::halt(Result<void> result)
{
    auto &mstate = state_.mstate;
    if (result.has_error()) {
        LOG_DEBUG(
            "{} failed at pc {}: {}",
            std::string{opcode_name(state_.analysis.code[mstate.pc])},
            mstate.pc,
            result.error().message().c_str());
        mstate.status = Status::Failure;
        result_ = std::move(result);
    }
    if (tracer_) {
        tracer_->on_execution_end(result_, state_);
    }
    LOG_DEBUG(
        "halted {} at pc {} after {} steps with {} gas left",
        std::string{status_name(mstate.status)},
        mstate.pc,
        steps_,
        mstate.gas_left);
}

void Interpreter::step()
{
    auto &mstate = state_.mstate;
    if (mstate.status != Status::Running) {
        return;
    }

    if (!started_) {
        started_ = true;
        if (tracer_) {
            tracer_->on_execution_start(
                config_.revision, ctx_, state_.analysis.executable_code());
        }
    }

    // running off the end of the code is an implicit STOP
    if (mstate.pc >= state_.analysis.code_size) {
        mstate.status = Status::Success;
        halt(success());
        return;
    }

    if (config_.step_limit.has_value() &&
        BASALT_UNLIKELY(steps_ >= config_.step_limit.value())) {
        halt(Error::StepLimitExceeded);
        return;
    }

    auto const op = state_.analysis.code[mstate.pc];
    auto const &instr = table_[op];
    ++steps_;

    if (tracer_) {
        tracer_->on_instruction_start(mstate.pc, op, instr.cost, state_);
    }

    if (auto res = validate_stack(instr, mstate.stack); res.has_error()) {
        halt(std::move(res));
        return;
    }
    if (auto res = state_.consume_gas(instr.cost); res.has_error()) {
        halt(std::move(res));
        return;
    }

    if (auto res = instr.eval(mstate.stack.top_pointer(), state_);
        res.has_error()) {
        halt(std::move(res));
        return;
    }

    mstate.stack.adjust(instr.stack_change);
    mstate.pc += instr.pc_increment;

    if (mstate.status != Status::Running) {
        halt(success());
    }
}

Status Interpreter::run()
{
    while (state_.mstate.status == Status::Running) {
        step();
    }
    return state_.mstate.status;
}

Result<byte_string>
resolve_code(Context const &ctx, AccountStorage const &storage)
{
    if (ctx.is_creation()) {
        return ctx.tx.data;
    }
    auto account = storage.get_account(ctx.tx.to);
    if (account.has_error()) {
        LOG_WARNING(
            "no account record for recipient 0x{}",
            evmc::hex({ctx.tx.to.bytes, sizeof(ctx.tx.to.bytes)}));
        return std::move(account).error();
    }
    return account.value()->code;
}

BASALT_EVM_NAMESPACE_END
