#include <basalt/core/likely.h>
#include <basalt/evm/config.hpp>
#include <basalt/evm/error.hpp>
#include <basalt/evm/execution_state.hpp>
#include <basalt/evm/fee_schedule.hpp>

BASALT_EVM_NAMESPACE_BEGIN

ExecutionState::ExecutionState(
    Context const &ctx, AccountStorage &storage, byte_string_view const code,
    size_t const memory_limit, bool const metered)
    : env{ExecutionEnvironment{
          .address = ctx.tx.to,
          .origin = ctx.tx.sender,
          .sender = ctx.tx.sender,
          .value = ctx.tx.value,
          .gas_price = ctx.tx.gas_price,
          .input_data = ctx.tx.data,
          .header = ctx.block}}
    , mstate{MachineState{
          .gas_left = ctx.tx.gas_limit,
          .pc = 0,
          .memory = Memory{memory_limit},
          .stack = {},
          .status = Status::Running,
          .output = {}}}
    , storage{storage}
    , analysis{analyze(code)}
    , metered{metered}
{
}

Result<void> ExecutionState::consume_gas(uint64_t const cost)
{
    if (!metered) {
        return success();
    }
    if (BASALT_UNLIKELY(mstate.gas_left < cost)) {
        return Error::OutOfGas;
    }
    mstate.gas_left -= cost;
    return success();
}

Result<void>
ExecutionState::charge_memory(uint256_t const &offset, uint256_t const &size)
{
    if (size == 0) {
        return success();
    }
    BOOST_OUTCOME_TRY(auto const end, mstate.memory.checked_end(offset, size));
    return consume_gas(memory_expansion_cost(mstate.memory.size(), end));
}

BASALT_EVM_NAMESPACE_END
