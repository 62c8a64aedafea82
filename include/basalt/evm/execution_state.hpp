#pragma once

#include <basalt/core/address.hpp>
#include <basalt/core/byte_string.hpp>
#include <basalt/core/int.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/account_storage.hpp>
#include <basalt/evm/code_analysis.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/execution_context.hpp>
#include <basalt/evm/machine_state.hpp>

#include <cstddef>
#include <cstdint>

BASALT_EVM_NAMESPACE_BEGIN

// 9.3
struct ExecutionEnvironment
{
    Address address; // I_a
    Address origin; // I_o
    Address sender; // I_s
    uint256_t value; // I_v
    uint256_t gas_price; // I_p
    byte_string_view input_data; // I_d
    BlockEnv const &header; // I_H
};

struct ExecutionState
{
    ExecutionEnvironment env;
    MachineState mstate;
    AccountStorage &storage;
    CodeAnalysis analysis;
    bool metered;

    ExecutionState(
        Context const &, AccountStorage &, byte_string_view code,
        size_t memory_limit, bool metered = true);

    // always succeeds when unmetered
    Result<void> consume_gas(uint64_t);

    // charges the expansion cost of touching [offset, offset + size), the
    // memory itself grows when it is accessed
    Result<void>
    charge_memory(uint256_t const &offset, uint256_t const &size);
};

BASALT_EVM_NAMESPACE_END
