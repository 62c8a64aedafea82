#pragma once

#include <basalt/core/byte_string.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/memory.hpp>
#include <basalt/evm/stack.hpp>
#include <basalt/evm/status.hpp>

#include <cstddef>
#include <cstdint>

BASALT_EVM_NAMESPACE_BEGIN

// 9.4.1
struct MachineState
{
    uint64_t gas_left; // g
    size_t pc; // pc
    Memory memory; // m
    Stack stack; // s
    Status status;
    byte_string output; // H_return
};

BASALT_EVM_NAMESPACE_END
