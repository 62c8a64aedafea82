#pragma once

#include <basalt/core/address.hpp>
#include <basalt/core/byte_string.hpp>
#include <basalt/core/int.hpp>
#include <basalt/evm/account_storage.hpp>
#include <basalt/evm/execution_context.hpp>
#include <basalt/evm/interpreter.hpp>
#include <basalt/evm/opcodes.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <utility>

namespace basalt::evm::test
{
    using namespace evmc::literals;

    inline constexpr auto contract =
        0xc0de00000000000000000000000000000000c0de_address;
    inline constexpr auto sender =
        0x5e4de4000000000000000000000000000000beef_address;
    inline constexpr auto miner =
        0xc01bba5e00000000000000000000000000000001_address;

    inline constexpr uint64_t default_gas = 1'000'000;

    inline byte_string op(Opcode const opcode)
    {
        return byte_string(1, std::to_underlying(opcode));
    }

    // shortest PUSH encoding of n, PUSH1 for zero
    inline byte_string push(uint256_t const &n)
    {
        auto const size = std::max<unsigned>(
            1, intx::count_significant_bytes(n));
        auto const word = intx::be::store<evmc::bytes32>(n);
        byte_string code(
            1,
            static_cast<unsigned char>(
                std::to_underlying(Opcode::PUSH1) + size - 1));
        code.append(word.bytes + 32 - size, size);
        return code;
    }

    inline uint256_t word(Address const &address)
    {
        return intx::be::load<uint256_t>(address);
    }

    class InterpreterTest : public ::testing::Test
    {
    protected:
        Context ctx{};
        AccountStorage storage{};
        InterpreterConfig config{};
        std::unique_ptr<Interpreter> interpreter{};

        InterpreterTest()
        {
            ctx.block.number = 100;
            ctx.block.timestamp = 1'700'000'000;
            ctx.block.coinbase = miner;
            ctx.block.gas_limit = 30'000'000;
            ctx.block.base_fee = 7;
            ctx.block.chain_id = 1;
            ctx.tx.sender = sender;
            ctx.tx.to = contract;
            ctx.tx.gas_limit = default_gas;
            ctx.tx.gas_price = 10;
        }

        Interpreter &load(byte_string const &code)
        {
            interpreter = std::make_unique<Interpreter>(
                ctx, storage, code, config);
            return *interpreter;
        }

        Interpreter &execute(byte_string const &code)
        {
            load(code).run();
            return *interpreter;
        }

        uint256_t top() const
        {
            return interpreter->stack().peek(0).value();
        }
    };
}
