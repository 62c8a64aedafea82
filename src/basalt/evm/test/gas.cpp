#include "interpreter_fixture.hpp"

#include <basalt/core/byte_string.hpp>
#include <basalt/evm/error.hpp>
#include <basalt/evm/opcodes.hpp>
#include <basalt/evm/revision.hpp>
#include <basalt/evm/status.hpp>

#include <gtest/gtest.h>

#include <cstdint>

using namespace basalt;
using namespace basalt::evm;
using namespace basalt::evm::test;

class GasTest : public InterpreterTest
{
protected:
    uint64_t gas_used(byte_string const &code)
    {
        auto &interp = execute(code);
        EXPECT_EQ(interp.status(), Status::Success);
        return ctx.tx.gas_limit - interp.gas_left();
    }
};

TEST_F(GasTest, baseline)
{
    EXPECT_EQ(gas_used(push(1) + push(2) + op(Opcode::ADD)), 9);
    EXPECT_EQ(gas_used(push(1) + push(2) + op(Opcode::MUL)), 11);
    EXPECT_EQ(gas_used(push(1) + push(2) + push(3) + op(Opcode::ADDMOD)), 17);
    EXPECT_EQ(gas_used(op(Opcode::STOP)), 0);
    EXPECT_EQ(gas_used(op(Opcode::JUMPDEST)), 1);
}

TEST_F(GasTest, out_of_gas)
{
    ctx.tx.gas_limit = 5;
    auto &interp = execute(push(1) + push(2) + op(Opcode::ADD));
    EXPECT_EQ(interp.status(), Status::Failure);
    EXPECT_EQ(interp.result().error(), Error::OutOfGas);
    EXPECT_EQ(interp.gas_left(), 2);
    EXPECT_EQ(interp.pc(), 2);
    EXPECT_EQ(interp.stack().size(), 1);
}

TEST_F(GasTest, gas_opcode)
{
    auto &interp = execute(op(Opcode::GAS));
    EXPECT_EQ(top(), default_gas - 2);
    EXPECT_EQ(interp.gas_left(), default_gas - 2);
}

TEST_F(GasTest, memory_expansion)
{
    auto const mstore = [](uint64_t const offset) {
        return push(1) + push(offset) + op(Opcode::MSTORE);
    };
    EXPECT_EQ(gas_used(mstore(0)), 12);
    EXPECT_EQ(gas_used(mstore(0) + mstore(32)), 24);
    EXPECT_EQ(gas_used(mstore(0) + mstore(32) + mstore(0)), 33);
    // 1024 words: 3 * 1024 + 1024 * 1024 / 512
    EXPECT_EQ(gas_used(mstore(1023 * 32)), 3 + 3 + 3 + 5120);
}

TEST_F(GasTest, memory_expansion_out_of_gas)
{
    ctx.tx.gas_limit = 10'000;
    auto &interp = execute(push(1 << 20) + op(Opcode::MLOAD));
    EXPECT_EQ(interp.result().error(), Error::OutOfGas);
    EXPECT_EQ(interp.memory().size(), 0);
}

TEST_F(GasTest, memory_limit)
{
    config.memory_limit = 1024;
    auto &interp = execute(push(1024) + op(Opcode::MLOAD));
    EXPECT_EQ(interp.status(), Status::Failure);
    EXPECT_EQ(interp.result().error(), Error::MemoryLimitExceeded);
    EXPECT_EQ(interp.memory().size(), 0);

    auto &interp2 = execute(push(992) + op(Opcode::MLOAD));
    EXPECT_EQ(interp2.status(), Status::Success);
    EXPECT_EQ(interp2.memory().size(), 1024);
}

TEST_F(GasTest, exp_byte_cost)
{
    auto const code = push(2) + push(256) + op(Opcode::EXP);
    EXPECT_EQ(gas_used(code), 3 + 3 + 10 + 2 * 50);

    config.revision = Frontier;
    EXPECT_EQ(gas_used(code), 3 + 3 + 10 + 2 * 10);
}

TEST_F(GasTest, storage)
{
    EXPECT_EQ(gas_used(push(42) + push(1) + op(Opcode::SSTORE)), 20006);
    EXPECT_EQ(gas_used(push(43) + push(1) + op(Opcode::SSTORE)), 5006);
    EXPECT_EQ(gas_used(push(0) + push(1) + op(Opcode::SSTORE)), 5006);

    EXPECT_EQ(gas_used(push(1) + op(Opcode::SLOAD)), 3 + 2100);
    config.revision = Istanbul;
    EXPECT_EQ(gas_used(push(1) + op(Opcode::SLOAD)), 3 + 800);
    config.revision = Frontier;
    EXPECT_EQ(gas_used(push(1) + op(Opcode::SLOAD)), 3 + 50);
}

TEST_F(GasTest, copy_cost)
{
    ctx.tx.data = byte_string(40, 0x11);
    // 3 pushes, base, 2 words of copy, 2 words of memory
    EXPECT_EQ(
        gas_used(
            push(33) + push(0) + push(0) + op(Opcode::CALLDATACOPY)),
        9 + 3 + 6 + 6);
}

TEST_F(GasTest, step_limit)
{
    config.step_limit = 2;
    auto &interp = execute(push(1) + push(2) + op(Opcode::ADD));
    EXPECT_EQ(interp.status(), Status::Failure);
    EXPECT_EQ(interp.result().error(), Error::StepLimitExceeded);
    EXPECT_EQ(interp.steps(), 2);
    EXPECT_EQ(interp.stack().size(), 2);

    config.step_limit = 3;
    auto &interp2 = execute(push(1) + push(2) + op(Opcode::ADD));
    EXPECT_EQ(interp2.status(), Status::Success);
    EXPECT_EQ(interp2.steps(), 3);
}

TEST_F(GasTest, step_limit_terminates_loop)
{
    config.step_limit = 1000;
    // 0: JUMPDEST, 1: PUSH1 0, 3: JUMP
    auto &interp = execute(byte_string{0x5b, 0x60, 0x00, 0x56});
    EXPECT_EQ(interp.result().error(), Error::StepLimitExceeded);
    EXPECT_EQ(interp.steps(), 1000);
}
