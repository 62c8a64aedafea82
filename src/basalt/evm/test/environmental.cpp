#include "interpreter_fixture.hpp"

#include <basalt/core/byte_string.hpp>
#include <basalt/core/int.hpp>
#include <basalt/evm/opcodes.hpp>
#include <basalt/evm/status.hpp>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <gtest/gtest.h>

using namespace basalt;
using namespace basalt::evm;
using namespace basalt::evm::test;
using namespace evmc::literals;
using namespace intx::literals;

class EnvironmentalTest : public InterpreterTest
{
protected:
    uint256_t eval(byte_string const &code)
    {
        auto &interp = execute(code);
        EXPECT_EQ(interp.status(), Status::Success);
        return top();
    }
};

TEST_F(EnvironmentalTest, addresses)
{
    EXPECT_EQ(eval(op(Opcode::ADDRESS)), word(contract));
    EXPECT_EQ(eval(op(Opcode::CALLER)), word(sender));
    EXPECT_EQ(eval(op(Opcode::ORIGIN)), word(sender));
    EXPECT_EQ(eval(op(Opcode::COINBASE)), word(miner));
    EXPECT_EQ(
        word(contract), 0xc0de00000000000000000000000000000000c0de_u256);
}

TEST_F(EnvironmentalTest, transaction_values)
{
    ctx.tx.value = 12345;
    EXPECT_EQ(eval(op(Opcode::CALLVALUE)), 12345);
    EXPECT_EQ(eval(op(Opcode::GASPRICE)), 10);
}

TEST_F(EnvironmentalTest, block_values)
{
    EXPECT_EQ(eval(op(Opcode::NUMBER)), 100);
    EXPECT_EQ(eval(op(Opcode::TIMESTAMP)), 1'700'000'000);
    EXPECT_EQ(eval(op(Opcode::GASLIMIT)), 30'000'000);
    EXPECT_EQ(eval(op(Opcode::CHAINID)), 1);
    EXPECT_EQ(eval(op(Opcode::BASEFEE)), 7);
}

TEST_F(EnvironmentalTest, blockhash)
{
    ctx.block.block_hash =
        0x1111111111111111111111111111111111111111111111111111111111111111_bytes32;
    auto const hash =
        0x1111111111111111111111111111111111111111111111111111111111111111_u256;

    EXPECT_EQ(eval(push(99) + op(Opcode::BLOCKHASH)), hash);
    EXPECT_EQ(eval(push(98) + op(Opcode::BLOCKHASH)), 0);
    EXPECT_EQ(eval(push(100) + op(Opcode::BLOCKHASH)), 0);

    ctx.block.number = 0;
    EXPECT_EQ(eval(push(0) + op(Opcode::BLOCKHASH)), 0);
}

TEST_F(EnvironmentalTest, balances)
{
    storage.set_balance(contract, 500);
    storage.set_balance(sender, 700);

    EXPECT_EQ(eval(push(word(sender)) + op(Opcode::BALANCE)), 700);
    EXPECT_EQ(eval(op(Opcode::SELFBALANCE)), 500);
    EXPECT_EQ(eval(push(0xdead) + op(Opcode::BALANCE)), 0);

    // only the low 20 bytes name the account
    auto const dirty = word(sender) | (uint256_t{0xff} << 200);
    EXPECT_EQ(eval(push(dirty) + op(Opcode::BALANCE)), 700);
}

TEST_F(EnvironmentalTest, calldataload)
{
    ctx.tx.data = byte_string{0x01, 0x02, 0x03};
    EXPECT_EQ(
        eval(push(0) + op(Opcode::CALLDATALOAD)),
        0x0102030000000000000000000000000000000000000000000000000000000000_u256);
    EXPECT_EQ(
        eval(push(2) + op(Opcode::CALLDATALOAD)),
        0x0300000000000000000000000000000000000000000000000000000000000000_u256);
    EXPECT_EQ(eval(push(3) + op(Opcode::CALLDATALOAD)), 0);
    EXPECT_EQ(eval(push(uint256_t{1} << 100) + op(Opcode::CALLDATALOAD)), 0);
    EXPECT_EQ(eval(op(Opcode::CALLDATASIZE)), 3);
}

TEST_F(EnvironmentalTest, calldatacopy)
{
    ctx.tx.data = byte_string{0xaa, 0xbb, 0xcc};
    // CALLDATACOPY(size 4, src 1, dst 0) then MLOAD 0
    auto &interp = execute(
        push(4) + push(1) + push(0) + op(Opcode::CALLDATACOPY) + push(0) +
        op(Opcode::MLOAD));
    EXPECT_EQ(interp.status(), Status::Success);
    EXPECT_EQ(
        top(),
        0xbbcc000000000000000000000000000000000000000000000000000000000000_u256);
    EXPECT_EQ(interp.memory().size(), 32);
}

TEST_F(EnvironmentalTest, code_introspection)
{
    auto const code = push(7) + push(0) + push(0) + op(Opcode::CODECOPY) +
                      op(Opcode::CODESIZE) + push(0) + op(Opcode::MLOAD);
    auto &interp = execute(code);
    EXPECT_EQ(interp.status(), Status::Success);
    ASSERT_EQ(interp.stack().size(), 2);
    EXPECT_EQ(interp.stack().peek(1).value(), code.size());
    EXPECT_EQ(
        top(),
        0x6007600060003900000000000000000000000000000000000000000000000000_u256);
}

TEST_F(EnvironmentalTest, storage_uses_executing_account)
{
    auto &interp =
        execute(push(42) + push(1) + op(Opcode::SSTORE) + push(1) +
                op(Opcode::SLOAD));
    EXPECT_EQ(interp.status(), Status::Success);
    EXPECT_EQ(top(), 42);
    EXPECT_EQ(storage.load_slot(contract, 1), 42);
    EXPECT_EQ(storage.load_slot(sender, 1), 0);
}

TEST_F(EnvironmentalTest, mstore8_and_msize)
{
    auto &interp = execute(
        push(0x1234) + push(33) + op(Opcode::MSTORE8) + op(Opcode::MSIZE) +
        push(2) + op(Opcode::MLOAD));
    EXPECT_EQ(interp.status(), Status::Success);
    EXPECT_EQ(interp.stack().peek(1).value(), 64);
    EXPECT_EQ(top(), 0x34);
}

TEST_F(EnvironmentalTest, mcopy)
{
    auto &interp = execute(
        push(0xabcd) + push(0) + op(Opcode::MSTORE) + push(32) + push(0) +
        push(16) + op(Opcode::MCOPY) + push(16) + op(Opcode::MLOAD));
    EXPECT_EQ(interp.status(), Status::Success);
    EXPECT_EQ(top(), 0xabcd);
    EXPECT_EQ(interp.memory().size(), 64);
}
