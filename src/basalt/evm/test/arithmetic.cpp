#include "interpreter_fixture.hpp"

#include <basalt/core/int.hpp>
#include <basalt/evm/opcodes.hpp>
#include <basalt/evm/status.hpp>

#include <intx/intx.hpp>

#include <gtest/gtest.h>

using namespace basalt;
using namespace basalt::evm;
using namespace basalt::evm::test;
using namespace intx::literals;

namespace
{
    constexpr auto max = ~uint256_t{0};

    byte_string
    binary(uint256_t const &left, uint256_t const &right, Opcode const op_)
    {
        return push(left) + push(right) + op(op_);
    }

    byte_string ternary(
        uint256_t const &a, uint256_t const &b, uint256_t const &c,
        Opcode const op_)
    {
        return push(a) + push(b) + push(c) + op(op_);
    }

    class ArithmeticTest : public InterpreterTest
    {
    protected:
        uint256_t eval(byte_string const &code)
        {
            auto &interp = execute(code);
            EXPECT_EQ(interp.status(), Status::Success);
            EXPECT_EQ(interp.stack().size(), 1);
            return top();
        }
    };
}

TEST_F(ArithmeticTest, left_operand_is_pushed_first)
{
    EXPECT_EQ(eval(binary(10, 3, Opcode::SUB)), 7);
    EXPECT_EQ(eval(binary(3, 10, Opcode::SUB)), uint256_t{0} - 7);
    EXPECT_EQ(eval(binary(12, 4, Opcode::DIV)), 3);
    EXPECT_EQ(eval(binary(4, 12, Opcode::DIV)), 0);
    EXPECT_EQ(eval(binary(12, 5, Opcode::MOD)), 2);
}

TEST_F(ArithmeticTest, wrapping)
{
    EXPECT_EQ(eval(binary(max, 1, Opcode::ADD)), 0);
    EXPECT_EQ(eval(binary(max, 2, Opcode::MUL)), max - 1);
    EXPECT_EQ(eval(binary(0, 1, Opcode::SUB)), max);
}

TEST_F(ArithmeticTest, division_by_zero)
{
    EXPECT_EQ(eval(binary(10, 0, Opcode::DIV)), 0);
    EXPECT_EQ(eval(binary(10, 0, Opcode::MOD)), 0);
    EXPECT_EQ(eval(binary(10, 0, Opcode::SDIV)), 0);
    EXPECT_EQ(eval(binary(10, 0, Opcode::SMOD)), 0);
    EXPECT_EQ(eval(ternary(10, 10, 0, Opcode::ADDMOD)), 0);
    EXPECT_EQ(eval(ternary(10, 10, 0, Opcode::MULMOD)), 0);
}

TEST_F(ArithmeticTest, signed_division)
{
    auto const minus_eight = uint256_t{0} - 8;
    EXPECT_EQ(eval(binary(minus_eight, 3, Opcode::SDIV)), uint256_t{0} - 2);
    EXPECT_EQ(eval(binary(minus_eight, 3, Opcode::SMOD)), uint256_t{0} - 2);
    EXPECT_EQ(
        eval(binary(uint256_t{1} << 255, max, Opcode::SDIV)),
        uint256_t{1} << 255);
}

TEST_F(ArithmeticTest, modular)
{
    EXPECT_EQ(eval(ternary(10, 10, 8, Opcode::ADDMOD)), 4);
    EXPECT_EQ(eval(ternary(max, 2, 3, Opcode::ADDMOD)), 2);
    EXPECT_EQ(eval(ternary(10, 10, 7, Opcode::MULMOD)), 2);
    EXPECT_EQ(eval(ternary(max, max, 12, Opcode::MULMOD)), 9);
}

TEST_F(ArithmeticTest, exp)
{
    EXPECT_EQ(eval(binary(2, 10, Opcode::EXP)), 1024);
    EXPECT_EQ(eval(binary(10, 2, Opcode::EXP)), 100);
    EXPECT_EQ(eval(binary(3, 0, Opcode::EXP)), 1);
    EXPECT_EQ(eval(binary(2, 256, Opcode::EXP)), 0);
}

TEST_F(ArithmeticTest, signextend)
{
    EXPECT_EQ(eval(binary(0xff, 0, Opcode::SIGNEXTEND)), max);
    EXPECT_EQ(eval(binary(0x7f, 0, Opcode::SIGNEXTEND)), 0x7f);
    EXPECT_EQ(eval(binary(0xff, 32, Opcode::SIGNEXTEND)), 0xff);
    EXPECT_EQ(
        eval(binary(0x8000, 1, Opcode::SIGNEXTEND)), uint256_t{0} - 0x8000);
}

TEST_F(ArithmeticTest, push32)
{
    constexpr auto w =
        0x0102030405060708091011121314151617181920212223242526272829303132_u256;
    EXPECT_EQ(eval(push(w)), w);
}
