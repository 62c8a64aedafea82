#include <basalt/core/int.hpp>
#include <basalt/evm/error.hpp>
#include <basalt/evm/stack.hpp>

#include <gtest/gtest.h>

#include <cstddef>

using namespace basalt;
using namespace basalt::evm;

TEST(Stack, push_pop_peek)
{
    Stack s;
    EXPECT_TRUE(s.empty());
    EXPECT_TRUE(s.push(1).has_value());
    EXPECT_TRUE(s.push(2).has_value());
    EXPECT_TRUE(s.push(3).has_value());
    EXPECT_EQ(s.size(), 3);

    EXPECT_EQ(s.peek(0).value(), 3);
    EXPECT_EQ(s.peek(2).value(), 1);
    EXPECT_EQ(s.peek(3).error(), Error::StackUnderflow);

    EXPECT_EQ(s.pop().value(), 3);
    EXPECT_EQ(s.pop().value(), 2);
    EXPECT_EQ(s.size(), 1);
}

TEST(Stack, overflow_leaves_stack_unchanged)
{
    Stack s;
    for (size_t i = 0; i < stack_limit; ++i) {
        ASSERT_TRUE(s.push(i).has_value());
    }
    EXPECT_EQ(s.size(), 1024);

    auto const res = s.push(uint256_t{0xdead});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), Error::StackOverflow);
    EXPECT_EQ(s.size(), 1024);
    EXPECT_EQ(s.peek(0).value(), 1023);
}

TEST(Stack, underflow_on_empty)
{
    Stack s;
    auto const res = s.pop();
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error(), Error::StackUnderflow);
    EXPECT_EQ(s.size(), 0);
}

TEST(Stack, elements_bottom_to_top)
{
    Stack s;
    EXPECT_TRUE(s.push(10).has_value());
    EXPECT_TRUE(s.push(20).has_value());
    auto const elements = s.elements();
    ASSERT_EQ(elements.size(), 2);
    EXPECT_EQ(elements[0], 10);
    EXPECT_EQ(elements[1], 20);
}

TEST(Stack, stack_pointer)
{
    Stack s;
    EXPECT_TRUE(s.push(7).has_value());
    EXPECT_TRUE(s.push(9).has_value());

    auto sp = s.top_pointer();
    EXPECT_EQ(sp.at(0), 9);
    EXPECT_EQ(sp.at(1), 7);
    auto const right = sp.pop();
    auto const left = sp.pop();
    sp.push(left - right);
    s.adjust(-1);

    EXPECT_EQ(s.size(), 1);
    EXPECT_EQ(s.peek(0).value(), uint256_t{0} - 2);
}
