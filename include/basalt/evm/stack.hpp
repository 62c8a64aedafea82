#pragma once

#include <basalt/core/int.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/stack_pointer.hpp>

#include <cstddef>
#include <memory>
#include <span>

BASALT_EVM_NAMESPACE_BEGIN

constexpr size_t stack_limit = 1024;

// 9.4.1 - the evaluation stack, top is the most recently pushed word
class Stack
{
    std::unique_ptr<uint256_t[]> data_;
    size_t size_;

public:
    Stack();
    Stack(Stack &&) noexcept = default;
    Stack &operator=(Stack &&) noexcept = default;

    // fails with StackOverflow at stack_limit, leaving the stack unchanged
    Result<void> push(uint256_t const &);

    // fails with StackUnderflow on an empty stack
    Result<uint256_t> pop();

    // depth 0 is the top element
    Result<uint256_t> peek(size_t depth) const;

    size_t size() const noexcept
    {
        return size_;
    }

    bool empty() const noexcept
    {
        return size_ == 0;
    }

    // bottom to top
    std::span<uint256_t const> elements() const noexcept;

    StackPointer top_pointer() noexcept;

    // applies the height change of an instruction that ran through a
    // StackPointer
    void adjust(int change) noexcept;
};

BASALT_EVM_NAMESPACE_END
