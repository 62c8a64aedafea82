#pragma once

#include <basalt/core/int.hpp>
#include <basalt/evm/config.hpp>

#include <cstddef>

BASALT_EVM_NAMESPACE_BEGIN

// Unchecked view of the stack handed to instruction handlers. The interpreter
// validates the stack height before the handler runs, so none of these
// operations can leave the stack bounds.
class StackPointer
{
    uint256_t *ptr_; // one past the top element

public:
    explicit StackPointer(uint256_t *) noexcept;

    uint256_t const &pop() noexcept;
    void push(uint256_t const &) noexcept;

    // n = 0 is the top element
    uint256_t &at(size_t n) noexcept;
};

static_assert(sizeof(StackPointer) == 8);
static_assert(alignof(StackPointer) == 8);

BASALT_EVM_NAMESPACE_END
