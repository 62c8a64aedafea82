#include <basalt/evm/config.hpp>
#include <basalt/evm/stack_pointer.hpp>

BASALT_EVM_NAMESPACE_BEGIN

StackPointer::StackPointer(uint256_t *const ptr) noexcept
    : ptr_{ptr}
{
}

uint256_t const &StackPointer::pop() noexcept
{
    return *--ptr_;
}

void StackPointer::push(uint256_t const &v) noexcept
{
    *ptr_++ = v;
}

uint256_t &StackPointer::at(size_t const n) noexcept
{
    return *(ptr_ - 1 - n);
}

BASALT_EVM_NAMESPACE_END
