#include <basalt/core/assert.h>
#include <basalt/core/likely.h>
#include <basalt/evm/config.hpp>
#include <basalt/evm/error.hpp>
#include <basalt/evm/stack.hpp>

BASALT_EVM_NAMESPACE_BEGIN

Stack::Stack()
    : data_{std::make_unique<uint256_t[]>(stack_limit)}
    , size_{0}
{
}

Result<void> Stack::push(uint256_t const &v)
{
    if (BASALT_UNLIKELY(size_ == stack_limit)) {
        return Error::StackOverflow;
    }
    data_[size_++] = v;
    return success();
}

Result<uint256_t> Stack::pop()
{
    if (BASALT_UNLIKELY(size_ == 0)) {
        return Error::StackUnderflow;
    }
    return data_[--size_];
}

Result<uint256_t> Stack::peek(size_t const depth) const
{
    if (BASALT_UNLIKELY(depth >= size_)) {
        return Error::StackUnderflow;
    }
    return data_[size_ - 1 - depth];
}

std::span<uint256_t const> Stack::elements() const noexcept
{
    return {data_.get(), size_};
}

StackPointer Stack::top_pointer() noexcept
{
    return StackPointer{data_.get() + size_};
}

void Stack::adjust(int const change) noexcept
{
    if (change < 0) {
        BASALT_ASSERT(static_cast<size_t>(-change) <= size_);
    }
    else {
        BASALT_ASSERT(size_ + static_cast<size_t>(change) <= stack_limit);
    }
    size_ = static_cast<size_t>(static_cast<std::ptrdiff_t>(size_) + change);
}

BASALT_EVM_NAMESPACE_END
