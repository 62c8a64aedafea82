#include <basalt/core/assert.h>
#include <basalt/core/likely.h>
#include <basalt/evm/config.hpp>
#include <basalt/evm/error.hpp>
#include <basalt/evm/memory.hpp>
#include <basalt/evm/words.hpp>

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <limits>

BASALT_EVM_NAMESPACE_BEGIN

void Memory::grow(size_t const n)
{
    // 9.1 - word size is 256 bits
    BASALT_ASSERT((n % word_size) == 0);
    BASALT_ASSERT(n > memory_.size());

    // 9.1 - memory is zero-initialized
    memory_.append(n - memory_.size(), '\0');
}

Memory::Memory(size_t const limit)
    : limit_{limit}
{
    // offset + size of two in-limit operands must not wrap
    BASALT_ASSERT(limit <= std::numeric_limits<size_t>::max() / 2);
    static constexpr auto initial_size = 4 * 1024;
    static_assert((initial_size % word_size) == 0);
    memory_.reserve(std::min<size_t>(initial_size, limit));
}

Result<size_t>
Memory::checked_end(uint256_t const &offset, uint256_t const &size) const
{
    if (BASALT_UNLIKELY(offset > limit_ || size > limit_)) {
        return Error::MemoryLimitExceeded;
    }
    auto const end = static_cast<size_t>(offset) + static_cast<size_t>(size);
    // growth is word granular, the rounded size has to fit as well
    if (BASALT_UNLIKELY(round_up_bytes_to_words(end) * word_size > limit_)) {
        return Error::MemoryLimitExceeded;
    }
    return end;
}

Result<void>
Memory::grow_if_needed(uint256_t const &offset, uint256_t const &size)
{
    if (size == 0) {
        return success();
    }
    BOOST_OUTCOME_TRY(auto const end, checked_end(offset, size));
    if (end > memory_.size()) {
        grow(round_up_bytes_to_words(end) * word_size);
    }
    return success();
}

Result<uint8_t> Memory::load_byte(uint256_t const &offset)
{
    BOOST_OUTCOME_TRY(grow_if_needed(offset, 1));
    return memory_[static_cast<size_t>(offset)];
}

Result<void> Memory::store_byte(uint256_t const &offset, uint8_t const value)
{
    BOOST_OUTCOME_TRY(grow_if_needed(offset, 1));
    memory_[static_cast<size_t>(offset)] = value;
    return success();
}

Result<uint256_t> Memory::load_word(uint256_t const &offset)
{
    BOOST_OUTCOME_TRY(grow_if_needed(offset, word_size));
    return intx::be::unsafe::load<uint256_t>(
        memory_.data() + static_cast<size_t>(offset));
}

Result<void>
Memory::store_word(uint256_t const &offset, uint256_t const &value)
{
    BOOST_OUTCOME_TRY(grow_if_needed(offset, word_size));
    intx::be::unsafe::store(
        memory_.data() + static_cast<size_t>(offset), value);
    return success();
}

Result<void> Memory::copy(
    uint256_t const &src, uint256_t const &dst, uint256_t const &size)
{
    if (size == 0) {
        return success();
    }
    BOOST_OUTCOME_TRY(grow_if_needed(src, size));
    BOOST_OUTCOME_TRY(grow_if_needed(dst, size));
    std::memmove(
        memory_.data() + static_cast<size_t>(dst),
        memory_.data() + static_cast<size_t>(src),
        static_cast<size_t>(size));
    return success();
}

Result<void> Memory::store(
    uint256_t const &offset, uint256_t const &size,
    byte_string_view const data)
{
    if (size == 0) {
        return success();
    }
    BOOST_OUTCOME_TRY(grow_if_needed(offset, size));
    auto const n = static_cast<size_t>(size);
    auto const copied = std::min(n, data.size());
    auto *const dst = memory_.data() + static_cast<size_t>(offset);
    std::copy_n(data.data(), copied, dst);
    std::fill_n(dst + copied, n - copied, uint8_t{0});
    return success();
}

byte_string_view Memory::substr(size_t const offset, size_t const size) const
{
    return byte_string_view{memory_}.substr(offset, size);
}

BASALT_EVM_NAMESPACE_END
