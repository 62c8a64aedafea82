#pragma once

#include <basalt/core/byte_string.hpp>
#include <basalt/core/int.hpp>
#include <basalt/core/result.hpp>
#include <basalt/evm/config.hpp>

#include <cstddef>
#include <cstdint>

BASALT_EVM_NAMESPACE_BEGIN

// 9.1 - memory is a zero initialized, word addressed byte array that only
// grows. Every access first grows the array to cover [offset, offset + size)
// rounded up to a whole word. Accesses whose rounded end lies beyond the limit
// fail with MemoryLimitExceeded instead of allocating.
class Memory
{
    byte_string memory_;
    size_t limit_;

    void grow(size_t);

public:
    static constexpr size_t default_limit = 32 * 1024 * 1024;

    explicit Memory(size_t limit = default_limit);

    size_t size() const noexcept
    {
        return memory_.size();
    }

    size_t limit() const noexcept
    {
        return limit_;
    }

    // end of [offset, offset + size) if its word rounded end lies within the
    // limit
    Result<size_t>
    checked_end(uint256_t const &offset, uint256_t const &size) const;

    // a zero size never grows memory
    Result<void>
    grow_if_needed(uint256_t const &offset, uint256_t const &size);

    Result<uint8_t> load_byte(uint256_t const &offset);
    Result<void> store_byte(uint256_t const &offset, uint8_t);

    // 32 bytes, big endian
    Result<uint256_t> load_word(uint256_t const &offset);
    Result<void> store_word(uint256_t const &offset, uint256_t const &);

    // overlapping regions are copied as if through an intermediate buffer
    Result<void> copy(
        uint256_t const &src, uint256_t const &dst, uint256_t const &size);

    // writes size bytes at offset taken from data, zero filling past its end
    Result<void> store(
        uint256_t const &offset, uint256_t const &size, byte_string_view data);

    byte_string_view substr(size_t offset, size_t size) const;
};

BASALT_EVM_NAMESPACE_END
