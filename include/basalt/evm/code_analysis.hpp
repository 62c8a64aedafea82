#pragma once

#include <basalt/core/byte_string.hpp>
#include <basalt/evm/config.hpp>

#include <cstddef>
#include <vector>

BASALT_EVM_NAMESPACE_BEGIN

struct CodeAnalysis
{
    byte_string code; // padded so PUSH immediates never read past the end
    size_t code_size;
    std::vector<bool> is_jump_dest;

    byte_string_view executable_code() const noexcept
    {
        return byte_string_view{code}.substr(0, code_size);
    }

    bool is_valid_jump_dest(size_t const pc) const noexcept
    {
        return pc < code_size && is_jump_dest[pc];
    }
};

CodeAnalysis analyze(byte_string_view code);

BASALT_EVM_NAMESPACE_END
