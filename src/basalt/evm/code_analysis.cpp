#include <basalt/core/byte_string.hpp>
#include <basalt/core/likely.h>
#include <basalt/evm/code_analysis.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/opcodes.hpp>

#include <utility>
#include <vector>

BASALT_EVM_NAMESPACE_BEGIN

CodeAnalysis analyze(byte_string_view const code)
{
    // 32 possible missing bytes (due to PUSH32) + 1 more byte for Opcode::STOP
    constexpr auto padding = 32 + 1;

    byte_string padded_code;
    padded_code.reserve(code.size() + padding);
    padded_code.append(code);
    padded_code.append(padding, '\0');

    // immediates of a PUSH are data, a 0x5b among them is not a JUMPDEST
    std::vector<bool> is_jump_dest(code.size());
    for (size_t i = 0; i < code.size();) {
        auto const op = code[i];
        if (BASALT_UNLIKELY(static_cast<Opcode>(op) == Opcode::JUMPDEST)) {
            is_jump_dest[i] = true;
        }
        i += 1 + push_size(op);
    }

    return CodeAnalysis{
        .code = std::move(padded_code),
        .code_size = code.size(),
        .is_jump_dest = std::move(is_jump_dest)};
}

BASALT_EVM_NAMESPACE_END
