#include <basalt/core/assert.h>
#include <basalt/evm/arithmetic.hpp>
#include <basalt/evm/bitwise.hpp>
#include <basalt/evm/block_info.hpp>
#include <basalt/evm/comparison.hpp>
#include <basalt/evm/config.hpp>
#include <basalt/evm/dup.hpp>
#include <basalt/evm/environmental.hpp>
#include <basalt/evm/explicit_revision.hpp>
#include <basalt/evm/fee_schedule.hpp>
#include <basalt/evm/instruction_table.hpp>
#include <basalt/evm/opcodes.hpp>
#include <basalt/evm/push.hpp>
#include <basalt/evm/revision.hpp>
#include <basalt/evm/stack_memory_storage_flow.hpp>
#include <basalt/evm/swap.hpp>
#include <basalt/evm/system.hpp>

#include <cstddef>
#include <utility>

BASALT_EVM_NAMESPACE_BEGIN

namespace
{
    constexpr Instruction undefined{
        .eval = invalid,
        .cost = zero_cost,
        .stack_required = 0,
        .stack_change = 0,
        .pc_increment = 1};

    template <Revision rev>
    consteval InstructionTable make_instruction_table()
    {
        constexpr auto since = [](Revision const first,
                                  Instruction const instr) {
            return rev >= first ? instr : undefined;
        };

        InstructionTable table{};
        table.fill(undefined);

        auto const set = [&table](Opcode const op, Instruction const instr) {
            table[std::to_underlying(op)] = instr;
        };

        using enum Opcode;

        // 0s: stop and arithmetic
        set(STOP, {stop, zero_cost, 0, 0, 1});
        set(ADD, {add, very_low_cost, 2, -1, 1});
        set(MUL, {mul, low_cost, 2, -1, 1});
        set(SUB, {sub, very_low_cost, 2, -1, 1});
        set(DIV, {div, low_cost, 2, -1, 1});
        set(SDIV, {sdiv, low_cost, 2, -1, 1});
        set(MOD, {mod, low_cost, 2, -1, 1});
        set(SMOD, {smod, low_cost, 2, -1, 1});
        set(ADDMOD, {addmod, mid_cost, 3, -2, 1});
        set(MULMOD, {mulmod, mid_cost, 3, -2, 1});
        set(EXP, {exp<rev>, exp_cost, 2, -1, 1});
        set(SIGNEXTEND, {signextend, low_cost, 2, -1, 1});

        // 10s: comparison and bitwise logic
        set(LT, {lt, very_low_cost, 2, -1, 1});
        set(GT, {gt, very_low_cost, 2, -1, 1});
        set(SLT, {slt, very_low_cost, 2, -1, 1});
        set(SGT, {sgt, very_low_cost, 2, -1, 1});
        set(EQ, {eq, very_low_cost, 2, -1, 1});
        set(ISZERO, {iszero, very_low_cost, 1, 0, 1});
        set(AND, {and_, very_low_cost, 2, -1, 1});
        set(OR, {or_, very_low_cost, 2, -1, 1});
        set(XOR, {xor_, very_low_cost, 2, -1, 1});
        set(NOT, {not_, very_low_cost, 1, 0, 1});
        set(BYTE, {byte, very_low_cost, 2, -1, 1});
        set(SHL, since(Constantinople, {shl, very_low_cost, 2, -1, 1}));
        set(SHR, since(Constantinople, {shr, very_low_cost, 2, -1, 1}));
        set(SAR, since(Constantinople, {sar, very_low_cost, 2, -1, 1}));

        // 30s: environmental information
        set(ADDRESS, {address, base_cost, 0, 1, 1});
        set(BALANCE, {balance, balance_cost<rev>(), 1, 0, 1});
        set(ORIGIN, {origin, base_cost, 0, 1, 1});
        set(CALLER, {caller, base_cost, 0, 1, 1});
        set(CALLVALUE, {callvalue, base_cost, 0, 1, 1});
        set(CALLDATALOAD, {calldataload, very_low_cost, 1, 0, 1});
        set(CALLDATASIZE, {calldatasize, base_cost, 0, 1, 1});
        set(CALLDATACOPY, {calldatacopy, very_low_cost, 3, -3, 1});
        set(CODESIZE, {codesize, base_cost, 0, 1, 1});
        set(CODECOPY, {codecopy, very_low_cost, 3, -3, 1});
        set(GASPRICE, {gasprice, base_cost, 0, 1, 1});

        // 40s: block information
        set(BLOCKHASH, {blockhash, blockhash_cost, 1, 0, 1});
        set(COINBASE, {coinbase, base_cost, 0, 1, 1});
        set(TIMESTAMP, {timestamp, base_cost, 0, 1, 1});
        set(NUMBER, {number, base_cost, 0, 1, 1});
        set(GASLIMIT, {gaslimit, base_cost, 0, 1, 1});
        set(CHAINID, since(Istanbul, {chainid, base_cost, 0, 1, 1}));
        set(SELFBALANCE, since(Istanbul, {selfbalance, low_cost, 0, 1, 1}));
        set(BASEFEE, since(London, {basefee, base_cost, 0, 1, 1}));

        // 50s: stack, memory, storage and flow
        set(POP, {pop, base_cost, 1, -1, 1});
        set(MLOAD, {mload, very_low_cost, 1, 0, 1});
        set(MSTORE, {mstore, very_low_cost, 2, -2, 1});
        set(MSTORE8, {mstore8, very_low_cost, 2, -2, 1});
        set(SLOAD, {sload, sload_cost<rev>(), 1, 0, 1});
        set(SSTORE, {sstore, zero_cost, 2, -2, 1});
        set(JUMP, {jump, mid_cost, 1, -1, 0});
        set(JUMPI, {jumpi, high_cost, 2, -2, 0});
        set(PC, {pc, base_cost, 0, 1, 1});
        set(MSIZE, {msize, base_cost, 0, 1, 1});
        set(GAS, {gas, base_cost, 0, 1, 1});
        set(JUMPDEST, {jumpdest, jumpdest_cost, 0, 0, 1});
        set(MCOPY, since(Cancun, {mcopy, very_low_cost, 3, -3, 1}));

        // 5f, 60s and 70s: push
        set(PUSH0, since(Shanghai, {push<0>, base_cost, 0, 1, 1}));
        [&table]<size_t... I>(std::index_sequence<I...>) {
            ((table[std::to_underlying(PUSH1) + I] =
                  {push<I + 1>, very_low_cost, 0, 1, I + 2}),
             ...);
        }(std::make_index_sequence<32>{});

        // 80s: duplication
        [&table]<size_t... I>(std::index_sequence<I...>) {
            ((table[std::to_underlying(DUP1) + I] =
                  {dup<I + 1>, very_low_cost, I + 1, 1, 1}),
             ...);
        }(std::make_index_sequence<16>{});

        // 90s: exchange
        [&table]<size_t... I>(std::index_sequence<I...>) {
            ((table[std::to_underlying(SWAP1) + I] =
                  {swap<I + 1>, very_low_cost, I + 2, 0, 1}),
             ...);
        }(std::make_index_sequence<16>{});

        // f0s: system
        set(RETURN, {return_, zero_cost, 2, -2, 1});
        set(REVERT, since(Byzantium, {revert, zero_cost, 2, -2, 1}));
        set(INVALID, undefined);

        return table;
    }
}

template <Revision rev>
InstructionTable const &instruction_table() noexcept
{
    static constexpr auto table = make_instruction_table<rev>();
    return table;
}

EXPLICIT_REVISION(instruction_table);

InstructionTable const &instruction_table(Revision const rev) noexcept
{
    switch (rev) {
    case Frontier:
        return instruction_table<Frontier>();
    case Homestead:
        return instruction_table<Homestead>();
    case TangerineWhistle:
        return instruction_table<TangerineWhistle>();
    case SpuriousDragon:
        return instruction_table<SpuriousDragon>();
    case Byzantium:
        return instruction_table<Byzantium>();
    case Constantinople:
        return instruction_table<Constantinople>();
    case Petersburg:
        return instruction_table<Petersburg>();
    case Istanbul:
        return instruction_table<Istanbul>();
    case Berlin:
        return instruction_table<Berlin>();
    case London:
        return instruction_table<London>();
    case Paris:
        return instruction_table<Paris>();
    case Shanghai:
        return instruction_table<Shanghai>();
    case Cancun:
        return instruction_table<Cancun>();
    }
    BASALT_ASSERT(false);
    return instruction_table<latest_revision>();
}

BASALT_EVM_NAMESPACE_END
