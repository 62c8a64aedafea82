#pragma once

#include <basalt/evm/config.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

BASALT_EVM_NAMESPACE_BEGIN

// Appendix H.2
enum class Opcode : uint8_t
{
    STOP = 0x00,
    ADD = 0x01,
    MUL = 0x02,
    SUB = 0x03,
    DIV = 0x04,
    SDIV = 0x05,
    MOD = 0x06,
    SMOD = 0x07,
    ADDMOD = 0x08,
    MULMOD = 0x09,
    EXP = 0x0A,
    SIGNEXTEND = 0x0B,
    LT = 0x10,
    GT = 0x11,
    SLT = 0x12,
    SGT = 0x13,
    EQ = 0x14,
    ISZERO = 0x15,
    AND = 0x16,
    OR = 0x17,
    XOR = 0x18,
    NOT = 0x19,
    BYTE = 0x1A,
    SHL = 0x1B,
    SHR = 0x1C,
    SAR = 0x1D,
    KECCAK256 = 0x20,
    ADDRESS = 0x30,
    BALANCE = 0x31,
    ORIGIN = 0x32,
    CALLER = 0x33,
    CALLVALUE = 0x34,
    CALLDATALOAD = 0x35,
    CALLDATASIZE = 0x36,
    CALLDATACOPY = 0x37,
    CODESIZE = 0x38,
    CODECOPY = 0x39,
    GASPRICE = 0x3A,
    EXTCODESIZE = 0x3B,
    EXTCODECOPY = 0x3C,
    RETURNDATASIZE = 0x3D,
    RETURNDATACOPY = 0x3E,
    EXTCODEHASH = 0x3F,
    BLOCKHASH = 0x40,
    COINBASE = 0x41,
    TIMESTAMP = 0x42,
    NUMBER = 0x43,
    PREVRANDAO = 0x44,
    GASLIMIT = 0x45,
    CHAINID = 0x46,
    SELFBALANCE = 0x47,
    BASEFEE = 0x48,
    BLOBHASH = 0x49,
    BLOBBASEFEE = 0x4A,
    POP = 0x50,
    MLOAD = 0x51,
    MSTORE = 0x52,
    MSTORE8 = 0x53,
    SLOAD = 0x54,
    SSTORE = 0x55,
    JUMP = 0x56,
    JUMPI = 0x57,
    PC = 0x58,
    MSIZE = 0x59,
    GAS = 0x5A,
    JUMPDEST = 0x5B,
    TLOAD = 0x5C,
    TSTORE = 0x5D,
    MCOPY = 0x5E,
    PUSH0 = 0x5F,
    PUSH1 = 0x60,
    PUSH2 = 0x61,
    PUSH3 = 0x62,
    PUSH4 = 0x63,
    PUSH5 = 0x64,
    PUSH6 = 0x65,
    PUSH7 = 0x66,
    PUSH8 = 0x67,
    PUSH9 = 0x68,
    PUSH10 = 0x69,
    PUSH11 = 0x6A,
    PUSH12 = 0x6B,
    PUSH13 = 0x6C,
    PUSH14 = 0x6D,
    PUSH15 = 0x6E,
    PUSH16 = 0x6F,
    PUSH17 = 0x70,
    PUSH18 = 0x71,
    PUSH19 = 0x72,
    PUSH20 = 0x73,
    PUSH21 = 0x74,
    PUSH22 = 0x75,
    PUSH23 = 0x76,
    PUSH24 = 0x77,
    PUSH25 = 0x78,
    PUSH26 = 0x79,
    PUSH27 = 0x7A,
    PUSH28 = 0x7B,
    PUSH29 = 0x7C,
    PUSH30 = 0x7D,
    PUSH31 = 0x7E,
    PUSH32 = 0x7F,
    DUP1 = 0x80,
    DUP2 = 0x81,
    DUP3 = 0x82,
    DUP4 = 0x83,
    DUP5 = 0x84,
    DUP6 = 0x85,
    DUP7 = 0x86,
    DUP8 = 0x87,
    DUP9 = 0x88,
    DUP10 = 0x89,
    DUP11 = 0x8A,
    DUP12 = 0x8B,
    DUP13 = 0x8C,
    DUP14 = 0x8D,
    DUP15 = 0x8E,
    DUP16 = 0x8F,
    SWAP1 = 0x90,
    SWAP2 = 0x91,
    SWAP3 = 0x92,
    SWAP4 = 0x93,
    SWAP5 = 0x94,
    SWAP6 = 0x95,
    SWAP7 = 0x96,
    SWAP8 = 0x97,
    SWAP9 = 0x98,
    SWAP10 = 0x99,
    SWAP11 = 0x9A,
    SWAP12 = 0x9B,
    SWAP13 = 0x9C,
    SWAP14 = 0x9D,
    SWAP15 = 0x9E,
    SWAP16 = 0x9F,
    LOG0 = 0xA0,
    LOG1 = 0xA1,
    LOG2 = 0xA2,
    LOG3 = 0xA3,
    LOG4 = 0xA4,
    CREATE = 0xF0,
    CALL = 0xF1,
    CALLCODE = 0xF2,
    RETURN = 0xF3,
    DELEGATECALL = 0xF4,
    CREATE2 = 0xF5,
    STATICCALL = 0xFA,
    REVERT = 0xFD,
    INVALID = 0xFE,
    SELFDESTRUCT = 0xFF,
};

namespace detail
{
    consteval std::array<std::string_view, 256> make_opcode_names()
    {
        std::array<std::string_view, 256> names{};
        names[0x00] = "STOP";
        names[0x01] = "ADD";
        names[0x02] = "MUL";
        names[0x03] = "SUB";
        names[0x04] = "DIV";
        names[0x05] = "SDIV";
        names[0x06] = "MOD";
        names[0x07] = "SMOD";
        names[0x08] = "ADDMOD";
        names[0x09] = "MULMOD";
        names[0x0A] = "EXP";
        names[0x0B] = "SIGNEXTEND";
        names[0x10] = "LT";
        names[0x11] = "GT";
        names[0x12] = "SLT";
        names[0x13] = "SGT";
        names[0x14] = "EQ";
        names[0x15] = "ISZERO";
        names[0x16] = "AND";
        names[0x17] = "OR";
        names[0x18] = "XOR";
        names[0x19] = "NOT";
        names[0x1A] = "BYTE";
        names[0x1B] = "SHL";
        names[0x1C] = "SHR";
        names[0x1D] = "SAR";
        names[0x20] = "KECCAK256";
        names[0x30] = "ADDRESS";
        names[0x31] = "BALANCE";
        names[0x32] = "ORIGIN";
        names[0x33] = "CALLER";
        names[0x34] = "CALLVALUE";
        names[0x35] = "CALLDATALOAD";
        names[0x36] = "CALLDATASIZE";
        names[0x37] = "CALLDATACOPY";
        names[0x38] = "CODESIZE";
        names[0x39] = "CODECOPY";
        names[0x3A] = "GASPRICE";
        names[0x3B] = "EXTCODESIZE";
        names[0x3C] = "EXTCODECOPY";
        names[0x3D] = "RETURNDATASIZE";
        names[0x3E] = "RETURNDATACOPY";
        names[0x3F] = "EXTCODEHASH";
        names[0x40] = "BLOCKHASH";
        names[0x41] = "COINBASE";
        names[0x42] = "TIMESTAMP";
        names[0x43] = "NUMBER";
        names[0x44] = "PREVRANDAO";
        names[0x45] = "GASLIMIT";
        names[0x46] = "CHAINID";
        names[0x47] = "SELFBALANCE";
        names[0x48] = "BASEFEE";
        names[0x49] = "BLOBHASH";
        names[0x4A] = "BLOBBASEFEE";
        names[0x50] = "POP";
        names[0x51] = "MLOAD";
        names[0x52] = "MSTORE";
        names[0x53] = "MSTORE8";
        names[0x54] = "SLOAD";
        names[0x55] = "SSTORE";
        names[0x56] = "JUMP";
        names[0x57] = "JUMPI";
        names[0x58] = "PC";
        names[0x59] = "MSIZE";
        names[0x5A] = "GAS";
        names[0x5B] = "JUMPDEST";
        names[0x5C] = "TLOAD";
        names[0x5D] = "TSTORE";
        names[0x5E] = "MCOPY";
        names[0x5F] = "PUSH0";
        names[0x60] = "PUSH1";
        names[0x61] = "PUSH2";
        names[0x62] = "PUSH3";
        names[0x63] = "PUSH4";
        names[0x64] = "PUSH5";
        names[0x65] = "PUSH6";
        names[0x66] = "PUSH7";
        names[0x67] = "PUSH8";
        names[0x68] = "PUSH9";
        names[0x69] = "PUSH10";
        names[0x6A] = "PUSH11";
        names[0x6B] = "PUSH12";
        names[0x6C] = "PUSH13";
        names[0x6D] = "PUSH14";
        names[0x6E] = "PUSH15";
        names[0x6F] = "PUSH16";
        names[0x70] = "PUSH17";
        names[0x71] = "PUSH18";
        names[0x72] = "PUSH19";
        names[0x73] = "PUSH20";
        names[0x74] = "PUSH21";
        names[0x75] = "PUSH22";
        names[0x76] = "PUSH23";
        names[0x77] = "PUSH24";
        names[0x78] = "PUSH25";
        names[0x79] = "PUSH26";
        names[0x7A] = "PUSH27";
        names[0x7B] = "PUSH28";
        names[0x7C] = "PUSH29";
        names[0x7D] = "PUSH30";
        names[0x7E] = "PUSH31";
        names[0x7F] = "PUSH32";
        names[0x80] = "DUP1";
        names[0x81] = "DUP2";
        names[0x82] = "DUP3";
        names[0x83] = "DUP4";
        names[0x84] = "DUP5";
        names[0x85] = "DUP6";
        names[0x86] = "DUP7";
        names[0x87] = "DUP8";
        names[0x88] = "DUP9";
        names[0x89] = "DUP10";
        names[0x8A] = "DUP11";
        names[0x8B] = "DUP12";
        names[0x8C] = "DUP13";
        names[0x8D] = "DUP14";
        names[0x8E] = "DUP15";
        names[0x8F] = "DUP16";
        names[0x90] = "SWAP1";
        names[0x91] = "SWAP2";
        names[0x92] = "SWAP3";
        names[0x93] = "SWAP4";
        names[0x94] = "SWAP5";
        names[0x95] = "SWAP6";
        names[0x96] = "SWAP7";
        names[0x97] = "SWAP8";
        names[0x98] = "SWAP9";
        names[0x99] = "SWAP10";
        names[0x9A] = "SWAP11";
        names[0x9B] = "SWAP12";
        names[0x9C] = "SWAP13";
        names[0x9D] = "SWAP14";
        names[0x9E] = "SWAP15";
        names[0x9F] = "SWAP16";
        names[0xA0] = "LOG0";
        names[0xA1] = "LOG1";
        names[0xA2] = "LOG2";
        names[0xA3] = "LOG3";
        names[0xA4] = "LOG4";
        names[0xF0] = "CREATE";
        names[0xF1] = "CALL";
        names[0xF2] = "CALLCODE";
        names[0xF3] = "RETURN";
        names[0xF4] = "DELEGATECALL";
        names[0xF5] = "CREATE2";
        names[0xFA] = "STATICCALL";
        names[0xFD] = "REVERT";
        names[0xFE] = "INVALID";
        names[0xFF] = "SELFDESTRUCT";
        return names;
    }
}

inline constexpr auto opcode_names = detail::make_opcode_names();

// empty for bytes that are not assigned an instruction
constexpr std::string_view opcode_name(uint8_t const op) noexcept
{
    return opcode_names[op];
}

constexpr bool is_push(uint8_t const op) noexcept
{
    return op >= static_cast<uint8_t>(Opcode::PUSH0) &&
           op <= static_cast<uint8_t>(Opcode::PUSH32);
}

// number of immediate bytes following a PUSH opcode
constexpr size_t push_size(uint8_t const op) noexcept
{
    return is_push(op) ? static_cast<size_t>(
                             op - static_cast<uint8_t>(Opcode::PUSH0))
                       : 0;
}

BASALT_EVM_NAMESPACE_END
