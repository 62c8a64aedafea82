#pragma once

#include <basalt/evm/config.hpp>

BASALT_EVM_NAMESPACE_BEGIN

enum Revision
{
    Frontier = 0,
    Homestead = 1,
    TangerineWhistle = 2,
    SpuriousDragon = 3,
    Byzantium = 4,
    Constantinople = 5,
    Petersburg = 6,
    Istanbul = 7,
    Berlin = 8,
    London = 9,
    Paris = 10,
    Shanghai = 11,
    Cancun = 12,
};

inline constexpr Revision latest_revision = Revision::Cancun;

BASALT_EVM_NAMESPACE_END
