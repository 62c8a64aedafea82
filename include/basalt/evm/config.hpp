#pragma once

#include <basalt/config.hpp>

#define BASALT_EVM_NAMESPACE_BEGIN                                             \
    BASALT_NAMESPACE_BEGIN namespace evm                                       \
    {

#define BASALT_EVM_NAMESPACE_END                                               \
    }                                                                          \
    BASALT_NAMESPACE_END
