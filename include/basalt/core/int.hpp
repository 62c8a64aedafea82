#pragma once

#include <basalt/config.hpp>

#include <intx/intx.hpp>

BASALT_NAMESPACE_BEGIN

using uint256_t = ::intx::uint256;

BASALT_NAMESPACE_END
