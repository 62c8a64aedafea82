#pragma once

#include <basalt/config.hpp>

#include <evmc/evmc.hpp>

BASALT_NAMESPACE_BEGIN

using Address = ::evmc::address;

static_assert(sizeof(Address) == 20);
static_assert(alignof(Address) == 1);

BASALT_NAMESPACE_END
