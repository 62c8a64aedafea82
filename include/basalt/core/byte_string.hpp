#pragma once

#include <basalt/config.hpp>

#include <string>
#include <string_view>

BASALT_NAMESPACE_BEGIN

using byte_string = std::basic_string<unsigned char>;
using byte_string_view = std::basic_string_view<unsigned char>;

BASALT_NAMESPACE_END
