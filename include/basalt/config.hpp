#pragma once

#define BASALT_NAMESPACE_BEGIN                                                 \
    namespace basalt                                                           \
    {

#define BASALT_NAMESPACE_END }
