#pragma once

#include <basalt/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void basalt_assertion_failed(
    char const *expr, char const *function, char const *file, long line);

#ifdef __cplusplus
}
#endif

#define BASALT_ASSERT(expr)                                                    \
    (BASALT_LIKELY(!!(expr))                                                   \
         ? ((void)0)                                                           \
         : basalt_assertion_failed(                                            \
               #expr, __PRETTY_FUNCTION__, __FILE__, __LINE__))
