#pragma once

#define BASALT_LIKELY(x) __builtin_expect(!!(x), 1)
#define BASALT_UNLIKELY(x) __builtin_expect(!!(x), 0)
