#pragma once

#if defined(_WIN32) || defined(_WIN64)
#define KINETIC_OPERATING_SYSTEM_WINDOWS
#elif defined(__linux__)
#define KINETIC_OPERATING_SYSTEM_LINUX
#endif

#if defined(__GNUC__) || defined(__clang__)
#define KINETIC_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
#define KINETIC_UNREACHABLE() __assume(false)
#else
#include <cassert>
#define KINETIC_UNREACHABLE() assert(0)
#endif
