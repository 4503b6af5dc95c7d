#pragma once

#include "aarch64.hpp"
#include "x86.hpp"

namespace capgate::arch
{
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
    using host = x86;
#elif defined(__aarch64__) || defined(_M_ARM64)
    using host = aarch64;
#else
    #error "capgate: no capability vocabulary for this architecture"
#endif
} // namespace capgate::arch
