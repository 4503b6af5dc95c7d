#ifndef CAPGATE_SCALARS_H
#define CAPGATE_SCALARS_H

#include <cstddef>
#include <cstdint>
#include "api.hpp"

using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using c8 = char;

static CAPGATE_FORCEINLINE unsigned ctz64(u64 x)
{
#if defined(_MSC_VER)
    unsigned long r;
    _BitScanForward64(&r, x);
    return (unsigned)r;
#else
    return (unsigned)__builtin_ctzll(x);
#endif
}

static CAPGATE_FORCEINLINE unsigned popcount64(u64 x)
{
#if defined(_MSC_VER)
    return (unsigned)__popcnt64(x);
#else
    return (unsigned)__builtin_popcountll(x);
#endif
}

#endif
