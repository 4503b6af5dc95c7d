#include <capgate/arch/x86.hpp>

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
    #define CAPGATE_X86_PROBE 1
    #if defined(__GNUC__) || defined(__clang__)
        #include <cpuid.h>
    #elif defined(_MSC_VER)
        #include <immintrin.h>
        #include <intrin.h>
    #endif
#endif

namespace capgate::arch
{
#ifdef CAPGATE_X86_PROBE
    namespace
    {
        struct cpuid_regs
        {
            u32 eax = 0;
            u32 ebx = 0;
            u32 ecx = 0;
            u32 edx = 0;
        };

        inline bool bit(u32 reg, unsigned n) noexcept { return (reg >> n) & 1u; }

        u32 max_leaf(u32 base) noexcept
        {
    #if defined(__GNUC__) || defined(__clang__)
            return __get_cpuid_max(base, nullptr);
    #else
            int regs[4];
            __cpuid(regs, static_cast<int>(base));
            return static_cast<u32>(regs[0]);
    #endif
        }

        cpuid_regs cpuid(u32 leaf, u32 subleaf = 0) noexcept
        {
            cpuid_regs r;
    #if defined(__GNUC__) || defined(__clang__)
            __cpuid_count(leaf, subleaf, r.eax, r.ebx, r.ecx, r.edx);
    #else
            int regs[4];
            __cpuidex(regs, static_cast<int>(leaf), static_cast<int>(subleaf));
            r.eax = static_cast<u32>(regs[0]);
            r.ebx = static_cast<u32>(regs[1]);
            r.ecx = static_cast<u32>(regs[2]);
            r.edx = static_cast<u32>(regs[3]);
    #endif
            return r;
        }

        u64 get_xcr0() noexcept
        {
    #if defined(__GNUC__) || defined(__clang__)
            u32 eax = 0;
            u32 edx = 0;
            __asm__ volatile("xgetbv" : "=a"(eax), "=d"(edx) : "c"(0));
            return (static_cast<u64>(edx) << 32) | eax;
    #else
            return _xgetbv(0);
    #endif
        }

        // XMM and YMM state
        inline bool is_avx_ready(u64 xcr0) noexcept { return (xcr0 & 0x06u) == 0x06u; }

        // Opmask, upper ZMM0-15 and ZMM16-31 state
        inline bool is_avx512_ready(u64 xcr0) noexcept { return (xcr0 & 0xE6u) == 0xE6u; }
    } // namespace
#endif

    void x86::probe(cpu_features &features) noexcept
    {
#ifdef CAPGATE_X86_PROBE
        const u32 max_std = max_leaf(0);
        if (max_std < 1) return;

        const cpuid_regs leaf1 = cpuid(1);
        features.tsc = bit(leaf1.edx, 4);
        features.cx8 = bit(leaf1.edx, 8);
        features.cmov = bit(leaf1.edx, 15);
        features.mmx = bit(leaf1.edx, 23);
        features.fxsr = bit(leaf1.edx, 24);
        features.sse = bit(leaf1.edx, 25);
        features.sse2 = bit(leaf1.edx, 26);
        features.ht = bit(leaf1.edx, 28);

        features.sse3 = bit(leaf1.ecx, 0);
        features.clmul = bit(leaf1.ecx, 1);
        features.ssse3 = bit(leaf1.ecx, 9);
        features.sse4_1 = bit(leaf1.ecx, 19);
        features.sse4_2 = bit(leaf1.ecx, 20);
        features.popcnt = bit(leaf1.ecx, 23);
        features.aes = bit(leaf1.ecx, 25);

        const bool has_osxsave = bit(leaf1.ecx, 27);
        const bool has_avx = bit(leaf1.ecx, 28);
        bool avx_ready = false;
        bool avx512_ready = false;
        if (has_osxsave && has_avx)
        {
            const u64 xcr0 = get_xcr0();
            avx_ready = is_avx_ready(xcr0);
            avx512_ready = is_avx512_ready(xcr0);
        }
        if (avx_ready)
        {
            features.avx = 1;
            features.fma = bit(leaf1.ecx, 12);
        }

        if (max_std >= 7)
        {
            const cpuid_regs leaf7 = cpuid(7, 0);
            features.bmi1 = bit(leaf7.ebx, 3);
            features.bmi2 = bit(leaf7.ebx, 8);
            features.erms = bit(leaf7.ebx, 9);
            features.rtm = bit(leaf7.ebx, 11);
            features.adx = bit(leaf7.ebx, 19);
            features.sha = bit(leaf7.ebx, 29);
            if (avx_ready) features.avx2 = bit(leaf7.ebx, 5);
            if (avx512_ready)
            {
                features.avx512f = bit(leaf7.ebx, 16);
                features.avx512dq = bit(leaf7.ebx, 17);
                features.avx512pf = bit(leaf7.ebx, 26);
                features.avx512er = bit(leaf7.ebx, 27);
                features.avx512cd = bit(leaf7.ebx, 28);
                features.avx512bw = bit(leaf7.ebx, 30);
                features.avx512vl = bit(leaf7.ebx, 31);
            }
        }

        const u32 max_ext = max_leaf(0x80000000u);
        if (max_ext >= 0x80000001u)
        {
            const cpuid_regs ext1 = cpuid(0x80000001u);
            features.lzcnt = bit(ext1.ecx, 5);
            features.sse4a = bit(ext1.ecx, 6);
            // PREFETCHW, or the legacy 3DNow! bit
            features.amd_3dnow_prefetch = bit(ext1.ecx, 8) || bit(ext1.edx, 31);
        }
        if (max_ext >= 0x80000007u)
        {
            const cpuid_regs ext7 = cpuid(0x80000007u);
            features.tscinv = bit(ext7.edx, 8);
        }
#else
        (void)features;
#endif
    }
} // namespace capgate::arch
