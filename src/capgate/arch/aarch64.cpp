#include <capgate/arch/aarch64.hpp>

#if defined(__linux__) && defined(__aarch64__)
    #define CAPGATE_AARCH64_PROBE 1
    #include <asm/hwcap.h>
    #include <sys/auxv.h>
#endif

namespace capgate::arch
{
    void aarch64::probe(cpu_features &features) noexcept
    {
#ifdef CAPGATE_AARCH64_PROBE
        const unsigned long hwcap = getauxval(AT_HWCAP);
        const unsigned long hwcap2 = getauxval(AT_HWCAP2);

        features.fp = (hwcap & HWCAP_FP) != 0;
        features.asimd = (hwcap & HWCAP_ASIMD) != 0;
        features.evtstrm = (hwcap & HWCAP_EVTSTRM) != 0;
        features.aes = (hwcap & HWCAP_AES) != 0;
        features.pmull = (hwcap & HWCAP_PMULL) != 0;
        features.sha1 = (hwcap & HWCAP_SHA1) != 0;
        features.sha2 = (hwcap & HWCAP_SHA2) != 0;
        features.crc32 = (hwcap & HWCAP_CRC32) != 0;
        features.lse = (hwcap & HWCAP_ATOMICS) != 0;
    #ifdef HWCAP_DCPOP
        features.dcpop = (hwcap & HWCAP_DCPOP) != 0;
    #endif
    #ifdef HWCAP_SHA3
        features.sha3 = (hwcap & HWCAP_SHA3) != 0;
    #endif
    #ifdef HWCAP_SHA512
        features.sha512 = (hwcap & HWCAP_SHA512) != 0;
    #endif
    #ifdef HWCAP_SVE
        features.sve = (hwcap & HWCAP_SVE) != 0;
    #endif
    #ifdef HWCAP2_SVE2
        features.sve2 = (hwcap2 & HWCAP2_SVE2) != 0;
    #else
        (void)hwcap2;
    #endif
        // STXR_PREFETCH, A53MAC and DMB_ATOMICS are core-specific tuning hints; the kernel does not
        // report them, so they stay absent.
#else
        (void)features;
#endif
    }
} // namespace capgate::arch
