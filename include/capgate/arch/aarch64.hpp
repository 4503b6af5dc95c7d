#pragma once

#include "../enum.hpp"
#include "../resolver.hpp"

namespace capgate::arch
{
    struct aarch64_cpu_features
    {
        u8 fp;
        u8 asimd;
        u8 evtstrm;
        u8 aes;
        u8 pmull;
        u8 sha1;
        u8 sha2;
        u8 crc32;
        u8 lse;
        u8 dcpop;
        u8 sha3;
        u8 sha512;
        u8 sve;
        u8 sve2;
        u8 stxr_prefetch;
        u8 a53mac;
        u8 dmb_atomics;
    };

    static_assert(std::is_standard_layout_v<aarch64_cpu_features>);
    static_assert(sizeof(aarch64_cpu_features) == 17);

    struct aarch64
    {
        static constexpr const char *name = "aarch64";

        enum class feature : u8
        {
            fp,
            asimd,
            evtstrm,
            aes,
            pmull,
            sha1,
            sha2,
            crc32,
            lse,
            dcpop,
            sha3,
            sha512,
            sve,
            sve2,
            stxr_prefetch,
            a53mac,
            dmb_atomics
        };

        static constexpr size_t feature_count = 17;

        static constexpr const char *feature_names[feature_count] = {
            "FP",   "ASIMD", "EVTSTRM", "AES",    "PMULL", "SHA1", "SHA2",          "CRC32",  "LSE",
            "DCPOP", "SHA3", "SHA512",  "SVE",    "SVE2",  "STXR_PREFETCH", "A53MAC", "DMB_ATOMICS"};

        using cpu_features = aarch64_cpu_features;

        static constexpr flag_field<cpu_features> fields[] = {
            {"FP", &cpu_features::fp},
            {"ASIMD", &cpu_features::asimd},
            {"EVTSTRM", &cpu_features::evtstrm},
            {"AES", &cpu_features::aes},
            {"PMULL", &cpu_features::pmull},
            {"SHA1", &cpu_features::sha1},
            {"SHA2", &cpu_features::sha2},
            {"CRC32", &cpu_features::crc32},
            {"LSE", &cpu_features::lse},
            {"DCPOP", &cpu_features::dcpop},
            {"SHA3", &cpu_features::sha3},
            {"SHA512", &cpu_features::sha512},
            {"SVE", &cpu_features::sve},
            {"SVE2", &cpu_features::sve2},
            {"STXR_PREFETCH", &cpu_features::stxr_prefetch},
            {"A53MAC", &cpu_features::a53mac},
            {"DMB_ATOMICS", &cpu_features::dmb_atomics},
        };

        struct flag_bits
        {
            enum enum_type : u8
            {
                none = 0x00,
                use_crc32 = 0x01,
                use_neon = 0x02,
                use_lse = 0x04,
            };
            using flag_bitmask = std::true_type;
        };

        using codegen_flags = flags<flag_bits>;

        static constexpr codegen_flags all_flags() noexcept
        {
            return codegen_flags(flag_bits::use_crc32) | codegen_flags(flag_bits::use_neon) |
                   codegen_flags(flag_bits::use_lse);
        }

        /// Reads AT_HWCAP and AT_HWCAP2 on Linux. Does nothing elsewhere.
        static CAPGATE_API void probe(cpu_features &features) noexcept;
    };
} // namespace capgate::arch
