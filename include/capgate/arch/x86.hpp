#pragma once

#include "../enum.hpp"
#include "../resolver.hpp"

namespace capgate::arch
{
    /**
     * Capability record filled by the x86 probe. One byte per flag; a flag the probe does not
     * touch stays zero and reads as absent.
     */
    struct x86_cpu_features
    {
        u8 cx8;
        u8 cmov;
        u8 fxsr;
        u8 ht;
        u8 mmx;
        u8 amd_3dnow_prefetch;
        u8 sse;
        u8 sse2;
        u8 sse3;
        u8 ssse3;
        u8 sse4a;
        u8 sse4_1;
        u8 sse4_2;
        u8 popcnt;
        u8 lzcnt;
        u8 tsc;
        u8 tscinv;
        u8 avx;
        u8 avx2;
        u8 aes;
        u8 erms;
        u8 clmul;
        u8 bmi1;
        u8 bmi2;
        u8 rtm;
        u8 adx;
        u8 avx512f;
        u8 avx512dq;
        u8 avx512pf;
        u8 avx512er;
        u8 avx512cd;
        u8 avx512bw;
        u8 avx512vl;
        u8 sha;
        u8 fma;
    };

    static_assert(std::is_standard_layout_v<x86_cpu_features>);
    static_assert(sizeof(x86_cpu_features) == 35);

    struct x86
    {
        static constexpr const char *name = "x86";

        enum class feature : u8
        {
            cx8,
            cmov,
            fxsr,
            ht,
            mmx,
            amd_3dnow_prefetch,
            sse,
            sse2,
            sse3,
            ssse3,
            sse4a,
            sse4_1,
            sse4_2,
            popcnt,
            lzcnt,
            tsc,
            tscinv,
            avx,
            avx2,
            aes,
            erms,
            clmul,
            bmi1,
            bmi2,
            rtm,
            adx,
            avx512f,
            avx512dq,
            avx512pf,
            avx512er,
            avx512cd,
            avx512bw,
            avx512vl,
            sha,
            fma
        };

        static constexpr size_t feature_count = 35;

        // Indexed by feature ordinal
        static constexpr const char *feature_names[feature_count] = {
            "CX8",      "CMOV",     "FXSR",     "HT",       "MMX",      "AMD_3DNOW_PREFETCH",
            "SSE",      "SSE2",     "SSE3",     "SSSE3",    "SSE4A",    "SSE4_1",
            "SSE4_2",   "POPCNT",   "LZCNT",    "TSC",      "TSCINV",   "AVX",
            "AVX2",     "AES",      "ERMS",     "CLMUL",    "BMI1",     "BMI2",
            "RTM",      "ADX",      "AVX512F",  "AVX512DQ", "AVX512PF", "AVX512ER",
            "AVX512CD", "AVX512BW", "AVX512VL", "SHA",      "FMA"};

        using cpu_features = x86_cpu_features;

        static constexpr flag_field<cpu_features> fields[] = {
            {"CX8", &cpu_features::cx8},
            {"CMOV", &cpu_features::cmov},
            {"FXSR", &cpu_features::fxsr},
            {"HT", &cpu_features::ht},
            {"MMX", &cpu_features::mmx},
            {"AMD_3DNOW_PREFETCH", &cpu_features::amd_3dnow_prefetch},
            {"SSE", &cpu_features::sse},
            {"SSE2", &cpu_features::sse2},
            {"SSE3", &cpu_features::sse3},
            {"SSSE3", &cpu_features::ssse3},
            {"SSE4A", &cpu_features::sse4a},
            {"SSE4_1", &cpu_features::sse4_1},
            {"SSE4_2", &cpu_features::sse4_2},
            {"POPCNT", &cpu_features::popcnt},
            {"LZCNT", &cpu_features::lzcnt},
            {"TSC", &cpu_features::tsc},
            {"TSCINV", &cpu_features::tscinv},
            {"AVX", &cpu_features::avx},
            {"AVX2", &cpu_features::avx2},
            {"AES", &cpu_features::aes},
            {"ERMS", &cpu_features::erms},
            {"CLMUL", &cpu_features::clmul},
            {"BMI1", &cpu_features::bmi1},
            {"BMI2", &cpu_features::bmi2},
            {"RTM", &cpu_features::rtm},
            {"ADX", &cpu_features::adx},
            {"AVX512F", &cpu_features::avx512f},
            {"AVX512DQ", &cpu_features::avx512dq},
            {"AVX512PF", &cpu_features::avx512pf},
            {"AVX512ER", &cpu_features::avx512er},
            {"AVX512CD", &cpu_features::avx512cd},
            {"AVX512BW", &cpu_features::avx512bw},
            {"AVX512VL", &cpu_features::avx512vl},
            {"SHA", &cpu_features::sha},
            {"FMA", &cpu_features::fma},
        };

        struct flag_bits
        {
            enum enum_type : u8
            {
                none = 0x00,
                use_count_leading_zeros_instruction = 0x01,
                use_count_trailing_zeros_instruction = 0x02,
            };
            using flag_bitmask = std::true_type;
        };

        using codegen_flags = flags<flag_bits>;

        /// Every flag that lets the compiler emit additional x86 instructions.
        static constexpr codegen_flags all_flags() noexcept
        {
            return codegen_flags(flag_bits::use_count_leading_zeros_instruction) |
                   codegen_flags(flag_bits::use_count_trailing_zeros_instruction);
        }

        /**
         * @brief Runs CPUID (and XGETBV when the OS enables it) and sets the matching flags.
         *
         * AVX-class flags are reported only when XCR0 shows the OS saves the YMM state, AVX-512 flags
         * only when it also saves the opmask and ZMM state. Does nothing on a non-x86 build.
         */
        static CAPGATE_API void probe(cpu_features &features) noexcept;
    };
} // namespace capgate::arch
