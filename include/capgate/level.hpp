#pragma once

#include <optional>
#include "arch/x86.hpp"
#include "feature_set.hpp"

namespace capgate
{
    /// x86-64 psABI microarchitecture levels.
    enum class x86_64_level : u8
    {
        v1 = 1,
        v2,
        v3,
        v4
    };

    /**
     * @brief Features of the level that the x86 vocabulary can express.
     *
     * CX16, LAHF-SAHF, F16C, MOVBE and OSXSAVE are part of the levels but not of the vocabulary.
     */
    CAPGATE_API feature_set<arch::x86> level_features(x86_64_level level) noexcept;

    CAPGATE_API const char *x86_64_level_name(x86_64_level level) noexcept;

    /// Accepts "x86-64-v3", "x86_64_v3" or "v3".
    CAPGATE_API std::optional<x86_64_level> parse_x86_64_level(string_view text) noexcept;

    /// @return the highest level whose features the host reports, or nothing below v1
    CAPGATE_API std::optional<x86_64_level> highest_level(const feature_set<arch::x86> &host) noexcept;
} // namespace capgate
