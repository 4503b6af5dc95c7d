#include <capgate/level.hpp>

namespace capgate
{
    using x86_feature = arch::x86::feature;

    feature_set<arch::x86> level_features(x86_64_level level) noexcept
    {
        feature_set<arch::x86> features{x86_feature::cx8, x86_feature::cmov, x86_feature::fxsr,
                                        x86_feature::mmx, x86_feature::sse,  x86_feature::sse2};
        if (level == x86_64_level::v1) return features;

        features |= {x86_feature::sse3, x86_feature::ssse3, x86_feature::sse4_1, x86_feature::sse4_2,
                     x86_feature::popcnt};
        if (level == x86_64_level::v2) return features;

        features |= {x86_feature::avx,  x86_feature::avx2, x86_feature::bmi1,
                     x86_feature::bmi2, x86_feature::fma,  x86_feature::lzcnt};
        if (level == x86_64_level::v3) return features;

        features |= {x86_feature::avx512f, x86_feature::avx512bw, x86_feature::avx512cd, x86_feature::avx512dq,
                     x86_feature::avx512vl};
        return features;
    }

    const char *x86_64_level_name(x86_64_level level) noexcept
    {
        switch (level)
        {
            case x86_64_level::v1:
                return "x86-64-v1";
            case x86_64_level::v2:
                return "x86-64-v2";
            case x86_64_level::v3:
                return "x86-64-v3";
            case x86_64_level::v4:
                return "x86-64-v4";
            default:
                return "unknown";
        }
    }

    std::optional<x86_64_level> parse_x86_64_level(string_view text) noexcept
    {
        text = trim(text);
        for (string_view prefix : {string_view("x86-64-"), string_view("x86_64_")})
            if (text.size() > prefix.size() && iequals(text.substr(0, prefix.size()), prefix))
            {
                text.remove_prefix(prefix.size());
                break;
            }
        if (text.size() != 2 || (text[0] != 'v' && text[0] != 'V')) return std::nullopt;
        if (text[1] < '1' || text[1] > '4') return std::nullopt;
        return static_cast<x86_64_level>(text[1] - '0');
    }

    std::optional<x86_64_level> highest_level(const feature_set<arch::x86> &host) noexcept
    {
        std::optional<x86_64_level> result;
        for (auto level : {x86_64_level::v1, x86_64_level::v2, x86_64_level::v3, x86_64_level::v4})
        {
            if (!host.contains_all(level_features(level))) break;
            result = level;
        }
        return result;
    }
} // namespace capgate
