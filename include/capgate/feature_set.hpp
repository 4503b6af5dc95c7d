#pragma once

#include <optional>
#include "enum.hpp"
#include "exception/exception.hpp"
#include "string/utils.hpp"

namespace capgate
{
    template <typename Arch>
    using feature_set = enum_set<typename Arch::feature, Arch::feature_count>;

    template <typename Arch>
    const char *feature_name(typename Arch::feature feature) noexcept
    {
        return Arch::feature_names[static_cast<size_t>(feature)];
    }

    /// Case-insensitive lookup in the vocabulary of Arch.
    template <typename Arch>
    std::optional<typename Arch::feature> parse_feature(string_view name) noexcept
    {
        name = trim(name);
        for (size_t i = 0; i < Arch::feature_count; ++i)
            if (iequals(name, Arch::feature_names[i])) return static_cast<typename Arch::feature>(i);
        return std::nullopt;
    }

    /// @throws runtime_error naming every unknown entry
    template <typename Arch>
    feature_set<Arch> parse_feature_list(string_view text)
    {
        feature_set<Arch> result;
        vector<string> unknown;
        for (const string &item : split(text, ','))
        {
            if (auto feature = parse_feature<Arch>(item))
                result.add(*feature);
            else
                unknown.push_back(item);
        }
        if (!unknown.empty())
            throw runtime_error(format("Unknown %s CPU features: %s", Arch::name,
                                       bracket_list(unknown, [](const string &s) -> const string & { return s; })
                                           .c_str()));
        return result;
    }

    template <typename Arch>
    vector<string> feature_names(const feature_set<Arch> &set)
    {
        vector<string> names;
        names.reserve(set.size());
        for (auto feature : set) names.emplace_back(feature_name<Arch>(feature));
        return names;
    }

    /// Renders the set in ordinal order as "[A, B]".
    template <typename Arch>
    string to_string(const feature_set<Arch> &set)
    {
        return bracket_list(set, [](typename Arch::feature f) { return feature_name<Arch>(f); });
    }
} // namespace capgate
