#pragma once

#include <array>
#include "exception/exception.hpp"
#include "scalars.hpp"
#include "string/utils.hpp"

namespace capgate
{
    /// One resolver case: the stable feature name and the record member holding its flag.
    template <typename Record>
    struct flag_field
    {
        const char *name;
        u8 Record::*member;
    };

    /**
     * @brief Maps feature names of an architecture vocabulary to flags in its capability record.
     *
     * Lookup goes by name so the vocabulary and the record layout may evolve separately. The
     * constructor checks that every vocabulary entry has a case and throws internal_error naming
     * each uncovered entry otherwise. After that check, per-ordinal lookup is a table access.
     */
    template <typename Arch>
    class flag_resolver
    {
    public:
        using record_type = typename Arch::cpu_features;
        using feature = typename Arch::feature;
        using accessor = u8 record_type::*;

        flag_resolver()
        {
            vector<string> uncovered;
            for (size_t i = 0; i < Arch::feature_count; ++i)
            {
                const flag_field<record_type> *field = find(Arch::feature_names[i]);
                if (field)
                    _accessors[i] = field->member;
                else
                {
                    _accessors[i] = nullptr;
                    uncovered.emplace_back(Arch::feature_names[i]);
                }
            }
            if (!uncovered.empty())
                throw internal_error(format("Missing feature check: %s",
                                            bracket_list(uncovered, [](const string &s) -> const string & {
                                                return s;
                                            }).c_str()));
        }

        /// @throws internal_error when no case exists for the name
        bool resolve(string_view name, const record_type &record) const
        {
            const flag_field<record_type> *field = find(name);
            if (!field)
                throw internal_error(
                    format("Missing feature check: %.*s", static_cast<int>(name.size()), name.data()));
            return record.*(field->member) != 0;
        }

        bool is_present(feature f, const record_type &record) const noexcept
        {
            return record.*(_accessors[static_cast<size_t>(f)]) != 0;
        }

    private:
        std::array<accessor, Arch::feature_count> _accessors;

        static const flag_field<record_type> *find(string_view name) noexcept
        {
            for (const auto &field : Arch::fields)
                if (name == field.name) return &field;
            return nullptr;
        }
    };
} // namespace capgate
