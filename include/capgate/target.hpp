#pragma once

#include "feature_set.hpp"

namespace capgate
{
    /**
     * @brief Capabilities a compiled image was built for, and the set runtime compilation may use.
     *
     * The required set is fixed at construction. The runtime set starts as a copy of it and may only
     * grow (see feature_access::enable_features).
     */
    template <typename Arch>
    class target_description
    {
    public:
        using feature_set_type = feature_set<Arch>;
        using codegen_flags = typename Arch::codegen_flags;

        explicit target_description(const feature_set_type &required, codegen_flags flags = Arch::all_flags())
            : _required(required), _features(required), _flags(flags)
        {
        }

        const feature_set_type &required_features() const noexcept { return _required; }

        const feature_set_type &features() const noexcept { return _features; }
        feature_set_type &features() noexcept { return _features; }

        codegen_flags flags() const noexcept { return _flags; }

    private:
        const feature_set_type _required;
        feature_set_type _features;
        codegen_flags _flags;
    };
} // namespace capgate
