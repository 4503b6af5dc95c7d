#pragma once

#include <cstring>
#include "feature_set.hpp"
#include "log.hpp"
#include "platform.hpp"
#include "resolver.hpp"
#include "target.hpp"

namespace capgate
{
    /**
     * @brief Host capability queries for one architecture vocabulary.
     *
     * Construct once at startup and pass by reference to whatever needs it. Construction validates the
     * resolver against the vocabulary and throws internal_error on a mismatch.
     */
    template <typename Arch>
    class feature_access
    {
    public:
        using record_type = typename Arch::cpu_features;
        using feature = typename Arch::feature;
        using feature_set_type = feature_set<Arch>;
        using target_type = target_description<Arch>;
        using probe_fn = void (*)(record_type &);

        explicit feature_access(probe_fn probe = &Arch::probe) : _probe(probe)
        {
            if (!_probe) throw runtime_error(format("No CPU feature probe installed for %s", Arch::name));
        }

        /**
         * @brief Probes the host once and returns every vocabulary feature it reports.
         *
         * The record is zeroed before the probe runs, so anything the probe leaves alone is absent.
         */
        feature_set_type enumerate_host_features() const
        {
            record_type record;
            std::memset(&record, 0, sizeof(record_type));
            _probe(record);

            feature_set_type features;
            for (size_t i = 0; i < Arch::feature_count; ++i)
            {
                auto f = static_cast<feature>(i);
                if (_resolver.is_present(f, record)) features.add(f);
            }
            return features;
        }

        /// Required features the host lacks, in the iteration order of the required set.
        vector<string> missing_features(const feature_set_type &required, const feature_set_type &host) const
        {
            vector<string> missing;
            for (auto f : required)
                if (!host.contains(f)) missing.emplace_back(feature_name<Arch>(f));
            return missing;
        }

        /// @throws unsupported_host_error listing every required feature the host lacks
        void verify_host_supports(const target_type &image) const
        {
            const feature_set_type host = enumerate_host_features();
            logDebug("%s host CPU features: %s", Arch::name, to_string<Arch>(host).c_str());
            if (host.contains_all(image.required_features())) return;
            throw unsupported_host_error(missing_features(image.required_features(), host));
        }

        /**
         * @brief Adds every host feature to the runtime feature set of the target.
         *
         * When the callee-saved register code is fixed at build time this does nothing: that code only
         * covers the registers of the build-time features, so runtime compilation keeps using the same
         * features as the image.
         */
        void enable_features(target_type &runtime, bool callee_saved_registers_fixed) const
        {
            // TODO: widen once the callee-saved register save/restore code accounts for runtime features.
            if (callee_saved_registers_fixed) return;
            const feature_set_type host = enumerate_host_features();
            runtime.features().add_all(host);
            logDebug("%s runtime CPU features: %s", Arch::name, to_string<Arch>(runtime.features()).c_str());
        }

        void enable_features(target_type &runtime) const
        {
            enable_features(runtime, callee_saved_registers_supported);
        }

        const flag_resolver<Arch> &resolver() const noexcept { return _resolver; }

    private:
        flag_resolver<Arch> _resolver;
        probe_fn _probe;
    };
} // namespace capgate
