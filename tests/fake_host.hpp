#pragma once

#include <capgate/arch/aarch64.hpp>
#include <capgate/arch/x86.hpp>
#include <capgate/feature_set.hpp>
#include <cstring>
#include <initializer_list>
#include <new>

// Probes backed by a global record so each test can stage the host it needs.
namespace fake
{
    template <typename Arch>
    struct host
    {
        static inline typename Arch::cpu_features record{};
        static inline int probe_calls = 0;

        static void reset()
        {
            std::memset(&record, 0, sizeof(record));
            probe_calls = 0;
        }

        static void set(std::initializer_list<typename Arch::feature> features)
        {
            reset();
            for (auto f : features)
                for (const auto &field : Arch::fields)
                    if (std::strcmp(field.name, capgate::feature_name<Arch>(f)) == 0) record.*(field.member) = 1;
        }

        static void probe(typename Arch::cpu_features &out)
        {
            ++probe_calls;
            out = record;
        }

        // Leaves the zeroed record alone
        static void silent_probe(typename Arch::cpu_features &) { ++probe_calls; }

        static void failing_read(typename Arch::cpu_features &)
        {
            ++probe_calls;
            throw std::bad_alloc();
        }

        // Sets every byte; used to detect a record that was not zeroed before the probe
        static void check_zeroed_probe(typename Arch::cpu_features &out)
        {
            ++probe_calls;
            const auto *bytes = reinterpret_cast<const unsigned char *>(&out);
            for (size_t i = 0; i < sizeof(out); ++i)
                if (bytes[i] != 0) return;
            out = record;
        }
    };

    using x86_host = host<capgate::arch::x86>;
    using aarch64_host = host<capgate::arch::aarch64>;
} // namespace fake
