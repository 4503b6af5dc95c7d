#include <benchmark/benchmark.h>

#include <capgate/arch/host.hpp>
#include <capgate/feature_access.hpp>
#include <capgate/level.hpp>

using namespace capgate;

static void BM_probe_host(benchmark::State &state)
{
    for (auto _ : state)
    {
        arch::host::cpu_features record{};
        arch::host::probe(record);
        benchmark::DoNotOptimize(record);
    }
}
BENCHMARK(BM_probe_host);

static void BM_enumerate_host_features(benchmark::State &state)
{
    feature_access<arch::host> access;
    for (auto _ : state)
    {
        auto features = access.enumerate_host_features();
        benchmark::DoNotOptimize(features);
    }
}
BENCHMARK(BM_enumerate_host_features);

static void BM_resolve_by_name(benchmark::State &state)
{
    flag_resolver<arch::host> resolver;
    arch::host::cpu_features record{};
    arch::host::probe(record);
    for (auto _ : state)
    {
        size_t present = 0;
        for (const char *name : arch::host::feature_names) present += resolver.resolve(name, record);
        benchmark::DoNotOptimize(present);
    }
}
BENCHMARK(BM_resolve_by_name);

static void BM_enable_features(benchmark::State &state)
{
    feature_access<arch::host> access;
    for (auto _ : state)
    {
        target_description<arch::host> runtime(feature_set<arch::host>{});
        access.enable_features(runtime, false);
        auto features = runtime.features();
        benchmark::DoNotOptimize(features);
    }
}
BENCHMARK(BM_enable_features);

BENCHMARK_MAIN();
