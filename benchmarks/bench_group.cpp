#include <benchmark/benchmark.h>

#include <cstdint>

#include <spdlog/spdlog.h>

#include <shardrt/core/group.hpp>
#include <shardrt/support/cpu_topology.hpp>
#include <shardrt/support/logging.hpp>

namespace {

// Start-to-join latency of a group whose entry does nothing.
static void BM_GroupRoundTrip(benchmark::State& state)
{
    shardrt::support::logger()->set_level(spdlog::level::warn);
    const auto shards = static_cast<std::size_t>(state.range(0));

    auto group = shardrt::core::group_builder{}
                     .affinity(shardrt::core::affinity_mode::none)
                     .shards(shards)
                     .worker_threads(1)
                     .entry([](shardrt::core::shard_context& ctx) { return ctx.shard_index(); });

    for (auto _ : state) {
        auto outcomes = group.run();
        benchmark::DoNotOptimize(outcomes.data());
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK(BM_GroupRoundTrip)->Arg(1)->Arg(4)->Arg(16)->UseRealTime();

// Same with every shard pinned to one allowed core.
static void BM_GroupRoundTripPinned(benchmark::State& state)
{
    shardrt::support::logger()->set_level(spdlog::level::warn);
    const auto cores = shardrt::support::allowed_cores();

    auto group = shardrt::core::group_builder{}
                     .topology(shardrt::support::single_node_topology(cores))
                     .worker_threads(1)
                     .entry([] {});

    for (auto _ : state) {
        auto outcomes = group.run();
        benchmark::DoNotOptimize(outcomes.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(cores.size()));
}

BENCHMARK(BM_GroupRoundTripPinned)->UseRealTime();

// Cost of a spawn/get pair on a shard runtime.
static void BM_ShardSpawn(benchmark::State& state)
{
    shardrt::core::runtime_options options;
    options.name = "bench";
    options.worker_threads = static_cast<std::size_t>(state.range(0));
    shardrt::core::runtime rt{options};

    for (auto _ : state) {
        auto f = rt.spawn([] { return 1; });
        benchmark::DoNotOptimize(f.get());
    }
}

BENCHMARK(BM_ShardSpawn)->Arg(1)->Arg(4)->UseRealTime();

} // namespace
