#include <benchmark/benchmark.h>
#include <chrono>
#include <string>
#include <vector>

#include "ipc/codec.hpp"
#include "ui/replica_store.hpp"
#include "ui/tab_drag_controller.hpp"
#include "util/fake_authority.hpp"

using namespace tabsync;
using tabsync::test::make_snapshot;
using tabsync::test::TabSpec;

namespace
{

std::vector<TabSpec> tab_specs(int64_t count)
{
    std::vector<TabSpec> specs;
    specs.push_back({"home", true});
    for (int64_t i = 1; i < count; ++i)
        specs.push_back({"tab-" + std::to_string(i)});
    return specs;
}

}   // namespace

// ─── Snapshot codec ──────────────────────────────────────────────────────────

static void BM_EncodeSnapshot(benchmark::State& state)
{
    auto snap = make_snapshot(tab_specs(state.range(0)), SnapshotReason::Routine, 1);
    for (auto _ : state)
    {
        auto bytes = ipc::encode_snapshot(snap);
        benchmark::DoNotOptimize(bytes.data());
    }
}
BENCHMARK(BM_EncodeSnapshot)->Arg(4)->Arg(20)->Arg(200)->Unit(benchmark::kMicrosecond);

static void BM_DecodeSnapshot(benchmark::State& state)
{
    auto bytes = ipc::encode_snapshot(make_snapshot(tab_specs(state.range(0)), SnapshotReason::Routine, 1));
    for (auto _ : state)
    {
        auto snap = ipc::decode_snapshot(bytes);
        benchmark::DoNotOptimize(snap);
    }
}
BENCHMARK(BM_DecodeSnapshot)->Arg(4)->Arg(20)->Arg(200)->Unit(benchmark::kMicrosecond);

// ─── Replica store ───────────────────────────────────────────────────────────

static void BM_ApplyIncoming(benchmark::State& state)
{
    EventLoop                 loop;
    test::FakeAuthority       auth(loop);
    ReplicaStore              store(loop, auth);
    auto                      specs = tab_specs(state.range(0));
    auto                      a     = make_snapshot(specs, SnapshotReason::Routine, 1);
    std::swap(specs[1], specs.back());
    auto b = make_snapshot(specs, SnapshotReason::Routine, 2);

    bool flip = false;
    for (auto _ : state)
    {
        benchmark::DoNotOptimize(store.apply_incoming(flip ? a : b));
        flip = !flip;
    }
}
BENCHMARK(BM_ApplyIncoming)->Arg(4)->Arg(20)->Arg(200)->Unit(benchmark::kMicrosecond);

static void BM_LocalReorder(benchmark::State& state)
{
    EventLoop           loop;
    test::FakeAuthority auth(loop);
    ReplicaStore        store(loop, auth);
    store.apply_incoming(make_snapshot(tab_specs(state.range(0)), SnapshotReason::Routine, 1));
    const size_t last = store.state().size() - 1;

    for (auto _ : state)
    {
        store.apply_local_reorder(1, last);
        store.apply_local_reorder(last, 1);
    }
    state.counters["reorders"] = static_cast<double>(store.stats().local_reorders);
}
BENCHMARK(BM_LocalReorder)->Arg(20)->Arg(200)->Unit(benchmark::kMicrosecond);

// ─── Drop index ──────────────────────────────────────────────────────────────

static void BM_ComputeDropIndex(benchmark::State& state)
{
    std::vector<Rect> rects;
    for (int64_t i = 0; i < state.range(0); ++i)
        rects.push_back(Rect{static_cast<float>(i) * 120.0f, 0.0f, 120.0f, 32.0f});
    const float far_right = static_cast<float>(state.range(0)) * 120.0f;

    for (auto _ : state)
    {
        benchmark::DoNotOptimize(compute_drop_index(rects, 1, far_right * 0.5f, 1));
    }
}
BENCHMARK(BM_ComputeDropIndex)->Arg(20)->Arg(200);
