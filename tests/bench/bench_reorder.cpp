#include <benchmark/benchmark.h>
#include <dragkit/nested.hpp>
#include <dragkit/reorder.hpp>
#include <numeric>
#include <vector>

using namespace dragkit;

// ─── Flat reorder ────────────────────────────────────────────────────────────

static void BM_Reorder_FirstToLast(benchmark::State& state)
{
    const auto       n = static_cast<size_t>(state.range(0));
    std::vector<int> items(n);
    std::iota(items.begin(), items.end(), 0);

    for (auto _ : state)
    {
        reorder(ReorderMove<>{0, {n - 1, Placement::After}}, items);
        benchmark::DoNotOptimize(items.data());
    }
    state.SetComplexityN(state.range(0));
}
BENCHMARK(BM_Reorder_FirstToLast)->RangeMultiplier(8)->Range(8, 32768)->Complexity();

static void BM_Reorder_Adjacent(benchmark::State& state)
{
    std::vector<int> items(1024);
    std::iota(items.begin(), items.end(), 0);

    for (auto _ : state)
    {
        reorder(ReorderMove<>{500, {501, Placement::After}}, items);
        benchmark::DoNotOptimize(items.data());
    }
}
BENCHMARK(BM_Reorder_Adjacent);

// ─── Nested move ─────────────────────────────────────────────────────────────

static void BM_NestedMove_Across(benchmark::State& state)
{
    std::vector<std::vector<int>> lists(2, std::vector<int>(256));
    std::iota(lists[0].begin(), lists[0].end(), 0);
    std::iota(lists[1].begin(), lists[1].end(), 256);

    size_t from = 0;
    for (auto _ : state)
    {
        // Ping-pong the front element between the two lists.
        NestedMove move{{from, 0}, {{1 - from, size_t{0}}, Placement::Before}};
        apply_nested_move(lists, move);
        from = 1 - from;
        benchmark::DoNotOptimize(lists[0].data());
    }
}
BENCHMARK(BM_NestedMove_Across);

BENCHMARK_MAIN();
