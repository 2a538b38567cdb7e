#include "clob/matching_engine.h"
#include "clob/price_index.h"
#include <benchmark/benchmark.h>
#include <random>
#include <set>
#include <vector>

// Shared setup: n distinct random prices
static std::vector<clob::Price> make_prices(size_t n, uint64_t seed = 42) {
    std::mt19937_64 rng(seed);
    std::set<clob::Price> seen;
    std::vector<clob::Price> prices;
    prices.reserve(n);
    while (prices.size() < n) {
        clob::Price p = rng() % (n * 16) + 1;
        if (seen.insert(p).second) prices.push_back(p);
    }
    return prices;
}

// --- std::set (baseline) ---

static void BM_StdSet_InsertRemove(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    auto prices = make_prices(n);
    for (auto _ : state) {
        std::set<clob::Price> s;
        for (auto p : prices) s.insert(p);
        for (auto p : prices) s.erase(p);
        benchmark::DoNotOptimize(s);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n) * 2);
}
BENCHMARK(BM_StdSet_InsertRemove)->Arg(1 << 10)->Arg(1 << 14);

static void BM_StdSet_Min(benchmark::State& state) {
    auto prices = make_prices(static_cast<size_t>(state.range(0)));
    std::set<clob::Price> s(prices.begin(), prices.end());
    for (auto _ : state) {
        auto v = *s.begin();
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_StdSet_Min)->Arg(1 << 14);

// --- PriceIndex ---

static void BM_PriceIndex_InsertRemove(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    auto prices = make_prices(n);
    for (auto _ : state) {
        clob::PriceIndex index;
        for (auto p : prices) index.insert(p);
        for (auto p : prices) index.remove(p);
        benchmark::DoNotOptimize(index);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n) * 2);
}
BENCHMARK(BM_PriceIndex_InsertRemove)->Arg(1 << 10)->Arg(1 << 14);

static void BM_PriceIndex_Min(benchmark::State& state) {
    auto prices = make_prices(static_cast<size_t>(state.range(0)));
    clob::PriceIndex index;
    for (auto p : prices) index.insert(p);
    for (auto _ : state) {
        auto v = index.min();
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_PriceIndex_Min)->Arg(1 << 14);

static void BM_PriceIndex_Successor(benchmark::State& state) {
    auto prices = make_prices(static_cast<size_t>(state.range(0)));
    clob::PriceIndex index;
    for (auto p : prices) index.insert(p);

    constexpr int BATCH = 1024;
    std::vector<clob::Price> keys(prices.begin(), prices.begin() + BATCH);
    int idx = 0;
    for (auto _ : state) {
        auto v = index.successor(keys[idx]);
        benchmark::DoNotOptimize(v);
        idx = (idx + 1) & (BATCH - 1);
    }
}
BENCHMARK(BM_PriceIndex_Successor)->Arg(1 << 14);

// --- Engine ---

namespace {

struct BenchMarket {
    clob::InMemoryLedger ledger;
    clob::MatchingEngine engine;

    BenchMarket() : engine(config(), ledger) {
        for (const char* who : {"maker", "taker"}) {
            ledger.deposit(who, clob::Asset::Base, 1ULL << 60);
            ledger.deposit(who, clob::Asset::Quote, 1ULL << 60);
        }
    }

    static clob::EngineConfig config() {
        clob::EngineConfig cfg;
        cfg.price_precision = 1;
        cfg.fee_bps = 5;
        return cfg;
    }
};

} // namespace

// Non-crossing flow: every order rests, the ask book grows over 256 levels.
static void BM_Engine_SubmitResting(benchmark::State& state) {
    BenchMarket m;
    clob::Timestamp ts = 0;
    for (auto _ : state) {
        ++ts;
        auto r = m.engine.submit("maker", clob::Side::Sell, 1000 + ts % 256, 10, ts);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Engine_SubmitResting);

// Each taker order fully consumes one resting order placed in the same
// iteration, so the book stays flat.
static void BM_Engine_SubmitCrossing(benchmark::State& state) {
    BenchMarket m;
    for (clob::Timestamp t = 1; t <= 1000; ++t) {
        m.engine.submit("maker", clob::Side::Sell, 2000 + t % 64, 10, t);
    }
    clob::Timestamp ts = 1000;
    for (auto _ : state) {
        ++ts;
        m.engine.submit("maker", clob::Side::Sell, 1000, 10, ts);
        auto r = m.engine.submit("taker", clob::Side::Buy, 1000, 10, ts);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(BM_Engine_SubmitCrossing);

// One taker sweeps `range(0)` resting orders across 16 levels.
static void BM_Engine_Sweep(benchmark::State& state) {
    const int64_t depth = state.range(0);
    BenchMarket m;
    clob::Timestamp ts = 0;
    for (auto _ : state) {
        state.PauseTiming();
        for (int64_t i = 0; i < depth; ++i) {
            ++ts;
            m.engine.submit("maker", clob::Side::Sell, 1000 + static_cast<clob::Price>(i % 16), 1, ts);
        }
        state.ResumeTiming();
        ++ts;
        auto r = m.engine.submit("taker", clob::Side::Buy, 1015, static_cast<clob::Quantity>(depth), ts);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * depth);
}
BENCHMARK(BM_Engine_Sweep)->Arg(16)->Arg(256)->Arg(1024);

BENCHMARK_MAIN();
