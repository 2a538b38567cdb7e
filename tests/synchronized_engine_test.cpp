#include "clob/synchronized_engine.h"
#include <gtest/gtest.h>
#include <atomic>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace {

using clob::Asset;
using clob::Side;

constexpr clob::Amount FUNDS = 1'000'000'000;
constexpr int THREADS = 4;
constexpr int ORDERS_PER_THREAD = 2000;

std::string trader(int i) { return "trader" + std::to_string(i); }

} // namespace

TEST(SynchronizedEngineTest, ConcurrentWritersKeepBookConsistent) {
    clob::InMemoryLedger ledger;
    for (int t = 0; t < THREADS; ++t) {
        ledger.deposit(trader(t), Asset::Base, FUNDS);
        ledger.deposit(trader(t), Asset::Quote, FUNDS);
    }
    clob::EngineConfig cfg;
    cfg.price_precision = 1;
    cfg.fee_bps = 10;
    clob::SynchronizedEngine engine(cfg, ledger);

    std::atomic<uint64_t> fills{0};
    std::atomic<uint64_t> cancels{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&, t] {
            const std::string me = trader(t);
            std::mt19937_64 rng(100 + t);
            std::uniform_int_distribution<clob::Price> price(90, 110);
            std::uniform_int_distribution<clob::Quantity> qty(1, 50);
            for (int i = 0; i < ORDERS_PER_THREAD; ++i) {
                const clob::Timestamp ts = static_cast<clob::Timestamp>(i) + 1;
                if (rng() % 4 == 0) {
                    auto mine = engine.orders_of(me);
                    if (mine.empty()) continue;
                    try {
                        engine.cancel(mine[rng() % mine.size()], me);
                        cancels.fetch_add(1, std::memory_order_relaxed);
                    } catch (const clob::Error& e) {
                        // Filled by another thread between the two calls.
                        EXPECT_EQ(e.code(), clob::ErrorCode::OrderIdDoesNotExist);
                    }
                    continue;
                }
                Side side = rng() % 2 == 0 ? Side::Buy : Side::Sell;
                auto r = engine.submit(me, side, price(rng), qty(rng), ts);
                fills.fetch_add(r.fills.size(), std::memory_order_relaxed);
            }
        });
    }
    for (auto& w : workers) w.join();

    engine.validate();
    EXPECT_GT(fills.load(), 0u);
    EXPECT_GT(cancels.load(), 0u);

    clob::Price bid = engine.best_bid_price();
    clob::Price ask = engine.best_ask_price();
    if (bid != clob::EMPTY && ask != clob::EMPTY) EXPECT_LT(bid, ask);

    // Nothing is created or destroyed: every unit is with a trader, in escrow
    // or with the fee recipient.
    for (Asset asset : {Asset::Base, Asset::Quote}) {
        clob::Amount total = ledger.balance("escrow", asset) + ledger.balance("fees", asset);
        for (int t = 0; t < THREADS; ++t) total += ledger.balance(trader(t), asset);
        EXPECT_EQ(total, FUNDS * THREADS) << clob::to_string(asset);
    }
}

TEST(SynchronizedEngineTest, QueriesReturnSnapshots) {
    clob::InMemoryLedger ledger;
    ledger.deposit("alice", Asset::Quote, 10'000);
    clob::EngineConfig cfg;
    cfg.price_precision = 1;
    clob::SynchronizedEngine engine(cfg, ledger);

    auto r = engine.submit("alice", Side::Buy, 100, 10, 1);
    auto ids = engine.orders_of("alice");
    clob::Order detail = engine.order_detail(r.order_id);

    engine.cancel(r.order_id, "alice");
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_EQ(ids[0], r.order_id);
    EXPECT_EQ(detail.available_quantity, 10u);
    EXPECT_TRUE(engine.orders_of("alice").empty());
    EXPECT_EQ(engine.order_count(), 0u);
    EXPECT_EQ(ledger.balance("alice", Asset::Quote), 10'000u);
}

namespace {

// Reads the engine from inside on_event.
class QueryingListener : public clob::EventListener {
public:
    void on_event(const clob::Event& event) override {
        seen.push_back(event.type);
        best_bids.push_back(engine->best_bid_price());
        resting.push_back(engine->order_count());
    }

    clob::SynchronizedEngine* engine = nullptr;
    std::vector<clob::EventType> seen;
    std::vector<clob::Price> best_bids;
    std::vector<size_t> resting;
};

} // namespace

TEST(SynchronizedEngineTest, ListenerSeesCommittedStateAfterUnlock) {
    clob::InMemoryLedger ledger;
    ledger.deposit("alice", Asset::Quote, 10'000);
    ledger.deposit("bob", Asset::Base, 100);
    clob::EngineConfig cfg;
    cfg.price_precision = 1;
    QueryingListener listener;
    clob::SynchronizedEngine engine(cfg, ledger, &listener);
    listener.engine = &engine;

    auto r = engine.submit("alice", Side::Buy, 100, 10, 1);
    ASSERT_EQ(listener.seen.size(), 1u);
    EXPECT_EQ(listener.seen[0], clob::EventType::OrderCreated);
    EXPECT_EQ(listener.best_bids[0], 100u);
    EXPECT_EQ(listener.resting[0], 1u);

    // Created, then one event per side of the fill; the bid is gone by then.
    engine.submit("bob", Side::Sell, 100, 10, 2);
    ASSERT_EQ(listener.seen.size(), 4u);
    for (size_t i = 1; i < 4; ++i) {
        EXPECT_EQ(listener.best_bids[i], clob::EMPTY);
        EXPECT_EQ(listener.resting[i], 0u);
    }

    EXPECT_THROW(engine.cancel(r.order_id, "alice"), clob::Error);
    EXPECT_EQ(listener.seen.size(), 4u);
}
