#include "clob/config.h"
#include "clob/events.h"
#include "clob/ledger.h"
#include "clob/matching_engine.h"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <random>
#include <string>
#include <vector>

// Replays a seeded random order flow against an in-memory ledger and prints
// throughput and the final book.
//
//   clob_sim [orders] [seed] [-v]
//
// CLOB_PRECISION, CLOB_FEE_BPS and CLOB_MAX_ORDERS_PER_CALL override the
// engine config.

namespace {

struct Options {
    uint64_t orders = 1'000'000;
    uint64_t seed = 42;
    bool verbose = false;
};

Options parse_args(int argc, char** argv) {
    Options opt;
    int positional = 0;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0) {
            opt.verbose = true;
        } else if (positional == 0) {
            opt.orders = clob::parse_u64("orders", argv[i]);
            ++positional;
        } else if (positional == 1) {
            opt.seed = clob::parse_u64("seed", argv[i]);
            ++positional;
        } else {
            throw clob::Error(clob::ErrorCode::InvalidConfig, std::string("unexpected argument: ") + argv[i]);
        }
    }
    return opt;
}

// Counts events and forwards them to the log when verbose.
class SimListener : public clob::EventListener {
public:
    explicit SimListener(bool verbose) : verbose_(verbose) {}

    void on_event(const clob::Event& event) override {
        ++counts_[static_cast<size_t>(event.type)];
        if (verbose_) log_.on_event(event);
    }

    uint64_t count(clob::EventType type) const { return counts_[static_cast<size_t>(type)]; }

private:
    bool verbose_;
    clob::LoggingEventListener log_{stdout};
    uint64_t counts_[4] = {};
};

int run(const Options& opt) {
    clob::EngineConfig cfg;
    cfg.price_precision = 1;
    clob::apply_env_overrides(cfg);

    const std::vector<std::string> traders = {"alice", "bob", "carol", "dave", "erin", "frank", "grace", "heidi"};
    const clob::Amount funds = 1ULL << 60;
    clob::InMemoryLedger ledger(cfg.escrow_account);
    ledger.set_recording(false);
    for (const auto& t : traders) {
        ledger.deposit(t, clob::Asset::Base, funds);
        ledger.deposit(t, clob::Asset::Quote, funds);
    }

    SimListener listener(opt.verbose);
    clob::MatchingEngine engine(cfg, ledger, &listener);

    // Prices scatter +-20 ticks around a fixed mid so both books stay populated.
    std::mt19937_64 rng(opt.seed);
    std::uniform_int_distribution<clob::Quantity> qty(1, 100);
    std::uniform_int_distribution<int> offset(-20, 20);
    const clob::Price mid = 10'000;

    uint64_t submitted = 0;
    uint64_t cancelled = 0;
    uint64_t rejected = 0;
    uint64_t fills = 0;

    auto t0 = std::chrono::high_resolution_clock::now();
    for (uint64_t i = 0; i < opt.orders; ++i) {
        const auto& who = traders[rng() % traders.size()];
        if (rng() % 10 == 0) {
            const auto& mine = engine.orders_of(who);
            if (!mine.empty()) {
                engine.cancel(mine[rng() % mine.size()], who);
                ++cancelled;
                continue;
            }
        }
        clob::Side side = rng() % 2 == 0 ? clob::Side::Buy : clob::Side::Sell;
        clob::Price price = static_cast<clob::Price>(static_cast<int64_t>(mid) + offset(rng));
        try {
            auto r = engine.submit(who, side, price, qty(rng), i + 1);
            fills += r.fills.size();
            ++submitted;
        } catch (const clob::Error& e) {
            std::fprintf(stderr, "order %lu rejected: %s\n", i, e.what());
            ++rejected;
        }
    }
    auto t1 = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration<double, std::milli>(t1 - t0).count();

    engine.validate();

    std::printf("%lu operations in %.1f ms (%.0f ns/op)\n", opt.orders, ms,
                opt.orders ? ms * 1e6 / static_cast<double>(opt.orders) : 0.0);
    std::printf("submitted=%lu cancelled=%lu rejected=%lu fills=%lu resting=%zu\n", submitted, cancelled, rejected,
                fills, engine.order_count());
    std::printf("events: created=%lu filled=%lu partial=%lu canceled=%lu\n",
                listener.count(clob::EventType::OrderCreated), listener.count(clob::EventType::OrderFilled),
                listener.count(clob::EventType::OrderPartiallyFilled),
                listener.count(clob::EventType::OrderCanceled));
    std::printf("best bid=%lu ask=%lu last=%lu fees=%lu/%lu\n", engine.best_bid_price(), engine.best_ask_price(),
                engine.last_trade_price(), ledger.balance(cfg.fee_recipient, clob::Asset::Base),
                ledger.balance(cfg.fee_recipient, clob::Asset::Quote));

    std::printf("%8s %10s %8s | %8s %10s %8s\n", "bid", "qty", "orders", "ask", "qty", "orders");
    auto bids = engine.depth(clob::Side::Buy, 5);
    auto asks = engine.depth(clob::Side::Sell, 5);
    for (size_t i = 0; i < std::max(bids.size(), asks.size()); ++i) {
        if (i < bids.size()) {
            std::printf("%8lu %10lu %8lu | ", bids[i].price, bids[i].order_value, bids[i].order_count);
        } else {
            std::printf("%8s %10s %8s | ", "", "", "");
        }
        if (i < asks.size()) {
            std::printf("%8lu %10lu %8lu\n", asks[i].price, asks[i].order_value, asks[i].order_count);
        } else {
            std::printf("\n");
        }
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        return run(parse_args(argc, argv));
    } catch (const clob::Error& e) {
        std::fprintf(stderr, "error: %s\n", e.what());
    } catch (const clob::LedgerError& e) {
        std::fprintf(stderr, "ledger error: %s\n", e.what());
    }
    return 1;
}
