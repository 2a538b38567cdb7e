#include "clob/matching_engine.h"
#include <gtest/gtest.h>

namespace {

using clob::Asset;
using clob::Side;

constexpr uint64_t E18 = clob::DEFAULT_PRECISION;

struct Market {
    clob::InMemoryLedger ledger;
    clob::RecordingEventListener events;
    clob::MatchingEngine engine;

    explicit Market(clob::EngineConfig cfg) : engine(std::move(cfg), ledger, &events) {
        for (const char* who : {"alice", "bob", "carol"}) {
            ledger.deposit(who, Asset::Base, 1'000'000);
            ledger.deposit(who, Asset::Quote, 1'000'000);
        }
    }
};

clob::EngineConfig with_fee(uint32_t bps, uint64_t precision = 1) {
    clob::EngineConfig cfg;
    cfg.price_precision = precision;
    cfg.fee_bps = bps;
    return cfg;
}

} // namespace

TEST(SettlementTest, BuyTakerPaysFeeInBase) {
    Market m(with_fee(25));
    m.engine.submit("bob", Side::Sell, 2, 1000, 1);
    m.engine.submit("alice", Side::Buy, 2, 1000, 2);

    // 1000 * 25 / 10000 = 2 base skimmed from what alice receives.
    EXPECT_EQ(m.ledger.balance("alice", Asset::Base), 1'000'000u + 998);
    EXPECT_EQ(m.ledger.balance("fees", Asset::Base), 2u);
    EXPECT_EQ(m.ledger.balance("alice", Asset::Quote), 1'000'000u - 2000);
    EXPECT_EQ(m.ledger.balance("bob", Asset::Quote), 1'000'000u + 2000);
    EXPECT_EQ(m.ledger.balance("escrow", Asset::Base), 0u);
}

TEST(SettlementTest, SellTakerPaysFeeInQuote) {
    Market m(with_fee(25));
    m.engine.submit("alice", Side::Buy, 2, 1000, 1);
    EXPECT_EQ(m.ledger.balance("escrow", Asset::Quote), 2000u);

    m.engine.submit("bob", Side::Sell, 2, 1000, 2);
    // 2000 * 25 / 10000 = 5 quote.
    EXPECT_EQ(m.ledger.balance("bob", Asset::Quote), 1'000'000u + 1995);
    EXPECT_EQ(m.ledger.balance("fees", Asset::Quote), 5u);
    EXPECT_EQ(m.ledger.balance("alice", Asset::Base), 1'000'000u + 1000);
    EXPECT_EQ(m.ledger.balance("escrow", Asset::Quote), 0u);
}

TEST(SettlementTest, FeeTruncatesToZeroOnSmallFills) {
    Market m(with_fee(30));
    m.engine.submit("bob", Side::Sell, 5, 33, 1);
    m.engine.submit("alice", Side::Buy, 5, 33, 2);
    // 33 * 30 / 10000 = 0.099 -> no fee transfer at all.
    EXPECT_EQ(m.ledger.balance("fees", Asset::Base), 0u);
    EXPECT_EQ(m.ledger.balance("alice", Asset::Base), 1'000'000u + 33);
    for (const auto& t : m.ledger.transfers()) EXPECT_FALSE(t.fee);
}

TEST(SettlementTest, QuoteAmountTruncatesWithEighteenDecimals) {
    Market m(with_fee(0, E18));
    const clob::Price one_and_half = 1'500'000'000'000'000'000ULL;
    m.engine.submit("bob", Side::Sell, one_and_half, 7, 1);
    m.engine.submit("alice", Side::Buy, one_and_half, 7, 2);

    // 7 * 1.5 = 10.5 -> 10
    EXPECT_EQ(m.ledger.balance("alice", Asset::Quote), 1'000'000u - 10);
    EXPECT_EQ(m.ledger.balance("bob", Asset::Quote), 1'000'000u + 10);
    EXPECT_EQ(m.ledger.balance("alice", Asset::Base), 1'000'000u + 7);
}

TEST(SettlementTest, SubUnitQuoteRoundsToNothing) {
    Market m(with_fee(0, E18));
    const clob::Price third = 333'333'333'333'333'333ULL;
    m.engine.submit("bob", Side::Sell, third, 3, 1);
    m.ledger.clear_transfers();
    m.engine.submit("alice", Side::Buy, third, 3, 2);

    // 3 * 0.333... = 0.999... -> 0, so only the base leg moves.
    ASSERT_EQ(m.ledger.transfers().size(), 1u);
    EXPECT_EQ(m.ledger.transfers()[0].asset, Asset::Base);
    EXPECT_EQ(m.ledger.balance("alice", Asset::Quote), 1'000'000u);
    EXPECT_EQ(m.ledger.balance("alice", Asset::Base), 1'000'000u + 3);
}

TEST(SettlementTest, EscrowKeepsDustAcrossPartialFills) {
    Market m(with_fee(0, E18));
    const clob::Price one_and_half = 1'500'000'000'000'000'000ULL;

    auto bid = m.engine.submit("alice", Side::Buy, one_and_half, 10, 1);
    EXPECT_EQ(m.ledger.balance("escrow", Asset::Quote), 15u);

    m.engine.submit("bob", Side::Sell, one_and_half, 3, 2);    // 4.5 -> 4
    m.engine.submit("carol", Side::Sell, one_and_half, 3, 3);  // 4.5 -> 4
    EXPECT_EQ(m.ledger.balance("bob", Asset::Quote), 1'000'000u + 4);
    EXPECT_EQ(m.ledger.balance("carol", Asset::Quote), 1'000'000u + 4);
    EXPECT_EQ(m.engine.order_detail(bid.order_id).available_quantity, 4u);

    m.engine.cancel(bid.order_id, "alice");  // 4 * 1.5 = 6
    EXPECT_EQ(m.ledger.balance("alice", Asset::Quote), 1'000'000u - 15 + 6);
    EXPECT_EQ(m.ledger.balance("escrow", Asset::Quote), 1u);
}

TEST(SettlementTest, LedgerFailureMidSweepChangesNothing) {
    Market m(with_fee(10));
    auto a = m.engine.submit("bob", Side::Sell, 100, 5, 1);
    auto b = m.engine.submit("carol", Side::Sell, 101, 5, 2);
    m.events.clear();
    const auto transfers_before = m.ledger.transfers().size();

    // The fee rounds to zero here, so each fill moves two legs and the
    // fourth transfer is the second fill's quote leg.
    m.ledger.fail_after(4);
    EXPECT_THROW(m.engine.submit("alice", Side::Buy, 101, 10, 3), clob::LedgerError);

    EXPECT_EQ(m.engine.order_count(), 2u);
    EXPECT_EQ(m.engine.order_detail(a.order_id).available_quantity, 5u);
    EXPECT_EQ(m.engine.order_detail(b.order_id).available_quantity, 5u);
    EXPECT_EQ(m.engine.best_ask_price(), 100u);
    EXPECT_EQ(m.engine.level_stats(100, Side::Sell).order_value, 5u);
    EXPECT_EQ(m.engine.last_trade_price(), clob::EMPTY);
    EXPECT_TRUE(m.engine.orders_of("alice").empty());
    EXPECT_TRUE(m.events.events().empty());

    EXPECT_EQ(m.ledger.transfers().size(), transfers_before);
    EXPECT_EQ(m.ledger.balance("alice", Asset::Base), 1'000'000u);
    EXPECT_EQ(m.ledger.balance("alice", Asset::Quote), 1'000'000u);
    EXPECT_EQ(m.ledger.balance("bob", Asset::Quote), 1'000'000u);
    EXPECT_EQ(m.ledger.balance("escrow", Asset::Base), 10u);
    EXPECT_EQ(m.ledger.balance("fees", Asset::Base), 0u);
    m.engine.validate();

    // Same order goes through once the ledger recovers.
    auto r = m.engine.submit("alice", Side::Buy, 101, 10, 3);
    EXPECT_EQ(r.filled_quantity, 10u);
    EXPECT_EQ(m.engine.order_count(), 0u);
}

TEST(SettlementTest, InsufficientFundsRejectsRestingOrder) {
    Market m(with_fee(0));
    EXPECT_THROW(m.engine.submit("dave", Side::Buy, 100, 10, 1), clob::LedgerError);
    EXPECT_EQ(m.engine.order_count(), 0u);
    EXPECT_EQ(m.engine.best_bid_price(), clob::EMPTY);
    EXPECT_TRUE(m.events.events().empty());
}

TEST(SettlementTest, LedgerFailureOnCancelKeepsOrder) {
    Market m(with_fee(0));
    auto r = m.engine.submit("alice", Side::Buy, 100, 10, 1);
    m.events.clear();

    m.ledger.fail_after(1);
    EXPECT_THROW(m.engine.cancel(r.order_id, "alice"), clob::LedgerError);
    EXPECT_EQ(m.engine.order_detail(r.order_id).available_quantity, 10u);
    EXPECT_EQ(m.engine.orders_of("alice").size(), 1u);
    EXPECT_EQ(m.ledger.balance("escrow", Asset::Quote), 1000u);
    EXPECT_TRUE(m.events.events().empty());

    m.engine.cancel(r.order_id, "alice");
    EXPECT_EQ(m.ledger.balance("alice", Asset::Quote), 1'000'000u);
}

TEST(SettlementTest, OverflowingLockIsRejected) {
    Market m(with_fee(0));
    try {
        m.engine.submit("alice", Side::Buy, 1ULL << 40, 1ULL << 30, 1);
        FAIL() << "overflowing order accepted";
    } catch (const clob::Error& e) {
        EXPECT_EQ(e.code(), clob::ErrorCode::AmountOverflow);
    }
    EXPECT_EQ(m.engine.order_count(), 0u);
    EXPECT_EQ(m.ledger.balance("alice", Asset::Quote), 1'000'000u);
}

TEST(SettlementTest, LevelValueOverflowRejectedBeforeFundsMove) {
    clob::InMemoryLedger ledger;
    clob::MatchingEngine engine(with_fee(0, E18), ledger);
    const clob::Quantity ten_tokens = 10 * E18;
    ledger.deposit("alice", Asset::Base, ten_tokens);
    ledger.deposit("bob", Asset::Base, ten_tokens);
    ledger.deposit("carol", Asset::Quote, 5 * E18);

    auto first = engine.submit("alice", Side::Sell, E18, ten_tokens, 1);
    try {
        engine.submit("bob", Side::Sell, E18, ten_tokens, 2);
        FAIL() << "level aggregate wrapped";
    } catch (const clob::Error& e) {
        EXPECT_EQ(e.code(), clob::ErrorCode::AmountOverflow);
    }
    EXPECT_EQ(ledger.balance("bob", Asset::Base), ten_tokens);
    EXPECT_EQ(engine.level_stats(E18, Side::Sell).order_count, 1u);
    EXPECT_EQ(engine.level_stats(E18, Side::Sell).order_value, ten_tokens);
    engine.validate();

    // The surviving level still fills normally.
    auto r = engine.submit("carol", Side::Buy, E18, 5 * E18, 3);
    EXPECT_EQ(r.filled_quantity, 5 * E18);
    EXPECT_EQ(engine.order_detail(first.order_id).available_quantity, 5 * E18);
    EXPECT_EQ(engine.level_stats(E18, Side::Sell).order_value, 5 * E18);
    EXPECT_EQ(ledger.balance("carol", Asset::Base), 5 * E18);
    EXPECT_EQ(ledger.balance("alice", Asset::Quote), 5 * E18);
    engine.validate();
}

TEST(SettlementTest, LargeOrdersShareLevelWhileSumFits) {
    clob::InMemoryLedger ledger;
    clob::MatchingEngine engine(with_fee(0, E18), ledger);
    const clob::Quantity eight_tokens = 8 * E18;
    ledger.deposit("alice", Asset::Base, eight_tokens);
    ledger.deposit("bob", Asset::Base, eight_tokens);

    engine.submit("alice", Side::Sell, E18, eight_tokens, 1);
    engine.submit("bob", Side::Sell, E18, eight_tokens, 2);
    EXPECT_EQ(engine.level_stats(E18, Side::Sell).order_count, 2u);
    EXPECT_EQ(engine.level_stats(E18, Side::Sell).order_value, 2 * eight_tokens);
    EXPECT_EQ(ledger.balance("escrow", Asset::Base), 2 * eight_tokens);
    engine.validate();
}

TEST(InMemoryLedgerTest, BalanceOverflowIsRejected) {
    clob::InMemoryLedger ledger;
    ledger.deposit("alice", Asset::Base, UINT64_MAX - 5);
    EXPECT_THROW(ledger.deposit("alice", Asset::Base, 6), clob::LedgerError);
    EXPECT_EQ(ledger.balance("alice", Asset::Base), UINT64_MAX - 5);

    ledger.deposit("bob", Asset::Base, 10);
    ledger.begin();
    EXPECT_THROW(ledger.transfer(Asset::Base, "bob", "alice", 10), clob::LedgerError);
    ledger.rollback();
    EXPECT_EQ(ledger.balance("bob", Asset::Base), 10u);
    EXPECT_EQ(ledger.balance("alice", Asset::Base), UINT64_MAX - 5);

    ledger.transfer(Asset::Base, "bob", "alice", 5);
    EXPECT_EQ(ledger.balance("alice", Asset::Base), UINT64_MAX);
}

TEST(InMemoryLedgerTest, RecordingCanBeTurnedOff) {
    clob::InMemoryLedger ledger;
    ledger.deposit("alice", Asset::Quote, 100);
    ledger.set_recording(false);
    ledger.transfer(Asset::Quote, "alice", "bob", 40);
    EXPECT_TRUE(ledger.transfers().empty());
    EXPECT_EQ(ledger.balance("bob", Asset::Quote), 40u);

    ledger.set_recording(true);
    ledger.transfer(Asset::Quote, "alice", "bob", 10);
    ASSERT_EQ(ledger.transfers().size(), 1u);
    EXPECT_EQ(ledger.transfers()[0].amount, 10u);
}
