#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "clob/assert.h"
#include "clob/book.h"
#include "clob/config.h"
#include "clob/error.h"
#include "clob/events.h"
#include "clob/ledger.h"
#include "clob/order_table.h"
#include "clob/owner_registry.h"
#include "clob/types.h"

namespace clob {

struct Fill {
    OrderId maker_order_id = EMPTY;
    Address maker;
    Price price = EMPTY;          // resting order's price, the trade price
    Quantity quantity = 0;
    bool maker_filled = false;    // resting order fully consumed
};

struct SubmitResult {
    OrderId order_id = EMPTY;
    OrderStatus status = OrderStatus::Created;
    Quantity filled_quantity = 0;
    Quantity resting_quantity = 0;
    Quantity dropped_quantity = 0;  // left unmatched because the per-call cap was hit
    std::vector<Fill> fills;
};

// Matching core for one instrument: bid and ask books, the order table and
// the per-owner registry, settled through a Ledger.
//
// Price-time priority: the opposite book is consumed best price first and,
// within a price, oldest order first. Trades print at the resting price.
//
// Every submit/cancel is all-or-nothing. Fills are planned against the books
// without touching them, settled through the ledger inside begin/commit, and
// only then applied, so a LedgerError leaves the engine exactly as it was.
//
// Not thread-safe; see SynchronizedEngine.
class MatchingEngine {
public:
    MatchingEngine(EngineConfig config, Ledger& ledger, EventListener* listener = nullptr)
        : config_(std::move(config)), ledger_(ledger), listener_(listener) {
        config_.validate();
    }

    MatchingEngine(const MatchingEngine&) = delete;
    MatchingEngine& operator=(const MatchingEngine&) = delete;

    SubmitResult submit(const Address& caller, Side side, Price price, Quantity quantity, Timestamp timestamp) {
        if (price == EMPTY) {
            throw Error(ErrorCode::InvalidPrice, "price must be positive");
        }
        if (quantity == 0) {
            throw Error(ErrorCode::InvalidQuantity, "quantity must be positive");
        }
        const OrderId id = make_order_id(caller, side, price, timestamp, nonce_);
        if (orders_.exists(id)) {
            throw Error(ErrorCode::OrderIdAlreadyExists, "order " + std::to_string(id));
        }

        SubmitResult result;
        result.order_id = id;

        // --- Plan: read-only walk of the opposite book ---
        const Book& opposite = book(clob::opposite(side));
        Quantity remaining = quantity;
        uint32_t processed = 0;
        bool capped = false;
        Price level = opposite.best_price();
        while (remaining > 0 && level != EMPTY && crosses(side, price, level)) {
            if (processed >= config_.max_orders_per_call) {
                capped = true;
                break;
            }
            OrderId resting_id = opposite.next_order_id_at_price(level);
            while (resting_id != EMPTY && remaining > 0 && processed < config_.max_orders_per_call) {
                const Order& resting = orders_.get(resting_id);
                if (remaining >= resting.available_quantity) {
                    result.fills.push_back(Fill{resting_id, resting.owner, level, resting.available_quantity, true});
                    remaining -= resting.available_quantity;
                    resting_id = opposite.next_order_id_after(level, resting_id);
                } else {
                    result.fills.push_back(Fill{resting_id, resting.owner, level, remaining, false});
                    remaining = 0;
                }
                ++processed;
            }
            if (resting_id == EMPTY) level = opposite.next_price(level);
        }

        const bool rests = remaining > 0 && !capped;
        result.filled_quantity = quantity - remaining;
        result.resting_quantity = rests ? remaining : 0;
        result.dropped_quantity = capped ? remaining : 0;
        if (remaining == 0) {
            result.status = OrderStatus::Filled;
        } else if (capped) {
            result.status = OrderStatus::Cancelled;
        } else {
            result.status = result.filled_quantity > 0 ? OrderStatus::PartiallyFilled : OrderStatus::Created;
        }

        // A resting remainder must fit its level's aggregate before any funds move.
        if (rests && book(side).has_level(price)) {
            const Quantity booked = book(side).level_stats(price).order_value;
            if (booked > std::numeric_limits<Quantity>::max() - remaining) {
                throw Error(ErrorCode::AmountOverflow, "level " + std::to_string(price) + " value exceeds 64 bits");
            }
        }

        // --- Settle ---
        ledger_.begin();
        try {
            for (const Fill& fill : result.fills) settle(side, caller, fill);
            if (rests) {
                Amount lock = locked_value(side, price, remaining);
                if (lock > 0) ledger_.transfer(locked_asset(side), caller, config_.escrow_account, lock);
            }
            ledger_.commit();
        } catch (...) {
            ledger_.rollback();
            throw;
        }

        // --- Apply ---
        ++nonce_;
        Book& other = book_mut(clob::opposite(side));
        for (const Fill& fill : result.fills) {
            if (fill.maker_filled) {
                const Order maker = orders_.get(fill.maker_order_id);
                other.remove(maker);
                orders_.erase(maker.id);
                owners_.remove(maker.owner, maker.id);
            } else {
                Order& maker = orders_.get_mutable(fill.maker_order_id);
                CLOB_ASSERT(maker.available_quantity > fill.quantity, "engine: partial fill consumed whole order");
                maker.available_quantity -= fill.quantity;
                maker.status = OrderStatus::PartiallyFilled;
                other.update(fill.price, fill.quantity);
            }
        }
        if (!result.fills.empty()) last_trade_price_ = result.fills.back().price;

        if (rests) {
            Order order;
            order.id = id;
            order.owner = caller;
            order.side = side;
            order.price = price;
            order.original_quantity = quantity;
            order.available_quantity = remaining;
            order.timestamp = timestamp;
            order.status = result.status;
            orders_.create(order);
            book_mut(side).insert(id, price, remaining);
            owners_.add(caller, id);
        }

        emit_submit(caller, side, price, quantity, result);
        return result;
    }

    void cancel(OrderId id, const Address& caller) {
        const Order order = orders_.get(id);
        if (caller != order.owner) {
            throw Error(ErrorCode::NotOrderOwner, caller + " does not own order " + std::to_string(id));
        }

        const Amount refund = locked_value(order.side, order.price, order.available_quantity);
        ledger_.begin();
        try {
            if (refund > 0) ledger_.transfer(locked_asset(order.side), config_.escrow_account, order.owner, refund);
            ledger_.commit();
        } catch (...) {
            ledger_.rollback();
            throw;
        }

        book_mut(order.side).remove(order);
        orders_.erase(id);
        owners_.remove(order.owner, id);

        Event e;
        e.type = EventType::OrderCanceled;
        e.order_id = id;
        e.owner = order.owner;
        e.side = order.side;
        e.price = order.price;
        e.quantity = order.available_quantity;
        e.remaining = 0;
        publish(e);
    }

    // --- Queries ---

    Price best_bid_price() const { return bids_.best_price(); }
    Price best_ask_price() const { return asks_.best_price(); }
    Price last_trade_price() const { return last_trade_price_; }

    std::vector<Price> top_n_prices(Side side, size_t n) const { return book(side).top_prices(n); }

    // Best three prices of one side, EMPTY where a level is missing.
    std::array<Price, 3> top3_prices(Side side) const {
        return book(side).top3_prices(side == Side::Buy ? Direction::Descending : Direction::Ascending);
    }

    const std::vector<OrderId>& orders_of(const Address& owner) const { return owners_.orders_of(owner); }
    const Order& order_detail(OrderId id) const { return orders_.get(id); }
    LevelStats level_stats(Price price, Side side) const { return book(side).level_stats(price); }
    std::vector<LevelStats> depth(Side side, size_t n) const { return book(side).depth(n); }

    size_t order_count() const { return orders_.size(); }
    const EngineConfig& config() const { return config_; }
    const Book& book(Side side) const { return side == Side::Buy ? bids_ : asks_; }

    // Cross-checks books, table and registry; any mismatch is fatal.
    void validate() const {
        bids_.validate();
        asks_.validate();
        const Price bid = bids_.best_price();
        const Price ask = asks_.best_price();
        CLOB_ASSERT(bid == EMPTY || ask == EMPTY || bid < ask, "engine: crossed book");

        uint64_t booked = 0;
        for (const Book* b : {&bids_, &asks_}) {
            for (const LevelStats& lvl : b->depth(b->level_count())) {
                booked += lvl.order_count;
                Quantity value = 0;
                for (OrderId id = b->next_order_id_at_price(lvl.price); id != EMPTY;
                     id = b->next_order_id_after(lvl.price, id)) {
                    value += orders_.get(id).available_quantity;
                }
                CLOB_ASSERT(value == lvl.order_value, "engine: level value out of sync");
            }
        }
        CLOB_ASSERT(booked == orders_.size(), "engine: booked orders differ from order table");
        CLOB_ASSERT(owners_.total() == orders_.size(), "engine: registry size differs from order table");

        for (const auto& [id, order] : orders_) {
            CLOB_ASSERT(order.available_quantity > 0, "engine: empty order kept");
            CLOB_ASSERT(order.available_quantity <= order.original_quantity, "engine: available above original");
            CLOB_ASSERT(book(order.side).contains(order.price, id), "engine: order missing from its level");
            CLOB_ASSERT(owners_.contains(order.owner, id), "engine: order missing from owner registry");
        }
    }

private:
    EngineConfig config_;
    Ledger& ledger_;
    EventListener* listener_;

    Book bids_{Side::Buy};
    Book asks_{Side::Sell};
    OrderTable orders_;
    OwnerOrderRegistry owners_;
    Price last_trade_price_ = EMPTY;
    uint64_t nonce_ = 0;  // accepted submits so far, folded into every order id

    Book& book_mut(Side side) { return side == Side::Buy ? bids_ : asks_; }

    static bool crosses(Side side, Price limit, Price book_price) {
        return side == Side::Buy ? limit >= book_price : limit <= book_price;
    }

    // Escrowed value of an order: quote for a buy, base for a sell.
    Amount locked_value(Side side, Price price, Quantity quantity) const {
        return side == Side::Buy ? quote_amount(quantity, price, config_.price_precision) : quantity;
    }

    // The taker pays the fee on the asset it receives.
    void settle(Side taker_side, const Address& taker, const Fill& fill) {
        const Amount quote = quote_amount(fill.quantity, fill.price, config_.price_precision);
        if (taker_side == Side::Buy) {
            const Amount fee = fee_amount(fill.quantity, config_.fee_bps);
            move(Asset::Base, config_.escrow_account, taker, fill.quantity - fee);
            if (fee > 0) ledger_.transfer_fee(Asset::Base, config_.fee_recipient, fee);
            move(Asset::Quote, taker, fill.maker, quote);
        } else {
            const Amount fee = fee_amount(quote, config_.fee_bps);
            move(Asset::Quote, config_.escrow_account, taker, quote - fee);
            if (fee > 0) ledger_.transfer_fee(Asset::Quote, config_.fee_recipient, fee);
            move(Asset::Base, taker, fill.maker, fill.quantity);
        }
    }

    void move(Asset asset, const Address& from, const Address& to, Amount amount) {
        if (amount > 0) ledger_.transfer(asset, from, to, amount);
    }

    void publish(const Event& e) {
        if (listener_ != nullptr) listener_->on_event(e);
    }

    void emit_submit(const Address& taker, Side side, Price price, Quantity quantity, const SubmitResult& result) {
        Event created;
        created.type = EventType::OrderCreated;
        created.order_id = result.order_id;
        created.owner = taker;
        created.side = side;
        created.price = price;
        created.quantity = quantity;
        created.remaining = quantity;
        publish(created);

        Quantity taker_left = quantity;
        for (const Fill& fill : result.fills) {
            const Order* maker = orders_.exists(fill.maker_order_id) ? &orders_.get(fill.maker_order_id) : nullptr;
            Event m;
            m.type = fill.maker_filled ? EventType::OrderFilled : EventType::OrderPartiallyFilled;
            m.order_id = fill.maker_order_id;
            m.owner = fill.maker;
            m.side = clob::opposite(side);
            m.price = fill.price;
            m.quantity = fill.quantity;
            m.remaining = maker != nullptr ? maker->available_quantity : 0;
            m.counterparty_id = result.order_id;
            m.counterparty = taker;
            publish(m);

            taker_left -= fill.quantity;
            Event t;
            t.type = taker_left == 0 ? EventType::OrderFilled : EventType::OrderPartiallyFilled;
            t.order_id = result.order_id;
            t.owner = taker;
            t.side = side;
            t.price = fill.price;
            t.quantity = fill.quantity;
            t.remaining = taker_left;
            t.counterparty_id = fill.maker_order_id;
            t.counterparty = fill.maker;
            publish(t);
        }

        if (result.dropped_quantity > 0) {
            Event dropped;
            dropped.type = EventType::OrderCanceled;
            dropped.order_id = result.order_id;
            dropped.owner = taker;
            dropped.side = side;
            dropped.price = price;
            dropped.quantity = result.dropped_quantity;
            dropped.remaining = 0;
            publish(dropped);
        }
    }
};

} // namespace clob
