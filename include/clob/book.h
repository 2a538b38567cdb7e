#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <unordered_map>
#include <vector>

#include "clob/assert.h"
#include "clob/error.h"
#include "clob/price_index.h"
#include "clob/price_level_queue.h"
#include "clob/types.h"

namespace clob {

enum class Direction : uint8_t { Ascending, Descending };

struct LevelStats {
    Price price = EMPTY;
    uint64_t order_count = 0;
    Quantity order_value = 0;
};

// One side of the market: a PriceIndex plus price -> level.
//
// A price is in the index exactly when its level queue is non-empty, and each
// level's order_count/order_value always equal the count and summed available
// quantity of the orders queued there. Bids rank best at the maximum price,
// asks at the minimum.

class Book {
public:
    explicit Book(Side side) : side_(side) {}

    Side side() const { return side_; }

    void insert(OrderId id, Price price, Quantity quantity) {
        if (id == EMPTY) {
            throw Error(ErrorCode::InvalidOrderId, "cannot book order id 0");
        }
        if (quantity == 0) {
            throw Error(ErrorCode::InvalidQuantity, "cannot book an empty order");
        }
        auto it = levels_.find(price);
        if (it != levels_.end() && it->second.queue.exists(id)) {
            throw Error(ErrorCode::ItemAlreadyExists, "order " + std::to_string(id) + " already booked");
        }
        if (it != levels_.end() && it->second.order_value > std::numeric_limits<Quantity>::max() - quantity) {
            throw Error(ErrorCode::AmountOverflow, "level " + std::to_string(price) + " value exceeds 64 bits");
        }

        index_.insert(price);
        Level& level = it != levels_.end() ? it->second : levels_[price];
        level.queue.push(id);
        level.order_count += 1;
        level.order_value += quantity;
    }

    void remove(const Order& order) {
        auto it = levels_.find(order.price);
        if (it == levels_.end()) {
            throw Error(ErrorCode::LevelNotFound, "no level at " + std::to_string(order.price));
        }
        Level& level = it->second;
        level.queue.remove(order.id);

        CLOB_ASSERT(level.order_count > 0, "book: level count underflow");
        CLOB_ASSERT(level.order_value >= order.available_quantity, "book: level value underflow");
        level.order_count -= 1;
        level.order_value -= order.available_quantity;

        if (level.queue.empty()) {
            CLOB_ASSERT(level.order_count == 0 && level.order_value == 0, "book: empty level with residual aggregates");
            levels_.erase(it);
            index_.remove(order.price);
        }
    }

    // A resting order at price was partly consumed but stays queued.
    void update(Price price, Quantity delta) {
        Level& level = level_at(price);
        CLOB_ASSERT(level.order_value >= delta, "book: level value underflow");
        level.order_value -= delta;
    }

    Price best_price() const { return side_ == Side::Buy ? index_.max() : index_.min(); }

    // Next price away from the touch, EMPTY past the last level.
    Price next_price(Price price) const {
        return side_ == Side::Buy ? index_.predecessor(price) : index_.successor(price);
    }

    OrderId next_order_id_at_price(Price price) const { return level_at(price).queue.head(); }

    OrderId next_order_id_after(Price price, OrderId id) const { return level_at(price).queue.next(id); }

    std::array<Price, 3> top3_prices(Direction direction) const {
        std::array<Price, 3> out{EMPTY, EMPTY, EMPTY};
        Price p = direction == Direction::Ascending ? index_.min() : index_.max();
        for (size_t i = 0; i < out.size() && p != EMPTY; ++i) {
            out[i] = p;
            p = direction == Direction::Ascending ? index_.successor(p) : index_.predecessor(p);
        }
        return out;
    }

    // Best-first, padded with EMPTY up to n entries.
    std::vector<Price> top_prices(size_t n) const {
        std::vector<Price> out(n, EMPTY);
        Price p = best_price();
        for (size_t i = 0; i < n && p != EMPTY; ++i) {
            out[i] = p;
            p = next_price(p);
        }
        return out;
    }

    LevelStats level_stats(Price price) const {
        const Level& level = level_at(price);
        return LevelStats{price, level.order_count, level.order_value};
    }

    // Best-first aggregates for at most n levels.
    std::vector<LevelStats> depth(size_t n) const {
        std::vector<LevelStats> out;
        for (Price p = best_price(); p != EMPTY && out.size() < n; p = next_price(p)) {
            out.push_back(level_stats(p));
        }
        return out;
    }

    bool has_level(Price price) const { return index_.exists(price); }
    bool contains(Price price, OrderId id) const {
        auto it = levels_.find(price);
        return it != levels_.end() && it->second.queue.exists(id);
    }
    size_t level_count() const { return levels_.size(); }
    bool empty() const { return index_.empty(); }

    const PriceIndex& index() const { return index_; }

    // Index/level agreement and per-level counts, for tests and engine checks.
    void validate() const {
        index_.validate();
        CLOB_ASSERT(index_.size() == levels_.size(), "book: index and level map disagree");
        for (const auto& [price, level] : levels_) {
            CLOB_ASSERT(index_.exists(price), "book: level missing from index");
            CLOB_ASSERT(!level.queue.empty(), "book: empty level kept");
            CLOB_ASSERT(level.order_count == level.queue.size(), "book: level count out of sync");
        }
    }

private:
    struct Level {
        PriceLevelQueue queue;
        uint64_t order_count = 0;
        Quantity order_value = 0;
    };

    Side side_;
    PriceIndex index_;
    std::unordered_map<Price, Level> levels_;

    const Level& level_at(Price price) const {
        auto it = levels_.find(price);
        if (it == levels_.end()) {
            throw Error(ErrorCode::LevelNotFound, "no level at " + std::to_string(price));
        }
        return it->second;
    }

    Level& level_at(Price price) {
        auto it = levels_.find(price);
        if (it == levels_.end()) {
            throw Error(ErrorCode::LevelNotFound, "no level at " + std::to_string(price));
        }
        return it->second;
    }
};

} // namespace clob
