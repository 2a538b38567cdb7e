#pragma once
#include <array>
#include <cstddef>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

#include "clob/matching_engine.h"

namespace clob {

// One writer per instrument: submit/cancel take the lock exclusively so no
// two of them interleave, queries share it. Results are returned by value
// because references into the engine would outlive the lock.
//
// A call's events are collected under the lock and handed to the listener
// after it is released, so a listener may query the engine. Events of one
// call arrive in order; batches from concurrent calls may arrive in either
// order.
class SynchronizedEngine {
public:
    SynchronizedEngine(EngineConfig config, Ledger& ledger, EventListener* listener = nullptr)
        : listener_(listener), engine_(std::move(config), ledger, &pending_) {}

    SubmitResult submit(const Address& caller, Side side, Price price, Quantity quantity, Timestamp timestamp) {
        SubmitResult result;
        std::vector<Event> batch;
        {
            std::unique_lock lock(mtx_);
            result = engine_.submit(caller, side, price, quantity, timestamp);
            batch = pending_.take();
        }
        deliver(batch);
        return result;
    }

    void cancel(OrderId id, const Address& caller) {
        std::vector<Event> batch;
        {
            std::unique_lock lock(mtx_);
            engine_.cancel(id, caller);
            batch = pending_.take();
        }
        deliver(batch);
    }

    Price best_bid_price() const {
        std::shared_lock lock(mtx_);
        return engine_.best_bid_price();
    }

    Price best_ask_price() const {
        std::shared_lock lock(mtx_);
        return engine_.best_ask_price();
    }

    Price last_trade_price() const {
        std::shared_lock lock(mtx_);
        return engine_.last_trade_price();
    }

    std::vector<Price> top_n_prices(Side side, size_t n) const {
        std::shared_lock lock(mtx_);
        return engine_.top_n_prices(side, n);
    }

    std::vector<OrderId> orders_of(const Address& owner) const {
        std::shared_lock lock(mtx_);
        return engine_.orders_of(owner);
    }

    Order order_detail(OrderId id) const {
        std::shared_lock lock(mtx_);
        return engine_.order_detail(id);
    }

    LevelStats level_stats(Price price, Side side) const {
        std::shared_lock lock(mtx_);
        return engine_.level_stats(price, side);
    }

    std::vector<LevelStats> depth(Side side, size_t n) const {
        std::shared_lock lock(mtx_);
        return engine_.depth(side, n);
    }

    size_t order_count() const {
        std::shared_lock lock(mtx_);
        return engine_.order_count();
    }

    void validate() const {
        std::shared_lock lock(mtx_);
        engine_.validate();
    }

private:
    mutable std::shared_mutex mtx_;
    EventListener* listener_;
    RecordingEventListener pending_;  // filled by engine_, drained under mtx_
    MatchingEngine engine_;

    void deliver(const std::vector<Event>& batch) {
        if (listener_ == nullptr) return;
        for (const Event& e : batch) listener_->on_event(e);
    }
};

} // namespace clob
