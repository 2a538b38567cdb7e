#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

#include "clob/types.h"

namespace clob {

enum class EventType : uint8_t {
    OrderCreated,
    OrderCanceled,
    OrderFilled,
    OrderPartiallyFilled,
};

inline const char* to_string(EventType type) {
    switch (type) {
        case EventType::OrderCreated: return "OrderCreated";
        case EventType::OrderCanceled: return "OrderCanceled";
        case EventType::OrderFilled: return "OrderFilled";
        case EventType::OrderPartiallyFilled: return "OrderPartiallyFilled";
    }
    return "Unknown";
}

// One audit record. For fills, price/quantity are the trade's and the
// counterparty fields name the other side; remaining is what the order still
// has open after the event.
struct Event {
    EventType type = EventType::OrderCreated;
    OrderId order_id = EMPTY;
    Address owner;
    Side side = Side::Buy;
    Price price = EMPTY;
    Quantity quantity = 0;
    Quantity remaining = 0;
    OrderId counterparty_id = EMPTY;
    Address counterparty;
};

class EventListener {
public:
    virtual ~EventListener() = default;
    virtual void on_event(const Event& event) = 0;
};

class RecordingEventListener : public EventListener {
public:
    void on_event(const Event& event) override { events_.push_back(event); }

    const std::vector<Event>& events() const { return events_; }
    void clear() { events_.clear(); }

    // Hands over everything recorded so far and starts empty.
    std::vector<Event> take() {
        std::vector<Event> out;
        out.swap(events_);
        return out;
    }

    size_t count(EventType type) const {
        size_t n = 0;
        for (const auto& e : events_) n += e.type == type ? 1 : 0;
        return n;
    }

private:
    std::vector<Event> events_;
};

inline std::string format_event(const Event& e) {
    char buf[256];
    int len = std::snprintf(buf, sizeof(buf), "%s id=%016llx owner=%s side=%s px=%llu qty=%llu rem=%llu",
                            to_string(e.type), static_cast<unsigned long long>(e.order_id), e.owner.c_str(),
                            to_string(e.side), static_cast<unsigned long long>(e.price),
                            static_cast<unsigned long long>(e.quantity),
                            static_cast<unsigned long long>(e.remaining));
    std::string out(buf, len > 0 ? std::min(static_cast<size_t>(len), sizeof(buf) - 1) : 0);
    if (e.counterparty_id != EMPTY) {
        std::snprintf(buf, sizeof(buf), " cp=%016llx cp_owner=%s",
                      static_cast<unsigned long long>(e.counterparty_id), e.counterparty.c_str());
        out += buf;
    }
    return out;
}

// One line per event.
class LoggingEventListener : public EventListener {
public:
    explicit LoggingEventListener(std::FILE* out = stderr) : out_(out) {}

    void on_event(const Event& event) override {
        std::fprintf(out_, "[event] %s\n", format_event(event).c_str());
    }

private:
    std::FILE* out_;
};

} // namespace clob
