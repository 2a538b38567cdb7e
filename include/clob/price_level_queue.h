#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>

#include "clob/assert.h"
#include "clob/error.h"
#include "clob/types.h"

namespace clob {

// FIFO of order ids at one price. The prev/next links are stored beside each
// id in a map rather than in heap nodes, so removal by id is an O(1) splice.
// Matching always takes head(), which is what gives time priority.

class PriceLevelQueue {
public:
    struct Link {
        OrderId prev = EMPTY;
        OrderId next = EMPTY;
    };

    bool empty() const { return head_ == EMPTY; }
    bool exists(OrderId id) const { return id != EMPTY && links_.count(id) != 0; }
    size_t size() const { return links_.size(); }

    OrderId head() const { return head_; }
    OrderId tail() const { return tail_; }

    OrderId next(OrderId id) const { return link(id).next; }
    OrderId prev(OrderId id) const { return link(id).prev; }

    void push(OrderId id) {
        if (id == EMPTY) {
            throw Error(ErrorCode::InvalidOrderId, "cannot queue order id 0");
        }
        if (links_.count(id) != 0) {
            throw Error(ErrorCode::ItemAlreadyExists, "order " + std::to_string(id) + " already queued");
        }
        links_.emplace(id, Link{tail_, EMPTY});
        if (tail_ != EMPTY) {
            links_.at(tail_).next = id;
        } else {
            head_ = id;
        }
        tail_ = id;
    }

    void remove(OrderId id) {
        if (empty()) {
            throw Error(ErrorCode::EmptyQueue, "remove from empty queue");
        }
        auto it = links_.find(id);
        if (it == links_.end()) {
            throw Error(ErrorCode::ItemDoesNotExist, "order " + std::to_string(id) + " not queued");
        }
        const Link self = it->second;

        if (self.prev != EMPTY) {
            Link& p = neighbour(self.prev);
            CLOB_ASSERT(p.next == id, "level queue: prev neighbour does not link back");
            p.next = self.next;
        } else {
            CLOB_ASSERT(head_ == id, "level queue: headless node is not the head");
            head_ = self.next;
        }

        if (self.next != EMPTY) {
            Link& n = neighbour(self.next);
            CLOB_ASSERT(n.prev == id, "level queue: next neighbour does not link back");
            n.prev = self.prev;
        } else {
            CLOB_ASSERT(tail_ == id, "level queue: tailless node is not the tail");
            tail_ = self.prev;
        }

        links_.erase(it);
    }

private:
    std::unordered_map<OrderId, Link> links_;
    OrderId head_ = EMPTY;
    OrderId tail_ = EMPTY;

    const Link& link(OrderId id) const {
        auto it = links_.find(id);
        if (it == links_.end()) {
            throw Error(ErrorCode::ItemDoesNotExist, "order " + std::to_string(id) + " not queued");
        }
        return it->second;
    }

    Link& neighbour(OrderId id) {
        auto it = links_.find(id);
        CLOB_ASSERT(it != links_.end(), "level queue: dangling neighbour link");
        return it->second;
    }
};

} // namespace clob
