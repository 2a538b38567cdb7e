#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>

#include "clob/error.h"
#include "clob/types.h"

namespace clob {

// id -> Order. The only place order fields live; books and registries hold ids.
class OrderTable {
public:
    using const_iterator = std::unordered_map<OrderId, Order>::const_iterator;

    bool exists(OrderId id) const { return orders_.count(id) != 0; }
    size_t size() const { return orders_.size(); }

    void create(const Order& order) {
        if (order.id == EMPTY) {
            throw Error(ErrorCode::InvalidOrderId, "order id 0 is reserved");
        }
        if (!orders_.emplace(order.id, order).second) {
            throw Error(ErrorCode::OrderIdAlreadyExists, "order " + std::to_string(order.id));
        }
    }

    const Order& get(OrderId id) const {
        auto it = orders_.find(id);
        if (it == orders_.end()) missing(id);
        return it->second;
    }

    Order& get_mutable(OrderId id) {
        auto it = orders_.find(id);
        if (it == orders_.end()) missing(id);
        return it->second;
    }

    void erase(OrderId id) {
        if (orders_.erase(id) == 0) missing(id);
    }

    const_iterator begin() const { return orders_.begin(); }
    const_iterator end() const { return orders_.end(); }

private:
    std::unordered_map<OrderId, Order> orders_;

    [[noreturn]] static void missing(OrderId id) {
        throw Error(ErrorCode::OrderIdDoesNotExist, "order " + std::to_string(id));
    }
};

} // namespace clob
