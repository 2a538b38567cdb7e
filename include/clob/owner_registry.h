#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "clob/error.h"
#include "clob/types.h"

namespace clob {

// Per-owner list of live order ids.
//
// Removal swaps the target with the last element and pops, using the index
// side-table to find the target in O(1). The array order is therefore NOT
// insertion order once anything has been removed.

class OwnerOrderRegistry {
public:
    void add(const Address& owner, OrderId id) {
        Entry& entry = entries_[owner];
        if (entry.index.count(id) != 0) {
            throw Error(ErrorCode::ItemAlreadyExists, "order " + std::to_string(id) + " already listed for " + owner);
        }
        entry.index.emplace(id, entry.ids.size());
        entry.ids.push_back(id);
    }

    void remove(const Address& owner, OrderId id) {
        auto eit = entries_.find(owner);
        if (eit == entries_.end()) {
            throw Error(ErrorCode::ItemDoesNotExist, "owner " + owner + " has no orders");
        }
        Entry& entry = eit->second;
        auto iit = entry.index.find(id);
        if (iit == entry.index.end()) {
            throw Error(ErrorCode::ItemDoesNotExist, "order " + std::to_string(id) + " not listed for " + owner);
        }

        const size_t pos = iit->second;
        const OrderId last = entry.ids.back();
        entry.ids[pos] = last;
        entry.index[last] = pos;
        entry.ids.pop_back();
        entry.index.erase(id);

        if (entry.ids.empty()) entries_.erase(eit);
    }

    const std::vector<OrderId>& orders_of(const Address& owner) const {
        static const std::vector<OrderId> none;
        auto it = entries_.find(owner);
        return it == entries_.end() ? none : it->second.ids;
    }

    bool contains(const Address& owner, OrderId id) const {
        auto it = entries_.find(owner);
        return it != entries_.end() && it->second.index.count(id) != 0;
    }

    size_t count(const Address& owner) const { return orders_of(owner).size(); }

    size_t index_of(const Address& owner, OrderId id) const {
        auto it = entries_.find(owner);
        if (it != entries_.end()) {
            auto iit = it->second.index.find(id);
            if (iit != it->second.index.end()) return iit->second;
        }
        throw Error(ErrorCode::ItemDoesNotExist, "order " + std::to_string(id) + " not listed for " + owner);
    }

    size_t owner_count() const { return entries_.size(); }

    size_t total() const {
        size_t n = 0;
        for (const auto& [owner, entry] : entries_) n += entry.ids.size();
        return n;
    }

private:
    struct Entry {
        std::vector<OrderId> ids;
        std::unordered_map<OrderId, size_t> index;  // ids[index[x]] == x
    };

    std::unordered_map<Address, Entry> entries_;
};

} // namespace clob
