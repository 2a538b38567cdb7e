#pragma once
#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "clob/error.h"
#include "clob/types.h"

namespace clob {

// Custody collaborator. The engine computes every amount and fee and picks
// the asset from the order side; a Ledger only moves balances it already
// holds. Rejections are reported by throwing LedgerError.
//
// begin/commit/rollback bracket each state-changing engine call. A host whose
// storage is transactional maps them onto its transaction; the engine itself
// applies nothing to the book until commit() has returned.
class Ledger {
public:
    virtual ~Ledger() = default;

    virtual void transfer(Asset asset, const Address& from, const Address& to, Amount amount) = 0;

    // Moves a fee out of escrow to `to`.
    virtual void transfer_fee(Asset asset, const Address& to, Amount amount) = 0;

    virtual void begin() {}
    virtual void commit() {}
    virtual void rollback() {}
};

// Balance map used by the tests and the simulator. Moves inside a
// begin/commit bracket are journaled and undone by rollback().
class InMemoryLedger : public Ledger {
public:
    struct Transfer {
        Asset asset;
        Address from;
        Address to;
        Amount amount;
        bool fee;
    };

    explicit InMemoryLedger(Address escrow = "escrow") : escrow_(std::move(escrow)) {}

    const Address& escrow() const { return escrow_; }

    void deposit(const Address& owner, Asset asset, Amount amount) {
        Amount& slot = balances_[{owner, asset}];
        if (slot > std::numeric_limits<Amount>::max() - amount) {
            throw LedgerError("deposit overflows " + owner + " " + to_string(asset));
        }
        slot += amount;
    }

    Amount balance(const Address& owner, Asset asset) const {
        auto it = balances_.find({owner, asset});
        return it == balances_.end() ? 0 : it->second;
    }

    // The n-th transfer from now (1-based) throws. 0 disables.
    void fail_after(size_t n) { fail_countdown_ = n; }

    // Long simulations turn the transfer log off; balances are unaffected.
    void set_recording(bool on) { recording_ = on; }

    const std::vector<Transfer>& transfers() const { return transfers_; }
    void clear_transfers() { transfers_.clear(); }

    void transfer(Asset asset, const Address& from, const Address& to, Amount amount) override {
        move(asset, from, to, amount, false);
    }

    void transfer_fee(Asset asset, const Address& to, Amount amount) override {
        move(asset, escrow_, to, amount, true);
    }

    void begin() override {
        in_batch_ = true;
        journal_.clear();
        batch_start_ = transfers_.size();
    }

    void commit() override {
        in_batch_ = false;
        journal_.clear();
    }

    void rollback() override {
        for (auto it = journal_.rbegin(); it != journal_.rend(); ++it) {
            balances_[it->first] = it->second;
        }
        journal_.clear();
        transfers_.erase(transfers_.begin() + static_cast<std::ptrdiff_t>(batch_start_), transfers_.end());
        in_batch_ = false;
    }

private:
    using Key = std::pair<Address, Asset>;

    Address escrow_;
    std::map<Key, Amount> balances_;
    std::vector<std::pair<Key, Amount>> journal_;  // previous values, oldest first
    std::vector<Transfer> transfers_;
    size_t batch_start_ = 0;
    size_t fail_countdown_ = 0;
    bool in_batch_ = false;
    bool recording_ = true;

    void move(Asset asset, const Address& from, const Address& to, Amount amount, bool fee) {
        if (fail_countdown_ != 0 && --fail_countdown_ == 0) {
            throw LedgerError("injected failure moving " + std::to_string(amount) + " " + to_string(asset));
        }
        const Key src{from, asset};
        const Key dst{to, asset};
        const Amount have = balance(from, asset);
        if (have < amount) {
            throw LedgerError(from + " holds " + std::to_string(have) + " " + to_string(asset) +
                              ", needs " + std::to_string(amount));
        }
        const Amount dst_have = balance(to, asset);
        if (from != to && dst_have > std::numeric_limits<Amount>::max() - amount) {
            throw LedgerError(to + " balance of " + to_string(asset) + " would exceed 64 bits");
        }
        if (in_batch_) {
            journal_.emplace_back(src, have);
            journal_.emplace_back(dst, dst_have);
        }
        balances_[src] = have - amount;
        balances_[dst] += amount;
        if (recording_) transfers_.push_back(Transfer{asset, from, to, amount, fee});
    }
};

} // namespace clob
