#pragma once
#include <cstdint>
#include <limits>
#include <string>

#include "clob/error.h"

namespace clob {

using Price = uint64_t;     // fixed-point, see EngineConfig::price_precision
using Quantity = uint64_t;
using Amount = uint64_t;
using OrderId = uint64_t;
using Timestamp = uint64_t;
using Address = std::string;

// Price 0 and order id 0 are never valid, so 0 doubles as "none".
constexpr uint64_t EMPTY = 0;

constexpr uint64_t DEFAULT_PRECISION = 1'000'000'000'000'000'000ULL;  // 1e18
constexpr uint64_t BPS_DENOMINATOR = 10'000;
constexpr uint32_t DEFAULT_MAX_ORDERS_PER_CALL = 1500;

enum class Side : uint8_t { Buy, Sell };
enum class Asset : uint8_t { Base, Quote };

enum class OrderStatus : uint8_t {
    Created,
    PartiallyFilled,
    Filled,
    Cancelled,
};

inline Side opposite(Side side) { return side == Side::Buy ? Side::Sell : Side::Buy; }

inline const char* to_string(Side side) { return side == Side::Buy ? "BUY" : "SELL"; }

inline const char* to_string(Asset asset) { return asset == Asset::Base ? "BASE" : "QUOTE"; }

inline const char* to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::Created: return "CREATED";
        case OrderStatus::PartiallyFilled: return "PARTIALLY_FILLED";
        case OrderStatus::Filled: return "FILLED";
        case OrderStatus::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

// Buy orders lock quote, sell orders lock base.
inline Asset locked_asset(Side side) { return side == Side::Buy ? Asset::Quote : Asset::Base; }

struct Order {
    OrderId id = EMPTY;
    Address owner;
    Side side = Side::Buy;
    Price price = EMPTY;
    Quantity original_quantity = 0;
    Quantity available_quantity = 0;
    Timestamp timestamp = 0;
    OrderStatus status = OrderStatus::Created;
};

// --- Fixed-point math --------------------------------------------------------
// 128-bit intermediates, truncated toward zero.

inline Amount quote_amount(Quantity quantity, Price price, uint64_t precision) {
    unsigned __int128 wide = static_cast<unsigned __int128>(quantity) * price / precision;
    if (wide > std::numeric_limits<Amount>::max()) {
        throw Error(ErrorCode::AmountOverflow, "quote amount exceeds 64 bits");
    }
    return static_cast<Amount>(wide);
}

inline Amount fee_amount(Amount amount, uint32_t fee_bps) {
    return static_cast<Amount>(static_cast<unsigned __int128>(amount) * fee_bps / BPS_DENOMINATOR);
}

// --- Order ids ---------------------------------------------------------------

// splitmix64 finalizer
inline uint64_t mix64(uint64_t x) {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
}

// hash(owner, side, price, timestamp, nonce). The nonce is owned by the engine
// and advances once per accepted submit, so identical requests still get
// distinct ids and a removed id is never handed out again. Never returns EMPTY.
inline OrderId make_order_id(const Address& owner, Side side, Price price, Timestamp timestamp, uint64_t nonce) {
    uint64_t h = 0xcbf29ce484222325ULL;  // FNV-1a over the owner bytes
    for (unsigned char c : owner) {
        h ^= c;
        h *= 0x100000001b3ULL;
    }
    h = mix64(h ^ (side == Side::Buy ? 0x5bd1e995ULL : 0x1b873593ULL));
    h = mix64(h ^ price);
    h = mix64(h ^ timestamp);
    h = mix64(h ^ nonce);
    return h == EMPTY ? 1 : h;
}

} // namespace clob
