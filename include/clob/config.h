#pragma once
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "clob/error.h"
#include "clob/types.h"

namespace clob {

struct EngineConfig {
    uint64_t price_precision = DEFAULT_PRECISION;
    uint32_t fee_bps = 0;
    uint32_t max_orders_per_call = DEFAULT_MAX_ORDERS_PER_CALL;  // resting orders consumed per submit
    Address escrow_account = "escrow";
    Address fee_recipient = "fees";
    std::string base_symbol = "BASE";
    std::string quote_symbol = "QUOTE";

    void validate() const {
        if (price_precision == 0) {
            throw Error(ErrorCode::InvalidConfig, "price_precision must be positive");
        }
        if (fee_bps > BPS_DENOMINATOR) {
            throw Error(ErrorCode::InvalidConfig, "fee_bps above 10000: " + std::to_string(fee_bps));
        }
        if (max_orders_per_call == 0) {
            throw Error(ErrorCode::InvalidConfig, "max_orders_per_call must be positive");
        }
        if (escrow_account.empty()) {
            throw Error(ErrorCode::InvalidConfig, "escrow_account is empty");
        }
        if (fee_recipient.empty()) {
            throw Error(ErrorCode::InvalidConfig, "fee_recipient is empty");
        }
    }
};

// Strict decimal parse; the whole string must be a number.
inline uint64_t parse_u64(const std::string& name, const char* text) {
    if (text == nullptr || *text == '\0' || *text == '-') {
        throw Error(ErrorCode::InvalidConfig, name + ": expected an unsigned integer");
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0') {
        throw Error(ErrorCode::InvalidConfig, name + ": expected an unsigned integer, got '" + text + "'");
    }
    return static_cast<uint64_t>(v);
}

// CLOB_PRECISION, CLOB_FEE_BPS, CLOB_MAX_ORDERS_PER_CALL override the
// corresponding fields when set and non-empty.
inline void apply_env_overrides(EngineConfig& cfg) {
    if (const char* v = std::getenv("CLOB_PRECISION"); v && *v) {
        cfg.price_precision = parse_u64("CLOB_PRECISION", v);
    }
    if (const char* v = std::getenv("CLOB_FEE_BPS"); v && *v) {
        uint64_t bps = parse_u64("CLOB_FEE_BPS", v);
        if (bps > BPS_DENOMINATOR) {
            throw Error(ErrorCode::InvalidConfig, "CLOB_FEE_BPS above 10000");
        }
        cfg.fee_bps = static_cast<uint32_t>(bps);
    }
    if (const char* v = std::getenv("CLOB_MAX_ORDERS_PER_CALL"); v && *v) {
        uint64_t n = parse_u64("CLOB_MAX_ORDERS_PER_CALL", v);
        if (n > UINT32_MAX) {
            throw Error(ErrorCode::InvalidConfig, "CLOB_MAX_ORDERS_PER_CALL out of range");
        }
        cfg.max_orders_per_call = static_cast<uint32_t>(n);
    }
    cfg.validate();
}

} // namespace clob
