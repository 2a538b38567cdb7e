#pragma once
#include <stdexcept>
#include <string>

namespace clob {

enum class ErrorCode {
    InvalidPrice,
    InvalidQuantity,
    InvalidOrderId,
    OrderIdAlreadyExists,
    OrderIdDoesNotExist,
    NotOrderOwner,
    NodeNotFound,
    ItemAlreadyExists,
    ItemDoesNotExist,
    EmptyQueue,
    LevelNotFound,
    AmountOverflow,
    InvalidConfig,
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidPrice: return "InvalidPrice";
        case ErrorCode::InvalidQuantity: return "InvalidQuantity";
        case ErrorCode::InvalidOrderId: return "InvalidOrderId";
        case ErrorCode::OrderIdAlreadyExists: return "OrderIdAlreadyExists";
        case ErrorCode::OrderIdDoesNotExist: return "OrderIdDoesNotExist";
        case ErrorCode::NotOrderOwner: return "NotOrderOwner";
        case ErrorCode::NodeNotFound: return "NodeNotFound";
        case ErrorCode::ItemAlreadyExists: return "ItemAlreadyExists";
        case ErrorCode::ItemDoesNotExist: return "ItemDoesNotExist";
        case ErrorCode::EmptyQueue: return "EmptyQueue";
        case ErrorCode::LevelNotFound: return "LevelNotFound";
        case ErrorCode::AmountOverflow: return "AmountOverflow";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

// Recoverable errors: bad input, unknown ids or levels, wrong caller.
// Broken internal links are not errors, see CLOB_ASSERT.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& what)
        : std::runtime_error(std::string(to_string(code)) + ": " + what), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// Thrown by Ledger implementations when a transfer is rejected.
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace clob
