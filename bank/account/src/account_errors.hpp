#pragma once

#include <cstdint>
#include <string>
#include "chronicle/errors.hpp"

namespace bank {

/// Withdrawal larger than the current balance.
class InsufficientFundsError : public chronicle::CommandRejectedError {
public:
    InsufficientFundsError(int64_t balance, int64_t requested)
        : chronicle::CommandRejectedError(
              "Insufficient funds: balance " + std::to_string(balance) +
                  ", requested " + std::to_string(requested),
              grpc::StatusCode::FAILED_PRECONDITION),
          balance_(balance), requested_(requested) {}

    int64_t balance() const { return balance_; }
    int64_t requested() const { return requested_; }

private:
    int64_t balance_;
    int64_t requested_;
};

} // namespace bank
