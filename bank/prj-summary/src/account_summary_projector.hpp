#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <google/protobuf/timestamp.pb.h>
#include "chronicle/projector.hpp"

namespace bank {

/// Denormalized per-account read model.
struct AccountSummary {
    std::string account_id;
    std::string holder_name;
    int64_t balance = 0;
    /// Deposits plus withdrawals.
    int32_t transaction_count = 0;
    bool closed = false;
    google::protobuf::Timestamp created_at;
    std::optional<google::protobuf::Timestamp> closed_at;
    google::protobuf::Timestamp last_activity_at;
    int64_t version = 0;
};

/// Folds account events into one AccountSummary per account.
class AccountSummaryProjector : public chronicle::Projector<AccountSummary> {
public:
    CHRONICLE_PROJECTOR("projector-account-summary")

    /// Accounts that are not closed.
    size_t open_count() const;

    /// Sum of all balances. Throws InvariantViolationError if it leaves int64 range.
    int64_t total_balance() const;

protected:
    void project(const chronicle::EventPage& page,
                 std::map<std::string, AccountSummary>& records) override;
};

} // namespace bank
