#pragma once

#include <cstdint>
#include <string>
#include "account_state.hpp"
#include "chronicle/aggregate.hpp"
#include "bank/account.pb.h"

namespace bank {

/// Bank account aggregate - OO style using CRTP pattern.
///
/// States: open -> closed. Closed is terminal; the balance must be zero to
/// close and never goes negative.
class Account : public chronicle::Aggregate<Account, AccountState> {
public:
    CHRONICLE_AGGREGATE("account")

    /// Open a new account; records AccountCreated as version 1.
    static Account open(const std::string& account_id, const std::string& holder_name,
                        int64_t initial_balance);

    /// Reconstruct an account from its stream without re-validating.
    static Account replay(const chronicle::EventBook& event_book,
                          chronicle::UnknownEventPolicy policy = chronicle::UnknownEventPolicy::Ignore);

    /// Apply a single event to state (called by base class).
    bool apply_event(AccountState& state, const google::protobuf::Any& event_any) {
        return AccountState::apply_event(state, event_any);
    }

    // Commands
    void deposit(int64_t amount, const std::string& description);
    void withdraw(int64_t amount, const std::string& description);
    void close(const std::string& reason);

    // State accessors
    const std::string& id() const { return stream_id_; }
    const std::string& holder_name() const { return state_.holder_name; }
    int64_t balance() const { return state_.balance; }
    bool closed() const { return state_.closed; }

private:
    explicit Account(std::string account_id);
};

} // namespace bank
