#pragma once

#include <cstdint>
#include <string>
#include <google/protobuf/any.pb.h>
#include "bank/account.pb.h"

namespace bank {

/// Bank account aggregate state.
struct AccountState {
    std::string account_id;
    std::string holder_name;
    int64_t balance = 0;
    bool closed = false;

    /// Apply a single event to the state. Returns false for unknown kinds,
    /// which leave the state untouched.
    static bool apply_event(AccountState& state, const google::protobuf::Any& event_any);
};

} // namespace bank
