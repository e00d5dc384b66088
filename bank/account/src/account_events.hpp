#pragma once

#include <string>
#include <google/protobuf/any.pb.h>
#include "bank/account.pb.h"

namespace bank {

/// Unpack an account event. Returns false if the payload is not an
/// AccountEvent or carries no kind this build knows.
inline bool unpack_account_event(const google::protobuf::Any& event_any, AccountEvent* event) {
    if (!event_any.Is<AccountEvent>() || !event_any.UnpackTo(event)) {
        return false;
    }
    return event->kind_case() != AccountEvent::KIND_NOT_SET;
}

/// Account id carried by the event payload, empty when no kind is set.
inline std::string account_id_of(const AccountEvent& event) {
    switch (event.kind_case()) {
        case AccountEvent::kCreated:   return event.created().account_id();
        case AccountEvent::kDeposited: return event.deposited().account_id();
        case AccountEvent::kWithdrawn: return event.withdrawn().account_id();
        case AccountEvent::kClosed:    return event.closed().account_id();
        case AccountEvent::KIND_NOT_SET:
            break;
    }
    return "";
}

} // namespace bank
