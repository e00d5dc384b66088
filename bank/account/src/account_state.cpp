#include "account_state.hpp"
#include "account_events.hpp"

namespace bank {

bool AccountState::apply_event(AccountState& state, const google::protobuf::Any& event_any) {
    AccountEvent event;
    if (!unpack_account_event(event_any, &event)) {
        return false;
    }

    switch (event.kind_case()) {
        case AccountEvent::kCreated:
            state.account_id = event.created().account_id();
            state.holder_name = event.created().holder_name();
            state.balance = event.created().initial_balance();
            state.closed = false;
            return true;
        case AccountEvent::kDeposited:
            state.balance += event.deposited().amount();
            return true;
        case AccountEvent::kWithdrawn:
            state.balance -= event.withdrawn().amount();
            return true;
        case AccountEvent::kClosed:
            state.closed = true;
            return true;
        case AccountEvent::KIND_NOT_SET:
            break;
    }
    return false;
}

} // namespace bank
