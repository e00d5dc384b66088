#include "close_handler.hpp"
#include "chronicle/validation.hpp"

namespace bank {
namespace handlers {

AccountClosed handle_close(const AccountState& state, const std::string& reason) {
    chronicle::validation::require_state(!state.closed, "Account is already closed");
    chronicle::validation::require_state(
        state.balance == 0,
        "Cannot close account with non-zero balance " + std::to_string(state.balance));

    AccountClosed event;
    event.set_account_id(state.account_id);
    event.set_reason(reason);
    return event;
}

} // namespace handlers
} // namespace bank
