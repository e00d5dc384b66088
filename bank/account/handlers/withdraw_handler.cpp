#include "withdraw_handler.hpp"
#include "../src/account_errors.hpp"
#include "chronicle/validation.hpp"

namespace bank {
namespace handlers {

MoneyWithdrawn handle_withdraw(const AccountState& state, int64_t amount,
                               const std::string& description) {
    // Guard
    chronicle::validation::require_state(!state.closed, "Cannot withdraw from a closed account");

    // Validate
    chronicle::validation::require_positive(amount, "amount");
    if (amount > state.balance) {
        throw InsufficientFundsError(state.balance, amount);
    }

    // Compute
    MoneyWithdrawn event;
    event.set_account_id(state.account_id);
    event.set_amount(amount);
    event.set_description(description);
    return event;
}

} // namespace handlers
} // namespace bank
