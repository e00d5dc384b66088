#include "deposit_handler.hpp"
#include "chronicle/validation.hpp"

#include <limits>

namespace bank {
namespace handlers {

namespace {

void guard(const AccountState& state) {
    chronicle::validation::require_state(!state.closed, "Cannot deposit into a closed account");
}

void validate(const AccountState& state, int64_t amount) {
    chronicle::validation::require_positive(amount, "amount");
    if (amount > std::numeric_limits<int64_t>::max() - state.balance) {
        throw chronicle::ValidationError("amount would overflow balance " +
                                         std::to_string(state.balance));
    }
}

MoneyDeposited compute(const AccountState& state, int64_t amount, const std::string& description) {
    MoneyDeposited event;
    event.set_account_id(state.account_id);
    event.set_amount(amount);
    event.set_description(description);
    return event;
}

} // anonymous namespace

MoneyDeposited handle_deposit(const AccountState& state, int64_t amount,
                              const std::string& description) {
    guard(state);
    validate(state, amount);
    return compute(state, amount, description);
}

} // namespace handlers
} // namespace bank
