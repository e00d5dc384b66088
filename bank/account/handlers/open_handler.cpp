#include "open_handler.hpp"
#include "chronicle/validation.hpp"

namespace bank {
namespace handlers {

AccountCreated handle_open(const std::string& account_id, const std::string& holder_name,
                           int64_t initial_balance) {
    // Validate
    chronicle::validation::require_not_blank(account_id, "account_id");
    chronicle::validation::require_not_blank(holder_name, "holder_name");
    chronicle::validation::require_non_negative(initial_balance, "initial_balance");

    // Compute
    AccountCreated event;
    event.set_account_id(account_id);
    event.set_holder_name(holder_name);
    event.set_initial_balance(initial_balance);
    return event;
}

} // namespace handlers
} // namespace bank
