#pragma once

#include <cstdint>
#include <string>
#include "../src/account_state.hpp"
#include "bank/account.pb.h"

namespace bank {
namespace handlers {

/// Handle the deposit command.
MoneyDeposited handle_deposit(const AccountState& state, int64_t amount,
                              const std::string& description);

} // namespace handlers
} // namespace bank
