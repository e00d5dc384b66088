#pragma once

#include <string>
#include "../src/account_state.hpp"
#include "bank/account.pb.h"

namespace bank {
namespace handlers {

/// Handle the close-account command.
AccountClosed handle_close(const AccountState& state, const std::string& reason);

} // namespace handlers
} // namespace bank
