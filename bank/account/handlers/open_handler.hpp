#pragma once

#include <cstdint>
#include <string>
#include "bank/account.pb.h"

namespace bank {
namespace handlers {

/// Handle the open-account command.
AccountCreated handle_open(const std::string& account_id, const std::string& holder_name,
                           int64_t initial_balance);

} // namespace handlers
} // namespace bank
