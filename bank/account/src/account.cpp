#include "account.hpp"
#include "../handlers/open_handler.hpp"
#include "../handlers/deposit_handler.hpp"
#include "../handlers/withdraw_handler.hpp"
#include "../handlers/close_handler.hpp"

#include <utility>

namespace bank {

namespace {

AccountEvent wrap(AccountCreated event) {
    AccountEvent wrapped;
    *wrapped.mutable_created() = std::move(event);
    return wrapped;
}

AccountEvent wrap(MoneyDeposited event) {
    AccountEvent wrapped;
    *wrapped.mutable_deposited() = std::move(event);
    return wrapped;
}

AccountEvent wrap(MoneyWithdrawn event) {
    AccountEvent wrapped;
    *wrapped.mutable_withdrawn() = std::move(event);
    return wrapped;
}

AccountEvent wrap(AccountClosed event) {
    AccountEvent wrapped;
    *wrapped.mutable_closed() = std::move(event);
    return wrapped;
}

} // anonymous namespace

Account::Account(std::string account_id)
    : chronicle::Aggregate<Account, AccountState>(std::move(account_id)) {}

Account Account::open(const std::string& account_id, const std::string& holder_name,
                      int64_t initial_balance) {
    auto event = handlers::handle_open(account_id, holder_name, initial_balance);

    Account account(account_id);
    account.emit(wrap(std::move(event)));
    return account;
}

Account Account::replay(const chronicle::EventBook& event_book, chronicle::UnknownEventPolicy policy) {
    Account account("");
    account.rehydrate(event_book, policy);
    return account;
}

void Account::deposit(int64_t amount, const std::string& description) {
    emit(wrap(handlers::handle_deposit(state_, amount, description)));
}

void Account::withdraw(int64_t amount, const std::string& description) {
    emit(wrap(handlers::handle_withdraw(state_, amount, description)));
}

void Account::close(const std::string& reason) {
    emit(wrap(handlers::handle_close(state_, reason)));
}

} // namespace bank
