#include "account_summary_projector.hpp"
#include "../../account/src/account_events.hpp"
#include "chronicle/errors.hpp"
#include "chronicle/logging.hpp"

#include <limits>
#include <utility>

namespace bank {

size_t AccountSummaryProjector::open_count() const {
    size_t count = 0;
    for (const auto& [id, summary] : records()) {
        if (!summary.closed) ++count;
    }
    return count;
}

int64_t AccountSummaryProjector::total_balance() const {
    int64_t total = 0;
    for (const auto& [id, summary] : records()) {
        if (summary.balance > std::numeric_limits<int64_t>::max() - total) {
            throw chronicle::InvariantViolationError("Total balance exceeds int64 range");
        }
        total += summary.balance;
    }
    return total;
}

void AccountSummaryProjector::project(const chronicle::EventPage& page,
                                      std::map<std::string, AccountSummary>& records) {
    AccountEvent event;
    if (!unpack_account_event(page.event(), &event)) {
        return;
    }

    if (event.kind_case() == AccountEvent::kCreated) {
        const auto& created = event.created();
        AccountSummary summary;
        summary.account_id = created.account_id();
        summary.holder_name = created.holder_name();
        summary.balance = created.initial_balance();
        summary.created_at = page.occurred_at();
        summary.last_activity_at = page.occurred_at();
        summary.version = page.stream_version();
        records[summary.account_id] = std::move(summary);
        return;
    }

    auto it = records.find(account_id_of(event));
    if (it == records.end()) {
        chronicle::log_warn(kName, "event_for_unknown_account",
            {{"account_id", account_id_of(event)},
             {"stream_version", page.stream_version()}});
        return;
    }
    auto& summary = it->second;

    switch (event.kind_case()) {
        case AccountEvent::kDeposited:
            summary.balance += event.deposited().amount();
            ++summary.transaction_count;
            break;
        case AccountEvent::kWithdrawn:
            summary.balance -= event.withdrawn().amount();
            ++summary.transaction_count;
            break;
        case AccountEvent::kClosed:
            summary.closed = true;
            summary.closed_at = page.occurred_at();
            break;
        case AccountEvent::kCreated:
        case AccountEvent::KIND_NOT_SET:
            return;
    }
    summary.last_activity_at = page.occurred_at();
    summary.version = page.stream_version();
}

} // namespace bank
