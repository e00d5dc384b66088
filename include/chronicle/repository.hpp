#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <google/protobuf/timestamp.pb.h>
#include <google/protobuf/util/time_util.h>
#include "config.hpp"
#include "event_store.hpp"
#include "logging.hpp"

namespace chronicle {

/**
 * Loads aggregates by replaying their stream and saves their uncommitted
 * events back with an optimistic version check.
 *
 * AggregateT must provide:
 *   - static AggregateT replay(const EventBook&, UnknownEventPolicy)
 *   - stream_id(), version(), uncommitted_events(), mark_committed(), domain()
 *
 * Example:
 *   InMemoryEventStore store;
 *   Repository<bank::Account> repository(store);
 *   auto account = bank::Account::open("acc-1", "Ada", 1000);
 *   repository.save(account);
 *   auto loaded = repository.load("acc-1");
 */
template<typename AggregateT>
class Repository {
public:
    explicit Repository(EventStore& store, Config config = Config{})
        : store_(store), config_(config) {}

    /**
     * Load the current state of an aggregate.
     *
     * @return std::nullopt if the stream has no events
     */
    std::optional<AggregateT> load(const std::string& id) const {
        return replay(store_.read_stream(id));
    }

    /**
     * Load the state an aggregate had right after the given version.
     */
    std::optional<AggregateT> load_at(const std::string& id, int64_t version) const {
        return replay(store_.read_stream(id, version));
    }

    /**
     * Load the state an aggregate had at a wall-clock instant: the longest
     * stream prefix whose events occurred at or before it.
     */
    std::optional<AggregateT> load_as_of(const std::string& id,
                                         const google::protobuf::Timestamp& instant) const {
        auto book = store_.read_stream(id);
        EventBook prefix;
        *prefix.mutable_cover() = book.cover();
        for (const auto& page : book.pages()) {
            if (page.occurred_at() > instant) break;
            *prefix.add_pages() = page;
        }
        return replay(prefix);
    }

    /**
     * Persist the aggregate's uncommitted events.
     *
     * On ConcurrencyConflictError nothing is stored and the aggregate keeps
     * its uncommitted events; the caller reloads and retries.
     */
    void save(AggregateT& aggregate) {
        const auto& pending = aggregate.uncommitted_events();
        if (pending.empty()) return;

        int64_t count = static_cast<int64_t>(pending.size());
        int64_t expected_version = aggregate.version() - count;

        store_.append(aggregate.stream_id(), pending, expected_version);

        log_debug(aggregate.domain(), "aggregate_saved",
            {{"stream_id", aggregate.stream_id()},
             {"expected_version", expected_version},
             {"version", aggregate.version()},
             {"events", count}});

        aggregate.mark_committed();
    }

private:
    std::optional<AggregateT> replay(const EventBook& book) const {
        if (book.pages_size() == 0) {
            return std::nullopt;
        }
        auto aggregate = AggregateT::replay(book, config_.unknown_events);
        log_debug(aggregate.domain(), "aggregate_loaded",
            {{"stream_id", aggregate.stream_id()},
             {"version", aggregate.version()},
             {"events", book.pages_size()}});
        return aggregate;
    }

    EventStore& store_;
    Config config_;
};

} // namespace chronicle
