#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "event_store.hpp"

namespace chronicle {

/**
 * Single-process event store.
 *
 * The global log is the source of truth; global_position N lives at
 * log_[N - 1]. Each stream is an index of positions into it. One
 * shared_mutex guards both: appends are exclusive, reads shared.
 */
class InMemoryEventStore : public EventStore {
public:
    InMemoryEventStore() = default;

    InMemoryEventStore(const InMemoryEventStore&) = delete;
    InMemoryEventStore& operator=(const InMemoryEventStore&) = delete;

    int64_t append(const std::string& stream_id,
                   const std::vector<EventPage>& events,
                   int64_t expected_version) override;

    EventBook read_stream(const std::string& stream_id) const override;
    EventBook read_stream(const std::string& stream_id, int64_t up_to_version) const override;

    std::vector<EventPage> read_all() const override;
    std::vector<EventPage> read_all(uint64_t after_position) const override;

    int64_t stream_version(const std::string& stream_id) const override;
    std::vector<std::string> stream_ids() const override;
    size_t event_count() const override;

private:
    // Caller holds mutex_.
    int64_t current_version(const std::string& stream_id) const;

    mutable std::shared_mutex mutex_;
    std::vector<EventPage> log_;
    std::unordered_map<std::string, std::vector<size_t>> streams_;
    std::vector<std::string> stream_order_;
};

} // namespace chronicle
