#include "chronicle/in_memory_event_store.hpp"
#include "chronicle/errors.hpp"
#include "chronicle/logging.hpp"
#include "chronicle/validation.hpp"

#include <cstddef>
#include <mutex>
#include <utility>

namespace chronicle {

namespace {

constexpr const char* COMPONENT = "event-store";

} // anonymous namespace

int64_t InMemoryEventStore::append(const std::string& stream_id,
                                   const std::vector<EventPage>& events,
                                   int64_t expected_version) {
    validation::require_not_empty(stream_id, "stream_id");
    validation::require_non_negative(expected_version, "expected_version");

    int64_t new_version = 0;
    uint64_t first_position = 0;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        int64_t actual = current_version(stream_id);
        if (actual != expected_version) {
            lock.unlock();
            log_warn(COMPONENT, "append_conflict",
                {{"stream_id", stream_id},
                 {"expected_version", expected_version},
                 {"actual_version", actual}});
            throw ConcurrencyConflictError(stream_id, expected_version, actual);
        }

        // Check everything before touching the log so a failed append leaves
        // the stream unchanged.
        int64_t next = expected_version + 1;
        for (const auto& page : events) {
            if (page.stream_version() != next) {
                throw InvariantViolationError(
                    "Non-contiguous append to stream " + stream_id +
                    ": expected version " + std::to_string(next) +
                    ", got " + std::to_string(page.stream_version()));
            }
            if (!page.stream_id().empty() && page.stream_id() != stream_id) {
                throw InvariantViolationError(
                    "Event " + page.event_id() + " belongs to stream " + page.stream_id() +
                    ", not " + stream_id);
            }
            ++next;
        }

        if (events.empty()) {
            return actual;
        }

        auto [it, inserted] = streams_.try_emplace(stream_id);
        if (inserted) {
            stream_order_.push_back(stream_id);
        }
        auto& index = it->second;

        log_.reserve(log_.size() + events.size());
        index.reserve(index.size() + events.size());
        first_position = log_.size() + 1;
        for (const auto& page : events) {
            EventPage stored = page;
            stored.set_stream_id(stream_id);
            stored.set_global_position(log_.size() + 1);
            index.push_back(log_.size());
            log_.push_back(std::move(stored));
        }
        new_version = next - 1;
    }

    log_debug(COMPONENT, "events_appended",
        {{"stream_id", stream_id},
         {"from_version", expected_version + 1},
         {"to_version", new_version},
         {"first_position", first_position},
         {"count", events.size()}});
    return new_version;
}

EventBook InMemoryEventStore::read_stream(const std::string& stream_id) const {
    EventBook book;
    book.mutable_cover()->set_stream_id(stream_id);

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return book;
    }
    for (size_t index : it->second) {
        *book.add_pages() = log_[index];
    }
    return book;
}

EventBook InMemoryEventStore::read_stream(const std::string& stream_id, int64_t up_to_version) const {
    EventBook book;
    book.mutable_cover()->set_stream_id(stream_id);

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = streams_.find(stream_id);
    if (it == streams_.end()) {
        return book;
    }
    for (size_t index : it->second) {
        const auto& page = log_[index];
        if (page.stream_version() > up_to_version) break;
        *book.add_pages() = page;
    }
    return book;
}

std::vector<EventPage> InMemoryEventStore::read_all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return log_;
}

std::vector<EventPage> InMemoryEventStore::read_all(uint64_t after_position) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (after_position >= log_.size()) {
        return {};
    }
    return std::vector<EventPage>(log_.begin() + static_cast<std::ptrdiff_t>(after_position),
                                  log_.end());
}

int64_t InMemoryEventStore::stream_version(const std::string& stream_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return current_version(stream_id);
}

std::vector<std::string> InMemoryEventStore::stream_ids() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return stream_order_;
}

size_t InMemoryEventStore::event_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return log_.size();
}

int64_t InMemoryEventStore::current_version(const std::string& stream_id) const {
    auto it = streams_.find(stream_id);
    if (it == streams_.end() || it->second.empty()) {
        return 0;
    }
    return log_[it->second.back()].stream_version();
}

} // namespace chronicle
