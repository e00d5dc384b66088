#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <google/protobuf/any.pb.h>
#include "chronicle/types.pb.h"
#include "config.hpp"
#include "errors.hpp"
#include "helpers.hpp"
#include "logging.hpp"
#include "macros.hpp"

namespace chronicle {

/// Base class for event-sourced aggregates using CRTP pattern.
/// Derived classes must implement:
///   - bool apply_event(State& state, const google::protobuf::Any& event)
///     returning false for event kinds they do not recognize
///   - std::string domain() const (see CHRONICLE_AGGREGATE)
/// Commands build an event and pass it to emit(); apply_event is the only
/// place state changes, for live commands and replay alike.
template<typename Derived, typename State>
class Aggregate {
protected:
    State state_;
    std::string stream_id_;
    int64_t version_ = 0;
    std::vector<EventPage> uncommitted_;

public:
    explicit Aggregate(std::string stream_id)
        : state_{}, stream_id_(std::move(stream_id)) {}
    virtual ~Aggregate() = default;

    /// Get the domain name for this aggregate.
    virtual std::string domain() const = 0;

    /// Rehydrate aggregate from event history. Business rules are not
    /// re-checked: the log is trusted.
    void rehydrate(const EventBook& event_book,
                   UnknownEventPolicy policy = UnknownEventPolicy::Ignore) {
        state_ = State{};
        version_ = 0;
        uncommitted_.clear();

        auto cover_id = helpers::stream_id(event_book);
        if (!cover_id.empty()) {
            stream_id_ = cover_id;
        }

        std::vector<const EventPage*> pages;
        pages.reserve(event_book.pages_size());
        for (const auto& page : event_book.pages()) {
            pages.push_back(&page);
        }
        std::stable_sort(pages.begin(), pages.end(),
                         [](const EventPage* a, const EventPage* b) {
                             return a->stream_version() < b->stream_version();
                         });

        for (const auto* page : pages) {
            if (stream_id_.empty()) {
                stream_id_ = page->stream_id();
            }
            apply(*page, policy);
        }
    }

    /// Get the current state (const reference).
    const State& state() const { return state_; }

    const std::string& stream_id() const { return stream_id_; }

    /// Number of events applied so far; the stream version of the last one.
    int64_t version() const { return version_; }

    /// Events applied since the last successful save.
    const std::vector<EventPage>& uncommitted_events() const { return uncommitted_; }

    void mark_committed() { uncommitted_.clear(); }

protected:
    /// Stamp a new event with identity, time and the next stream version,
    /// apply it and record it as uncommitted.
    template<typename EventType>
    void emit(const EventType& event) {
        EventPage page;
        page.set_event_id(helpers::new_event_id());
        page.set_stream_id(stream_id_);
        page.set_stream_version(version_ + 1);
        *page.mutable_occurred_at() = helpers::now();
        *page.mutable_event() = helpers::pack_any(event);

        apply(page, UnknownEventPolicy::Reject);
        uncommitted_.push_back(std::move(page));
    }

private:
    void apply(const EventPage& page, UnknownEventPolicy policy) {
        bool known = static_cast<Derived*>(this)->apply_event(state_, page.event());
        if (!known) {
            if (policy == UnknownEventPolicy::Reject) {
                throw UnknownEventError(page.event().type_url(), page.stream_version());
            }
            log_warn(domain(), "unknown_event_ignored",
                {{"stream_id", stream_id_},
                 {"stream_version", page.stream_version()},
                 {"type_url", page.event().type_url()}});
        }
        version_ = page.stream_version();
    }
};

} // namespace chronicle
