#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "chronicle/types.pb.h"

namespace chronicle {

/**
 * Append-only, per-stream event storage with optimistic concurrency.
 *
 * A stream holds the events of one aggregate, strictly increasing by
 * stream_version from 1 with no gaps. Implementations must make the
 * version check and the append a single atomic step.
 */
class EventStore {
public:
    virtual ~EventStore() = default;

    /**
     * Append events to a stream.
     *
     * @param stream_id Stream to append to
     * @param events New events, versions expected_version + 1, + 2, ...
     * @param expected_version Version the caller last saw (0 for a new stream)
     * @return The stream's version after the append
     * @throws ConcurrencyConflictError if the stream is not at expected_version
     * @throws InvariantViolationError if the new events are not contiguous
     * @throws ValidationError on an empty stream id or negative version
     */
    virtual int64_t append(const std::string& stream_id,
                           const std::vector<EventPage>& events,
                           int64_t expected_version) = 0;

    /**
     * Read a stream in version order. Unknown streams yield an empty book.
     */
    virtual EventBook read_stream(const std::string& stream_id) const = 0;

    /**
     * Read the prefix of a stream up to and including a version.
     */
    virtual EventBook read_stream(const std::string& stream_id, int64_t up_to_version) const = 0;

    /**
     * Read every event of every stream in global append order.
     */
    virtual std::vector<EventPage> read_all() const = 0;

    /**
     * Read the global log after a checkpoint position (exclusive).
     */
    virtual std::vector<EventPage> read_all(uint64_t after_position) const = 0;

    /**
     * Current version of a stream, 0 if it does not exist.
     */
    virtual int64_t stream_version(const std::string& stream_id) const = 0;

    /**
     * Ids of all streams, in order of first append.
     */
    virtual std::vector<std::string> stream_ids() const = 0;

    /**
     * Total number of stored events.
     */
    virtual size_t event_count() const = 0;
};

} // namespace chronicle
