#pragma once

#include <cstdint>
#include <string>
#include <google/protobuf/any.pb.h>
#include <google/protobuf/timestamp.pb.h>
#include "chronicle/types.pb.h"

namespace chronicle {

/**
 * Helper functions for working with Chronicle types.
 */
namespace helpers {

constexpr const char* TYPE_URL_PREFIX = "type.googleapis.com/";

/**
 * Get the stream id from an EventBook.
 */
inline std::string stream_id(const EventBook& book) {
    return book.has_cover() ? book.cover().stream_id() : "";
}

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Generate a random (version 4) UUID in canonical 8-4-4-4-12 hex form.
 */
std::string new_event_id();

/**
 * Format a timestamp as ISO-8601 UTC.
 */
std::string to_iso8601(const google::protobuf::Timestamp& ts);

/**
 * Pack a protobuf message into an Any.
 */
template<typename T>
google::protobuf::Any pack_any(const T& message) {
    google::protobuf::Any any;
    any.PackFrom(message, TYPE_URL_PREFIX);
    return any;
}

} // namespace helpers
} // namespace chronicle
