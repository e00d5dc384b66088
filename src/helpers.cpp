#include "chronicle/helpers.hpp"

#include <chrono>
#include <random>
#include <google/protobuf/util/time_util.h>

namespace chronicle {
namespace helpers {

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

std::string new_event_id() {
    thread_local std::mt19937_64 engine{std::random_device{}()};

    uint64_t high = engine();
    uint64_t low = engine();

    // RFC 4122 version 4, variant 1
    high = (high & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    low = (low & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

    static const char hex_chars[] = "0123456789abcdef";
    std::string id;
    id.reserve(36);
    for (int i = 15; i >= 0; --i) {
        id.push_back(hex_chars[(high >> (i * 4)) & 0x0f]);
        if (i == 8 || i == 4) id.push_back('-');
    }
    id.push_back('-');
    for (int i = 15; i >= 0; --i) {
        id.push_back(hex_chars[(low >> (i * 4)) & 0x0f]);
        if (i == 12) id.push_back('-');
    }
    return id;
}

std::string to_iso8601(const google::protobuf::Timestamp& ts) {
    return google::protobuf::util::TimeUtil::ToString(ts);
}

} // namespace helpers
} // namespace chronicle
