#include <gtest/gtest.h>
#include <regex>
#include <set>
#include <string>
#include "chronicle/helpers.hpp"
#include "chronicle/validation.hpp"

using namespace chronicle;

// =============================================================================
// Event Id Tests
// =============================================================================

TEST(HelpersTest, NewEventId_ShouldBeVersion4Uuid) {
    static const std::regex uuid_v4(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    for (int i = 0; i < 100; ++i) {
        auto id = helpers::new_event_id();
        EXPECT_TRUE(std::regex_match(id, uuid_v4)) << id;
    }
}

TEST(HelpersTest, NewEventId_ShouldNotRepeat) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(helpers::new_event_id());
    }
    EXPECT_EQ(ids.size(), 1000u);
}

// =============================================================================
// Book Tests
// =============================================================================

TEST(HelpersTest, StreamId_ShouldReadCover) {
    EventBook book;
    book.mutable_cover()->set_stream_id("acc-1");
    EXPECT_EQ(helpers::stream_id(book), "acc-1");
}

TEST(HelpersTest, StreamId_WithoutCover_ShouldBeEmpty) {
    EventBook book;
    EXPECT_EQ(helpers::stream_id(book), "");
}

// =============================================================================
// Type URL Tests
// =============================================================================

TEST(HelpersTest, PackAny_ShouldUseStandardPrefix) {
    EventPage page;
    page.set_event_id("e-1");
    auto any = helpers::pack_any(page);
    EXPECT_EQ(any.type_url(), "type.googleapis.com/chronicle.EventPage");
}

// =============================================================================
// Time Tests
// =============================================================================

TEST(HelpersTest, ToIso8601_ShouldFormatUtc) {
    google::protobuf::Timestamp ts;
    ts.set_seconds(0);
    EXPECT_EQ(helpers::to_iso8601(ts), "1970-01-01T00:00:00Z");
}

TEST(HelpersTest, Now_ShouldBeAfter2020) {
    auto ts = helpers::now();
    EXPECT_GT(ts.seconds(), 1577836800);
    EXPECT_GE(ts.nanos(), 0);
    EXPECT_LT(ts.nanos(), 1000000000);
}

// =============================================================================
// Validation Tests
// =============================================================================

TEST(HelpersTest, RequirePositive_ShouldRejectZeroAndNegative) {
    EXPECT_THROW(validation::require_positive(0, "amount"), ValidationError);
    EXPECT_THROW(validation::require_positive(-5, "amount"), ValidationError);
    EXPECT_NO_THROW(validation::require_positive(1, "amount"));
}

TEST(HelpersTest, RequireNonNegative_ShouldAcceptZero) {
    EXPECT_NO_THROW(validation::require_non_negative(0, "initial_balance"));
    EXPECT_THROW(validation::require_non_negative(-1, "initial_balance"), ValidationError);
}

TEST(HelpersTest, RequireNotBlank_ShouldRejectWhitespace) {
    EXPECT_THROW(validation::require_not_blank("", "holder_name"), ValidationError);
    EXPECT_THROW(validation::require_not_blank(" \t\n", "holder_name"), ValidationError);
    EXPECT_NO_THROW(validation::require_not_blank(" Ada ", "holder_name"));
}

TEST(HelpersTest, RequireState_ShouldThrowInvalidState) {
    EXPECT_THROW(validation::require_state(false, "closed"), InvalidStateError);
    EXPECT_NO_THROW(validation::require_state(true, "closed"));
}
