#include <gtest/gtest.h>
#include "errors.h"
#include "timestamp.h"

using namespace txguard;

TEST(Timestamp, ParsesNaiveAsUtc) {
    const Timestamp ts = parse_timestamp("2025-01-18T12:30:00");
    EXPECT_EQ(ts.epoch_ms, 1737203400000LL);
    EXPECT_EQ(ts.hour_of_day, 12);
}

TEST(Timestamp, EpochOrigin) {
    EXPECT_EQ(parse_timestamp("1970-01-01T00:00:00Z").epoch_ms, 0);
}

TEST(Timestamp, OffsetShiftsInstantButKeepsLocalHour) {
    const Timestamp utc = parse_timestamp("2025-01-18T01:30:00Z");
    const Timestamp local = parse_timestamp("2025-01-18T03:30:00+02:00");
    EXPECT_EQ(utc.epoch_ms, local.epoch_ms);
    EXPECT_EQ(local.hour_of_day, 3);

    const Timestamp west = parse_timestamp("2025-01-17T20:30:00-0500");
    EXPECT_EQ(west.epoch_ms, utc.epoch_ms);
}

TEST(Timestamp, FractionalSecondsAndSpaceSeparator) {
    const Timestamp ts = parse_timestamp("2025-01-18 12:30:00.250");
    EXPECT_EQ(ts.epoch_ms, 1737203400250LL);
}

TEST(Timestamp, MinutePrecision) {
    EXPECT_EQ(parse_timestamp("2025-01-18T12:30").epoch_ms, 1737203400000LL);
}

TEST(Timestamp, LeapDay) {
    EXPECT_NO_THROW(parse_timestamp("2024-02-29T00:00:00"));
    EXPECT_THROW(parse_timestamp("2025-02-29T00:00:00"), InvalidTransaction);
}

TEST(Timestamp, RejectsGarbage) {
    EXPECT_THROW(parse_timestamp(""), InvalidTransaction);
    EXPECT_THROW(parse_timestamp("yesterday"), InvalidTransaction);
    EXPECT_THROW(parse_timestamp("2025-01-18"), InvalidTransaction);
    EXPECT_THROW(parse_timestamp("2025-13-01T00:00:00"), InvalidTransaction);
    EXPECT_THROW(parse_timestamp("2025-01-18T24:00:00"), InvalidTransaction);
    EXPECT_THROW(parse_timestamp("2025-01-18T12:30:00Zjunk"), InvalidTransaction);
    EXPECT_THROW(parse_timestamp("2025-01-18T12:30:00."), InvalidTransaction);
}
