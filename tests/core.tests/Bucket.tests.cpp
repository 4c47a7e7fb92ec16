// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <string>

#include "TzBucket/core/Bucket.hpp"
#include "TzBucket/core/Common.hpp"
#include "TzBucket/core/Timestamp.hpp"
#include "gtest/gtest.h"

using namespace TzBucket::core;
using namespace TzBucket::core::exception;

namespace
{

absl::Time utc(const char *text)
{
	return parseTimestamp(text, TimestampFormat::Rfc3339);
}

class BucketTest : public ::testing::Test
{
  protected:
	const Zone berlin = parseZone("Europe/Berlin");
	const Zone utc_zone = parseZone("UTC");
};

} // namespace

// ============================================================================
// day buckets
// ============================================================================

TEST_F(BucketTest, UtcDayIs24Hours)
{
	const Bucket b = computeBucket(utc("2026-03-29T12:34:56Z"), utc_zone, Interval::Day);
	EXPECT_EQ(b.key, "2026-03-29");
	EXPECT_EQ(b.start_utc, "2026-03-29T00:00:00Z");
	EXPECT_EQ(b.end_utc, "2026-03-30T00:00:00Z");
	EXPECT_EQ(b.start_local, "2026-03-29T00:00:00+00:00");
	EXPECT_EQ(b.end - b.start, absl::Hours(24));
}

TEST_F(BucketTest, BerlinOrdinaryDayIs24Hours)
{
	const Bucket b = computeBucket(utc("2026-06-10T08:00:00Z"), berlin, Interval::Day);
	EXPECT_EQ(b.key, "2026-06-10");
	EXPECT_EQ(b.start_local, "2026-06-10T00:00:00+02:00");
	EXPECT_EQ(b.end_local, "2026-06-11T00:00:00+02:00");
	EXPECT_EQ(b.end - b.start, absl::Hours(24));
}

TEST_F(BucketTest, BerlinSpringForwardDayIs23Hours)
{
	const Bucket b = computeBucket(utc("2026-03-29T12:00:00Z"), berlin, Interval::Day);
	EXPECT_EQ(b.key, "2026-03-29");
	EXPECT_EQ(b.start_local, "2026-03-29T00:00:00+01:00");
	EXPECT_EQ(b.end_local, "2026-03-30T00:00:00+02:00");
	EXPECT_EQ(b.start_utc, "2026-03-28T23:00:00Z");
	EXPECT_EQ(b.end_utc, "2026-03-29T22:00:00Z");
	EXPECT_EQ(b.end - b.start, absl::Hours(23));
}

TEST_F(BucketTest, BerlinFallBackDayIs25Hours)
{
	const Bucket b = computeBucket(utc("2026-10-25T12:00:00Z"), berlin, Interval::Day);
	EXPECT_EQ(b.key, "2026-10-25");
	EXPECT_EQ(b.start_local, "2026-10-25T00:00:00+02:00");
	EXPECT_EQ(b.end_local, "2026-10-26T00:00:00+01:00");
	EXPECT_EQ(b.start_utc, "2026-10-24T22:00:00Z");
	EXPECT_EQ(b.end_utc, "2026-10-25T23:00:00Z");
	EXPECT_EQ(b.end - b.start, absl::Hours(25));
}

TEST_F(BucketTest, LocalDateDecidesTheDay)
{
	// 23:30Z on the 28th is already the 29th in Berlin
	const Bucket b = computeBucket(utc("2026-03-28T23:30:00Z"), berlin, Interval::Day);
	EXPECT_EQ(b.key, "2026-03-29");
}

TEST_F(BucketTest, SkippedMidnightStartsAtTransition)
{
	// Sao Paulo moved its clocks from 00:00 to 01:00 on 2018-11-04
	const Zone sao_paulo = parseZone("America/Sao_Paulo");
	const Bucket day = computeBucket(utc("2018-11-04T12:00:00Z"), sao_paulo, Interval::Day);
	EXPECT_EQ(day.key, "2018-11-04");
	EXPECT_EQ(day.start_local, "2018-11-04T01:00:00-02:00");
	EXPECT_EQ(day.end - day.start, absl::Hours(23));

	const Bucket before = computeBucket(utc("2018-11-03T12:00:00Z"), sao_paulo, Interval::Day);
	EXPECT_EQ(before.end_local, "2018-11-04T01:00:00-02:00");
	EXPECT_EQ(before.end, day.start);
}

TEST_F(BucketTest, WhollySkippedDay)
{
	// Samoa skipped 2011-12-30 when it crossed the date line
	const Zone apia = parseZone("Pacific/Apia");
	const Bucket b = computeBucket(utc("2011-12-29T20:00:00Z"), apia, Interval::Day);
	EXPECT_EQ(b.key, "2011-12-29");
	EXPECT_EQ(b.start_local, "2011-12-29T00:00:00-10:00");
	EXPECT_EQ(b.end_local, "2011-12-31T00:00:00+14:00");
	EXPECT_EQ(b.end - b.start, absl::Hours(24));
}

// ============================================================================
// week buckets
// ============================================================================

TEST_F(BucketTest, WeekStartingMonday)
{
	const Bucket b =
		computeBucket(utc("2026-03-29T12:00:00Z"), berlin, Interval::Week, WeekStart::Monday);
	EXPECT_EQ(b.key, "2026-03-23");
	EXPECT_EQ(b.start_local, "2026-03-23T00:00:00+01:00");
	EXPECT_EQ(b.end_local, "2026-03-30T00:00:00+02:00");
	EXPECT_EQ(b.end - b.start, absl::Hours(7 * 24 - 1));
}

TEST_F(BucketTest, WeekStartingSunday)
{
	const Bucket b =
		computeBucket(utc("2026-03-29T12:00:00Z"), berlin, Interval::Week, WeekStart::Sunday);
	EXPECT_EQ(b.key, "2026-03-29");
	EXPECT_EQ(b.start_local, "2026-03-29T00:00:00+01:00");
	EXPECT_EQ(b.end_local, "2026-04-05T00:00:00+02:00");
}

TEST_F(BucketTest, WeekDefaultsToMonday)
{
	const Bucket b = computeBucket(utc("2026-03-29T12:00:00Z"), berlin, Interval::Week);
	EXPECT_EQ(b.key, "2026-03-23");
}

TEST_F(BucketTest, WeekAcrossYearEnd)
{
	// 2027-01-01 is a Friday
	const Bucket b = computeBucket(utc("2027-01-01T12:00:00Z"), utc_zone, Interval::Week);
	EXPECT_EQ(b.key, "2026-12-28");
	EXPECT_EQ(b.end_utc, "2027-01-04T00:00:00Z");
}

TEST(core_bucket, days_since_week_start)
{
	EXPECT_EQ(daysSinceWeekStart(absl::Weekday::monday, WeekStart::Monday), 0);
	EXPECT_EQ(daysSinceWeekStart(absl::Weekday::sunday, WeekStart::Monday), 6);
	EXPECT_EQ(daysSinceWeekStart(absl::Weekday::sunday, WeekStart::Sunday), 0);
	EXPECT_EQ(daysSinceWeekStart(absl::Weekday::monday, WeekStart::Sunday), 1);
	EXPECT_EQ(daysSinceWeekStart(absl::Weekday::saturday, WeekStart::Sunday), 6);
}

// ============================================================================
// month buckets
// ============================================================================

TEST_F(BucketTest, MonthContainingSpringForward)
{
	const Bucket b = computeBucket(utc("2026-03-29T12:00:00Z"), berlin, Interval::Month);
	EXPECT_EQ(b.key, "2026-03");
	EXPECT_EQ(b.start_local, "2026-03-01T00:00:00+01:00");
	EXPECT_EQ(b.end_local, "2026-04-01T00:00:00+02:00");
	EXPECT_EQ(b.start_utc, "2026-02-28T23:00:00Z");
	EXPECT_EQ(b.end_utc, "2026-03-31T22:00:00Z");
}

TEST_F(BucketTest, DecemberRollsOverToNextYear)
{
	const Bucket b = computeBucket(utc("2026-12-15T12:00:00Z"), berlin, Interval::Month);
	EXPECT_EQ(b.key, "2026-12");
	EXPECT_EQ(b.start_local, "2026-12-01T00:00:00+01:00");
	EXPECT_EQ(b.end_local, "2027-01-01T00:00:00+01:00");
}

// ============================================================================
// properties
// ============================================================================

TEST_F(BucketTest, BucketContainsInstantAndIsIdempotent)
{
	const absl::Time from = utc("2026-03-27T00:00:00Z");
	const absl::Time to = utc("2026-04-02T00:00:00Z");
	for (const Interval interval : {Interval::Day, Interval::Week, Interval::Month}) {
		for (absl::Time t = from; t < to; t += absl::Minutes(15)) {
			const Bucket b = computeBucket(t, berlin, interval);
			ASSERT_LE(b.start, t) << absl::FormatTime(t);
			ASSERT_LT(t, b.end) << absl::FormatTime(t);

			const Bucket again = computeBucket(b.start, berlin, interval);
			ASSERT_EQ(again.key, b.key);
			ASSERT_EQ(again.start, b.start);
			ASSERT_EQ(again.end, b.end);
		}
	}
}

TEST_F(BucketTest, BoundaryInstantBelongsToNextBucket)
{
	const Bucket b = computeBucket(utc("2026-03-29T12:00:00Z"), berlin, Interval::Day);
	const Bucket next = computeBucket(b.end, berlin, Interval::Day);
	EXPECT_EQ(next.key, "2026-03-30");
	EXPECT_EQ(next.start, b.end);
	const Bucket prev = computeBucket(b.start - absl::Seconds(1), berlin, Interval::Day);
	EXPECT_EQ(prev.key, "2026-03-28");
}

TEST_F(BucketTest, BoundaryBeyondYear9999Overflows)
{
	const absl::Time last_day = utc("9999-12-31T12:00:00Z");
	EXPECT_THROW(computeBucket(last_day, utc_zone, Interval::Day), RuntimeError);
	EXPECT_THROW(computeBucket(last_day, utc_zone, Interval::Month), RuntimeError);
	EXPECT_NO_THROW(computeBucket(utc("9999-12-30T12:00:00Z"), utc_zone, Interval::Day));
}

// ============================================================================
// string entry point
// ============================================================================

TEST(core_bucket, from_string)
{
	const BucketResult r = computeBucketFromString("  1774785600000 ", TimestampFormat::EpochMs,
												   "Europe/Berlin", Interval::Day);
	EXPECT_EQ(r.input.ts, "1774785600000");
	EXPECT_EQ(r.input.epoch_ms, 1774785600000LL);
	EXPECT_EQ(r.tz, "Europe/Berlin");
	EXPECT_EQ(r.interval, Interval::Day);
	EXPECT_EQ(r.bucket.key, "2026-03-29");
}

TEST(core_bucket, from_string_auto_detect)
{
	const BucketResult r = computeBucketFromString("2026-03-29T12:00:00Z", std::nullopt, "UTC",
												   Interval::Week, WeekStart::Sunday);
	EXPECT_EQ(r.input.epoch_ms, 1774785600000LL);
	EXPECT_EQ(r.bucket.key, "2026-03-29");
}

TEST(core_bucket, from_string_errors)
{
	EXPECT_THROW(computeBucketFromString("1774785600000", TimestampFormat::EpochMs, "Nowhere/City",
										 Interval::Day),
				 InvalidTimezoneError);
	EXPECT_THROW(computeBucketFromString("noon", TimestampFormat::EpochMs, "UTC", Interval::Day),
				 ParseError);
}
