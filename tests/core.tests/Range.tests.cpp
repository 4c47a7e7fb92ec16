// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <string>
#include <vector>

#include "TzBucket/core/Bucket.hpp"
#include "TzBucket/core/Common.hpp"
#include "TzBucket/core/Timestamp.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

using ::testing::ElementsAre;

using namespace TzBucket::core;
using namespace TzBucket::core::exception;

namespace
{

absl::Time utc(const char *text)
{
	return parseTimestamp(text, TimestampFormat::Rfc3339);
}

std::vector<std::string> keys(const std::vector<Bucket> &buckets)
{
	std::vector<std::string> out;
	for (const auto &b : buckets)
		out.push_back(b.key);
	return out;
}

} // namespace

TEST(core_range, days_across_spring_forward)
{
	const Zone berlin = parseZone("Europe/Berlin");
	const auto buckets = enumerateBuckets(utc("2026-03-28T00:00:00+01:00"),
										  utc("2026-03-31T00:00:00+02:00"), berlin, Interval::Day);
	EXPECT_THAT(keys(buckets), ElementsAre("2026-03-28", "2026-03-29", "2026-03-30"));
	EXPECT_EQ(buckets[1].end - buckets[1].start, absl::Hours(23));
	EXPECT_EQ(buckets[0].end, buckets[1].start);
	EXPECT_EQ(buckets[1].end, buckets[2].start);
}

TEST(core_range, partial_overlap_is_included)
{
	const auto buckets = enumerateBuckets(utc("2026-03-01T12:00:00Z"), utc("2026-03-02T00:00:01Z"),
										  parseZone("UTC"), Interval::Day);
	EXPECT_THAT(keys(buckets), ElementsAre("2026-03-01", "2026-03-02"));
}

TEST(core_range, end_is_exclusive)
{
	const auto buckets = enumerateBuckets(utc("2026-03-01T00:00:00Z"), utc("2026-03-03T00:00:00Z"),
										  parseZone("UTC"), Interval::Day);
	EXPECT_THAT(keys(buckets), ElementsAre("2026-03-01", "2026-03-02"));
}

TEST(core_range, weeks_are_sorted_and_unique)
{
	const auto buckets = enumerateBuckets(utc("2026-03-01T00:00:00Z"), utc("2026-04-01T00:00:00Z"),
										  parseZone("Europe/Berlin"), Interval::Week);
	EXPECT_THAT(keys(buckets), ElementsAre("2026-02-23", "2026-03-02", "2026-03-09", "2026-03-16",
										   "2026-03-23", "2026-03-30"));
	for (size_t i = 1; i < buckets.size(); i++)
		EXPECT_LT(buckets[i - 1].start, buckets[i].start);
}

TEST(core_range, sunday_weeks)
{
	const auto buckets =
		enumerateBuckets(utc("2026-03-28T12:00:00Z"), utc("2026-03-29T12:00:00Z"),
						 parseZone("Europe/Berlin"), Interval::Week, WeekStart::Sunday);
	EXPECT_THAT(keys(buckets), ElementsAre("2026-03-22", "2026-03-29"));
}

TEST(core_range, months_across_year_end)
{
	const auto buckets = enumerateBuckets(utc("2026-11-15T00:00:00Z"), utc("2027-01-15T00:00:00Z"),
										  parseZone("UTC"), Interval::Month);
	EXPECT_THAT(keys(buckets), ElementsAre("2026-11", "2026-12", "2027-01"));
}

TEST(core_range, wholly_skipped_day_has_no_bucket)
{
	const auto buckets = enumerateBuckets(utc("2011-12-29T12:00:00Z"), utc("2011-12-31T12:00:00Z"),
										  parseZone("Pacific/Apia"), Interval::Day);
	EXPECT_THAT(keys(buckets), ElementsAre("2011-12-29", "2011-12-31", "2012-01-01"));
}

TEST(core_range, invalid_range)
{
	const Zone zone = parseZone("UTC");
	const absl::Time t = utc("2026-03-01T00:00:00Z");
	try {
		enumerateBuckets(t, t, zone, Interval::Day);
		FAIL() << "expected InvalidRangeError";
	} catch (const InvalidRangeError &e) {
		EXPECT_STREQ(e.what(), "Invalid range: start '2026-03-01T00:00:00Z' must be earlier than "
							   "end '2026-03-01T00:00:00Z'");
		EXPECT_EQ(e.kind(), Kind::InvalidRange);
	}
	EXPECT_THROW(enumerateBuckets(t + absl::Hours(1), t, zone, Interval::Day), InvalidRangeError);
}
