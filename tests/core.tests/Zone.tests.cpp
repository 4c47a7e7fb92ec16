// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include <variant>

#include "TzBucket/core/Timestamp.hpp"
#include "TzBucket/core/Zone.hpp"
#include "gtest/gtest.h"

using namespace TzBucket::core;
using namespace TzBucket::core::exception;

static absl::Time utc(const char *text)
{
	return parseTimestamp(text, TimestampFormat::Rfc3339);
}

TEST(core_zone, load_known_zones)
{
	EXPECT_EQ(parseZone("UTC").name(), "UTC");
	EXPECT_EQ(parseZone("Europe/Berlin").name(), "Europe/Berlin");
	EXPECT_EQ(parseZone("America/New_York").name(), "America/New_York");
}

TEST(core_zone, unknown_zone_is_rejected)
{
	try {
		parseZone("Mars/Olympus_Mons");
		FAIL() << "expected InvalidTimezoneError";
	} catch (const InvalidTimezoneError &e) {
		EXPECT_STREQ(e.what(), "Invalid timezone: Mars/Olympus_Mons");
		EXPECT_EQ(e.kind(), Kind::InvalidTimezone);
	}
	EXPECT_THROW(parseZone(""), InvalidTimezoneError);
}

TEST(core_zone, offsets_follow_dst)
{
	const Zone berlin = parseZone("Europe/Berlin");
	EXPECT_EQ(offsetAt(utc("2026-01-15T12:00:00Z"), berlin), 3600);
	EXPECT_EQ(offsetAt(utc("2026-07-15T12:00:00Z"), berlin), 7200);
	EXPECT_EQ(toLocal(utc("2026-07-15T12:00:00Z"), berlin), LocalDateTime(2026, 7, 15, 14, 0, 0));
}

TEST(core_zone, unique_wall_clock)
{
	const Zone berlin = parseZone("Europe/Berlin");
	const LocalConversion c = toUtcCandidates(LocalDateTime(2026, 3, 29, 12, 0, 0), berlin);
	ASSERT_TRUE(std::holds_alternative<Unique>(c));
	EXPECT_EQ(std::get<Unique>(c).instant, utc("2026-03-29T10:00:00Z"));
	EXPECT_EQ(classify(c), LocalStatus::Normal);
}

TEST(core_zone, skipped_wall_clock)
{
	const Zone berlin = parseZone("Europe/Berlin");
	const LocalConversion c = toUtcCandidates(LocalDateTime(2026, 3, 29, 2, 30, 0), berlin);
	ASSERT_TRUE(std::holds_alternative<Nonexistent>(c));
	EXPECT_EQ(std::get<Nonexistent>(c).transition, utc("2026-03-29T01:00:00Z"));
	EXPECT_EQ(classify(c), LocalStatus::Nonexistent);
}

TEST(core_zone, repeated_wall_clock)
{
	const Zone berlin = parseZone("Europe/Berlin");
	const LocalConversion c = toUtcCandidates(LocalDateTime(2026, 10, 25, 2, 30, 0), berlin);
	ASSERT_TRUE(std::holds_alternative<Ambiguous>(c));
	const auto &amb = std::get<Ambiguous>(c);
	EXPECT_EQ(amb.earlier, utc("2026-10-25T00:30:00Z"));
	EXPECT_EQ(amb.later, utc("2026-10-25T01:30:00Z"));
	EXPECT_EQ(amb.later - amb.earlier, absl::Hours(1));
	EXPECT_EQ(classify(c), LocalStatus::Ambiguous);
}

TEST(core_zone, resolve_earliest)
{
	const Zone berlin = parseZone("Europe/Berlin");
	EXPECT_EQ(resolveEarliest(LocalDateTime(2026, 3, 29, 2, 30, 0), berlin),
			  utc("2026-03-29T01:00:00Z"));
	EXPECT_EQ(resolveEarliest(LocalDateTime(2026, 10, 25, 2, 30, 0), berlin),
			  utc("2026-10-25T00:30:00Z"));
	EXPECT_EQ(resolveEarliest(LocalDateTime(2026, 6, 1, 0, 0, 0), berlin),
			  utc("2026-05-31T22:00:00Z"));
}

TEST(core_zone, zone_handles_are_copyable)
{
	const Zone berlin = parseZone("Europe/Berlin");
	const Zone copy = berlin;
	EXPECT_EQ(copy.name(), berlin.name());
	EXPECT_EQ(offsetAt(utc("2026-07-15T12:00:00Z"), copy), 7200);
}
