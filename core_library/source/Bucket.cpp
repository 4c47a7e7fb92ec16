// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TzBucket/core/Bucket.hpp"
#include "TzBucket/core/Timestamp.hpp"
#include <absl/time/civil_time.h>
#include <cstdio>
#include <string>
#include <utility>

namespace TzBucket::core {

	using exception::RuntimeError;

	namespace {

		struct DateBounds {
			absl::CivilDay start;
			absl::CivilDay end;
			std::string key;
		};

		std::string format_date(const absl::CivilDay &d) {
			char buf[32];
			std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02d", static_cast<long long>(d.year()),
						  d.month(), d.day());
			return buf;
		}

		std::string format_month(const absl::CivilMonth &m) {
			char buf[32];
			std::snprintf(buf, sizeof(buf), "%04lld-%02d", static_cast<long long>(m.year()),
						  m.month());
			return buf;
		}

		DateBounds day_bounds(const absl::CivilDay &date) {
			return {date, date + 1, format_date(date)};
		}

		DateBounds week_bounds(const absl::CivilDay &date, WeekStart week_start) {
			const absl::CivilDay start = date - daysSinceWeekStart(absl::GetWeekday(date), week_start);
			return {start, start + 7, format_date(start)};
		}

		DateBounds month_bounds(const absl::CivilDay &date) {
			const absl::CivilMonth month(date);
			// CivilMonth arithmetic rolls December over into January of the next year
			return {absl::CivilDay(month), absl::CivilDay(month + 1), format_month(month)};
		}

		absl::Time resolve_midnight(const absl::CivilDay &date, const Zone &zone) {
			const LocalDateTime midnight(date);
			if (!isRepresentable(midnight))
				TZBUCKET_THROW(RuntimeError, "Bucket boundary " + format_date(date) +
												 " is outside the representable range");
			return resolveEarliest(midnight, zone);
		}

	} // namespace

	int daysSinceWeekStart(absl::Weekday weekday, WeekStart week_start) noexcept {
		int from_monday = 0;
		switch (weekday) {
		case absl::Weekday::monday:
			from_monday = 0;
			break;
		case absl::Weekday::tuesday:
			from_monday = 1;
			break;
		case absl::Weekday::wednesday:
			from_monday = 2;
			break;
		case absl::Weekday::thursday:
			from_monday = 3;
			break;
		case absl::Weekday::friday:
			from_monday = 4;
			break;
		case absl::Weekday::saturday:
			from_monday = 5;
			break;
		case absl::Weekday::sunday:
			from_monday = 6;
			break;
		}

		switch (week_start) {
		case WeekStart::Monday:
			return from_monday;
		case WeekStart::Sunday:
			return (from_monday + 1) % 7;
		}
		return from_monday;
	}

	Bucket computeBucket(absl::Time instant, const Zone &zone, Interval interval,
						 WeekStart week_start) {
		const absl::CivilDay date(toLocal(instant, zone));

		DateBounds bounds;
		switch (interval) {
		case Interval::Day:
			bounds = day_bounds(date);
			break;
		case Interval::Week:
			bounds = week_bounds(date, week_start);
			break;
		case Interval::Month:
			bounds = month_bounds(date);
			break;
		}

		// each boundary resolved on its own; never start + fixed duration
		const absl::Time start = resolve_midnight(bounds.start, zone);
		const absl::Time end = resolve_midnight(bounds.end, zone);
		if (!(start < end) || !isRepresentable(start) || !isRepresentable(end))
			TZBUCKET_THROW(RuntimeError, "Could not resolve bucket " + bounds.key +
											 " in timezone '" + zone.name() + "'");

		Bucket bucket;
		bucket.key = std::move(bounds.key);
		bucket.start_local = formatRfc3339(start, zone);
		bucket.end_local = formatRfc3339(end, zone);
		bucket.start_utc = formatRfc3339Utc(start);
		bucket.end_utc = formatRfc3339Utc(end);
		bucket.start = start;
		bucket.end = end;
		return bucket;
	}

	BucketResult computeBucketFromString(std::string_view input,
										 std::optional<TimestampFormat> format,
										 std::string_view tz_name, Interval interval,
										 WeekStart week_start) {
		const Zone zone = parseZone(tz_name);
		const absl::Time instant = format ? parseTimestamp(input, *format) : parseTimestampAuto(input);

		BucketResult result;
		result.input = InputTimestamp{trim(input), toEpochMs(instant)};
		result.tz = std::string(tz_name);
		result.interval = interval;
		result.bucket = computeBucket(instant, zone, interval, week_start);
		return result;
	}

} // namespace TzBucket::core
