// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TZBUCKET_CORE_BUCKET_HEADER
#define TZBUCKET_CORE_BUCKET_HEADER

#include <absl/time/time.h>
#include <optional>
#include <string_view>
#include <vector>

#include "Common.hpp"
#include "Types.hpp"
#include "Zone.hpp"

namespace TzBucket::core {

	/**
	 * @brief Compute the calendar bucket containing an instant
	 *
	 * Boundaries are derived as local calendar dates and each one is resolved to
	 * UTC on its own (local midnight, earliest valid instant at or after it), so
	 * a spring-forward day lasts 23 hours and a fall-back day 25 hours.
	 *
	 * Guarantees start <= instant < end. Throws exception::RuntimeError when a
	 * boundary falls outside years 0000..9999.
	 *
	 * @param instant UTC instant to bucket
	 * @param zone Zone the calendar is evaluated in
	 * @param interval Bucket granularity
	 * @param week_start First day of the week, only used for Interval::Week
	 */
	TZBUCKET_EXPORT Bucket computeBucket(absl::Time instant, const Zone &zone, Interval interval,
										 WeekStart week_start = WeekStart::Monday);

	// 0-based distance of weekday from the start of its week
	TZBUCKET_EXPORT int daysSinceWeekStart(absl::Weekday weekday, WeekStart week_start) noexcept;

	// parse zone and timestamp, then bucket; format std::nullopt auto-detects
	TZBUCKET_EXPORT BucketResult computeBucketFromString(std::string_view input,
														 std::optional<TimestampFormat> format,
														 std::string_view tz_name, Interval interval,
														 WeekStart week_start = WeekStart::Monday);

	/**
	 * @brief All buckets overlapping [start, end)
	 *
	 * Sorted by start instant, one entry per key. Throws
	 * exception::InvalidRangeError unless start < end.
	 */
	TZBUCKET_EXPORT std::vector<Bucket> enumerateBuckets(absl::Time start, absl::Time end,
														 const Zone &zone, Interval interval,
														 WeekStart week_start = WeekStart::Monday);

} // namespace TzBucket::core

#endif
