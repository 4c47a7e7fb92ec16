// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TZBUCKET_CORE_TYPES_HEADER
#define TZBUCKET_CORE_TYPES_HEADER

#include <absl/time/civil_time.h>
#include <absl/time/time.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "Common.hpp"

namespace TzBucket::core {

	enum class Interval { Day, Week, Month };
	enum class WeekStart { Monday, Sunday };
	enum class NonexistentPolicy { Error, ShiftForward };
	enum class AmbiguousPolicy { Error, First, Second };
	enum class TimestampFormat { EpochMs, EpochS, Rfc3339 };

	// classification of a local wall-clock value within a zone
	enum class LocalStatus { Normal, Ambiguous, Nonexistent };

	// naive local wall-clock, second resolution, no offset attached
	using LocalDateTime = absl::CivilSecond;

	TZBUCKET_EXPORT std::string toString(Interval v);
	TZBUCKET_EXPORT std::string toString(WeekStart v);
	TZBUCKET_EXPORT std::string toString(NonexistentPolicy v);
	TZBUCKET_EXPORT std::string toString(AmbiguousPolicy v);
	TZBUCKET_EXPORT std::string toString(TimestampFormat v);
	TZBUCKET_EXPORT std::string toString(LocalStatus v);

	// case-insensitive; unknown spellings throw exception::ParseError
	TZBUCKET_EXPORT Interval parseInterval(std::string_view s);
	TZBUCKET_EXPORT WeekStart parseWeekStart(std::string_view s);
	TZBUCKET_EXPORT NonexistentPolicy parseNonexistentPolicy(std::string_view s);
	TZBUCKET_EXPORT AmbiguousPolicy parseAmbiguousPolicy(std::string_view s);
	TZBUCKET_EXPORT TimestampFormat parseTimestampFormat(std::string_view s);

	/**
	 * @brief A calendar-aligned bucket in a zone
	 *
	 * The local texts carry the offset in effect at each boundary, so they may
	 * differ from each other when the bucket spans a DST transition.
	 */
	struct TZBUCKET_EXPORT Bucket {
		std::string key;		 // YYYY-MM-DD (day, week) or YYYY-MM (month)
		std::string start_local; // YYYY-MM-DDTHH:MM:SS+HH:MM
		std::string end_local;
		std::string start_utc; // YYYY-MM-DDTHH:MM:SSZ
		std::string end_utc;
		absl::Time start;
		absl::Time end;
	};

	struct TZBUCKET_EXPORT InputTimestamp {
		std::string ts;
		int64_t epoch_ms;
	};

	struct TZBUCKET_EXPORT BucketResult {
		InputTimestamp input;
		std::string tz;
		Interval interval;
		Bucket bucket;
	};

	struct TZBUCKET_EXPORT Resolution {
		std::string policy;
		std::string result;
	};

	struct TZBUCKET_EXPORT ExplainResult {
		std::string local_time;
		std::string tz;
		LocalStatus status;
		std::optional<Resolution> resolution;
	};

} // namespace TzBucket::core

#endif
