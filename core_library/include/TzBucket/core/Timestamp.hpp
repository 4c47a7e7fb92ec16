// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TZBUCKET_CORE_TIMESTAMP_HEADER
#define TZBUCKET_CORE_TIMESTAMP_HEADER

#include <absl/time/time.h>
#include <cstdint>
#include <string>
#include <string_view>

#include "Common.hpp"
#include "Types.hpp"
#include "Zone.hpp"

namespace TzBucket::core {

	/**
	 * Timestamp parsing
	 *
	 * Supported formats:
	 *   - epoch_ms: integer milliseconds since 1970-01-01T00:00:00Z
	 *   - epoch_s:  integer seconds since 1970-01-01T00:00:00Z
	 *   - rfc3339:  "2026-03-29T00:15:00Z", "2026-03-29T01:15:00.250+01:00"
	 *               (the UTC offset is mandatory)
	 *
	 * Surrounding whitespace is ignored. Instants are limited to years
	 * 0000..9999; anything outside throws exception::ParseError.
	 */
	TZBUCKET_EXPORT absl::Time parseTimestamp(std::string_view input, TimestampFormat format);

	/**
	 * Auto-detecting variant.
	 *
	 * Input containing 'T', 'Z', '+' or a '-' six characters from the end is
	 * read as RFC 3339. Integers greater than 10'000'000'000 are milliseconds,
	 * all other integers are seconds. Known limitation: values near that
	 * threshold and negative (pre-1970) millisecond values are misread as
	 * seconds.
	 */
	TZBUCKET_EXPORT absl::Time parseTimestampAuto(std::string_view input);

	// "YYYY-MM-DDTHH:MM:SS", "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM", "YYYY-MM-DD HH:MM"
	TZBUCKET_EXPORT LocalDateTime parseLocalTime(std::string_view input);

	TZBUCKET_EXPORT std::string formatRfc3339Utc(absl::Time instant);		// ...Z
	TZBUCKET_EXPORT std::string formatRfc3339(absl::Time instant, const Zone &zone); // ...+HH:MM
	TZBUCKET_EXPORT std::string formatLocalTime(const LocalDateTime &local);

	TZBUCKET_EXPORT int64_t toEpochMs(absl::Time instant);

	// [0000-01-01T00:00:00Z, 10000-01-01T00:00:00Z)
	TZBUCKET_EXPORT bool isRepresentable(absl::Time instant);
	TZBUCKET_EXPORT bool isRepresentable(const LocalDateTime &local);

	TZBUCKET_EXPORT std::string trim(std::string_view input);

} // namespace TzBucket::core

#endif
