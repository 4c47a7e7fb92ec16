// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TZBUCKET_CORE_ZONE_HEADER
#define TZBUCKET_CORE_ZONE_HEADER

#include <absl/time/time.h>
#include <string>
#include <string_view>
#include <variant>

#include "Common.hpp"
#include "Types.hpp"

namespace TzBucket::core {

	/**
	 * @brief Read-only handle to an IANA zone
	 *
	 * Wraps absl::TimeZone, whose rule data is loaded once per name and shared
	 * process-wide. Copies are cheap and may be used from any thread.
	 */
	class TZBUCKET_EXPORT Zone final {
	  public:
		Zone(std::string name, absl::TimeZone tz) : m_name(std::move(name)), m_tz(tz) {}

		const std::string &name() const noexcept { return m_name; }
		const absl::TimeZone &tz() const noexcept { return m_tz; }

	  private:
		std::string m_name;
		absl::TimeZone m_tz;
	};

	// wall-clock maps to exactly one instant
	struct Unique {
		absl::Time instant;
	};
	// wall-clock was skipped; transition is when the clocks jumped
	struct Nonexistent {
		absl::Time transition;
	};
	// wall-clock occurred twice; earlier uses the pre-transition offset
	struct Ambiguous {
		absl::Time earlier;
		absl::Time later;
	};
	using LocalConversion = std::variant<Unique, Nonexistent, Ambiguous>;

	// throws exception::InvalidTimezoneError
	TZBUCKET_EXPORT Zone parseZone(std::string_view name);

	TZBUCKET_EXPORT LocalDateTime toLocal(absl::Time instant, const Zone &zone);

	// seconds east of UTC in effect at instant
	TZBUCKET_EXPORT int offsetAt(absl::Time instant, const Zone &zone);

	TZBUCKET_EXPORT LocalConversion toUtcCandidates(const LocalDateTime &local, const Zone &zone);

	TZBUCKET_EXPORT LocalStatus classify(const LocalConversion &conversion) noexcept;

	/**
	 * @brief Earliest valid instant at or after a local wall-clock
	 *
	 * Unique resolves to itself, an ambiguous value to its earlier candidate and
	 * a skipped value to the transition instant. Used for bucket boundaries.
	 */
	TZBUCKET_EXPORT absl::Time resolveEarliest(const LocalDateTime &local, const Zone &zone);

} // namespace TzBucket::core

#endif
