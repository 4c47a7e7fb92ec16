// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TzBucket/core/Zone.hpp"
#include <type_traits>

namespace TzBucket::core {

	template <class> inline constexpr bool always_false_v = false;

	Zone parseZone(std::string_view name) {
		const std::string zone_name(name);
		absl::TimeZone tz;
		if (zone_name.empty() || !absl::LoadTimeZone(zone_name, &tz))
			TZBUCKET_THROW(exception::InvalidTimezoneError, zone_name);
		return Zone{zone_name, tz};
	}

	LocalDateTime toLocal(absl::Time instant, const Zone &zone) {
		return zone.tz().At(instant).cs;
	}

	int offsetAt(absl::Time instant, const Zone &zone) {
		return zone.tz().At(instant).offset;
	}

	LocalConversion toUtcCandidates(const LocalDateTime &local, const Zone &zone) {
		const absl::TimeZone::TimeInfo info = zone.tz().At(local);
		switch (info.kind) {
		case absl::TimeZone::TimeInfo::UNIQUE:
			return Unique{info.pre};
		case absl::TimeZone::TimeInfo::SKIPPED:
			return Nonexistent{info.trans};
		case absl::TimeZone::TimeInfo::REPEATED:
			return Ambiguous{info.pre, info.post};
		}
		return Unique{info.pre};
	}

	LocalStatus classify(const LocalConversion &conversion) noexcept {
		return std::visit(
			[](const auto &c) -> LocalStatus {
				using T = std::decay_t<decltype(c)>;
				if constexpr (std::is_same_v<T, Unique>)
					return LocalStatus::Normal;
				else if constexpr (std::is_same_v<T, Ambiguous>)
					return LocalStatus::Ambiguous;
				else if constexpr (std::is_same_v<T, Nonexistent>)
					return LocalStatus::Nonexistent;
				else
					static_assert(always_false_v<T>, "unhandled local conversion");
			},
			conversion);
	}

	absl::Time resolveEarliest(const LocalDateTime &local, const Zone &zone) {
		return std::visit(
			[](const auto &c) -> absl::Time {
				using T = std::decay_t<decltype(c)>;
				if constexpr (std::is_same_v<T, Unique>)
					return c.instant;
				else if constexpr (std::is_same_v<T, Ambiguous>)
					return c.earlier;
				else if constexpr (std::is_same_v<T, Nonexistent>)
					return c.transition;
				else
					static_assert(always_false_v<T>, "unhandled local conversion");
			},
			toUtcCandidates(local, zone));
	}

} // namespace TzBucket::core
