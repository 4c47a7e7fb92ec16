// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TzBucket/core/Resolver.hpp"
#include "TzBucket/core/Timestamp.hpp"
#include <optional>
#include <type_traits>
#include <variant>

namespace TzBucket::core {

	using exception::PolicyError;
	using exception::RuntimeError;

	namespace {

		constexpr long search_limit_seconds = 2 * 24 * 3600;

		template <class> inline constexpr bool always_false_v = false;

		struct Found {
			LocalDateTime local;
			absl::Time instant;
		};

		// pick an instant for a candidate set, or nothing for a skipped value
		std::optional<absl::Time> pick(const LocalConversion &conversion, bool prefer_later) {
			return std::visit(
				[prefer_later](const auto &c) -> std::optional<absl::Time> {
					using T = std::decay_t<decltype(c)>;
					if constexpr (std::is_same_v<T, Unique>)
						return c.instant;
					else if constexpr (std::is_same_v<T, Ambiguous>)
						return prefer_later ? c.later : c.earlier;
					else if constexpr (std::is_same_v<T, Nonexistent>)
						return std::nullopt;
					else
						static_assert(always_false_v<T>, "unhandled local conversion");
				},
				conversion);
		}

		// latest resolvable second strictly before local
		std::optional<Found> find_previous(const LocalDateTime &local, const Zone &zone) {
			for (long step = 1; step <= search_limit_seconds; ++step) {
				const LocalDateTime probe = local - step;
				if (const auto instant = pick(toUtcCandidates(probe, zone), true))
					return Found{probe, *instant};
			}
			return std::nullopt;
		}

		// earliest resolvable second strictly after local
		std::optional<Found> find_next(const LocalDateTime &local, const Zone &zone) {
			for (long step = 1; step <= search_limit_seconds; ++step) {
				const LocalDateTime probe = local + step;
				if (const auto instant = pick(toUtcCandidates(probe, zone), false))
					return Found{probe, *instant};
			}
			return std::nullopt;
		}

		ExplainResult make_result(const LocalDateTime &local, const Zone &zone, LocalStatus status) {
			ExplainResult result;
			result.local_time = formatLocalTime(local);
			result.tz = zone.name();
			result.status = status;
			return result;
		}

	} // namespace

	absl::Time resolveShiftForward(const LocalDateTime &local, const Zone &zone) {
		const auto previous = find_previous(local, zone);
		const auto next = find_next(local, zone);
		if (!previous || !next)
			TZBUCKET_THROW(RuntimeError,
						   "Could not resolve shifted time with shift_forward policy for '" +
							   formatLocalTime(local) + "' in timezone '" + zone.name() + "'");

		// CivilSecond difference is in seconds
		const auto gap = (next->local - previous->local) - 1;
		const LocalDateTime shifted = local + gap;
		if (const auto instant = pick(toUtcCandidates(shifted, zone), false))
			return *instant;
		return next->instant;
	}

	ExplainResult explainLocalTime(const LocalDateTime &local, const Zone &zone,
								   NonexistentPolicy nonexistent, AmbiguousPolicy ambiguous) {
		const LocalConversion conversion = toUtcCandidates(local, zone);
		ExplainResult result = make_result(local, zone, classify(conversion));

		if (const auto *amb = std::get_if<Ambiguous>(&conversion)) {
			switch (ambiguous) {
			case AmbiguousPolicy::Error:
				TZBUCKET_THROW(PolicyError,
							   "Ambiguous time '" + result.local_time + "' in timezone '" +
								   zone.name() +
								   "'. Occurs twice due to DST fall back. Use "
								   "--policy-ambiguous=first or --policy-ambiguous=second to resolve.",
							   "ambiguous");
			case AmbiguousPolicy::First:
				result.resolution = Resolution{toString(ambiguous), formatRfc3339(amb->earlier, zone)};
				break;
			case AmbiguousPolicy::Second:
				result.resolution = Resolution{toString(ambiguous), formatRfc3339(amb->later, zone)};
				break;
			}
		} else if (std::holds_alternative<Nonexistent>(conversion)) {
			switch (nonexistent) {
			case NonexistentPolicy::Error:
				TZBUCKET_THROW(PolicyError,
							   "Nonexistent time '" + result.local_time + "' in timezone '" +
								   zone.name() +
								   "'. Skipped due to DST spring forward. Use "
								   "--policy-nonexistent=shift_forward to resolve.",
							   "nonexistent");
			case NonexistentPolicy::ShiftForward:
				result.resolution = Resolution{toString(nonexistent),
											   formatRfc3339(resolveShiftForward(local, zone), zone)};
				break;
			}
		}
		return result;
	}

	ExplainResult explainLocalTime(std::string_view local_text, const Zone &zone,
								   NonexistentPolicy nonexistent, AmbiguousPolicy ambiguous) {
		return explainLocalTime(parseLocalTime(local_text), zone, nonexistent, ambiguous);
	}

} // namespace TzBucket::core
