// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TZBUCKET_CORE_RESOLVER_HEADER
#define TZBUCKET_CORE_RESOLVER_HEADER

#include <absl/time/time.h>
#include <string_view>

#include "Common.hpp"
#include "Types.hpp"
#include "Zone.hpp"

namespace TzBucket::core {

	/**
	 * @brief Classify a local wall-clock in a zone and resolve it by policy
	 *
	 * Normal values carry no resolution. Ambiguous and nonexistent values are
	 * resolved by the matching policy, or rejected with exception::PolicyError
	 * when that policy is Error.
	 *
	 * @param local_text local wall-clock, see parseLocalTime
	 * @param zone Zone to evaluate in
	 */
	TZBUCKET_EXPORT ExplainResult explainLocalTime(std::string_view local_text, const Zone &zone,
												   NonexistentPolicy nonexistent,
												   AmbiguousPolicy ambiguous);

	TZBUCKET_EXPORT ExplainResult explainLocalTime(const LocalDateTime &local, const Zone &zone,
												   NonexistentPolicy nonexistent,
												   AmbiguousPolicy ambiguous);

	/**
	 * @brief Move a skipped wall-clock forward by the width of its gap
	 *
	 * Finds the closest resolvable seconds before and after the request, at
	 * most two days away in each direction, and shifts the request by the gap
	 * between them. Berlin 2026-03-29T02:30 becomes 03:30+02:00.
	 *
	 * Throws exception::RuntimeError when nothing resolves within the bound.
	 */
	TZBUCKET_EXPORT absl::Time resolveShiftForward(const LocalDateTime &local, const Zone &zone);

} // namespace TzBucket::core

#endif
