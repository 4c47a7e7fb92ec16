// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TzBucket/core/Bucket.hpp"
#include "TzBucket/core/Timestamp.hpp"
#include <algorithm>
#include <utility>

namespace TzBucket::core {

	using exception::InvalidRangeError;
	using exception::RuntimeError;

	std::vector<Bucket> enumerateBuckets(absl::Time start, absl::Time end, const Zone &zone,
										 Interval interval, WeekStart week_start) {
		if (!(start < end))
			TZBUCKET_THROW(InvalidRangeError, "start '" + formatRfc3339Utc(start) +
												  "' must be earlier than end '" +
												  formatRfc3339Utc(end) + "'");

		std::vector<Bucket> buckets;
		Bucket current = computeBucket(start, zone, interval, week_start);
		while (current.start < end) {
			if (current.end > start)
				buckets.push_back(current);

			// the bucket containing this end is the next one, even across skipped days
			Bucket next = computeBucket(current.end, zone, interval, week_start);
			if (!(next.start > current.start))
				TZBUCKET_THROW(RuntimeError, "Bucket enumeration did not advance past " +
												 current.key + " in timezone '" + zone.name() +
												 "'");
			current = std::move(next);
		}

		std::stable_sort(buckets.begin(), buckets.end(),
						 [](const Bucket &a, const Bucket &b) { return a.start < b.start; });
		const auto last = std::unique(buckets.begin(), buckets.end(),
									  [](const Bucket &a, const Bucket &b) { return a.key == b.key; });
		buckets.erase(last, buckets.end());
		return buckets;
	}

} // namespace TzBucket::core
