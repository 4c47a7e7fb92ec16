// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TzBucket/core/Types.hpp"
#include <algorithm>
#include <cctype>

namespace TzBucket::core {

	using exception::ParseError;

	static std::string lower(std::string_view s) {
		std::string out(s);
		std::transform(out.begin(), out.end(), out.begin(),
					   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		return out;
	}

	std::string toString(Interval v) {
		switch (v) {
		case Interval::Day:
			return "day";
		case Interval::Week:
			return "week";
		case Interval::Month:
			return "month";
		}
		return "?";
	}

	std::string toString(WeekStart v) {
		switch (v) {
		case WeekStart::Monday:
			return "monday";
		case WeekStart::Sunday:
			return "sunday";
		}
		return "?";
	}

	std::string toString(NonexistentPolicy v) {
		switch (v) {
		case NonexistentPolicy::Error:
			return "error";
		case NonexistentPolicy::ShiftForward:
			return "shift_forward";
		}
		return "?";
	}

	std::string toString(AmbiguousPolicy v) {
		switch (v) {
		case AmbiguousPolicy::Error:
			return "error";
		case AmbiguousPolicy::First:
			return "first";
		case AmbiguousPolicy::Second:
			return "second";
		}
		return "?";
	}

	std::string toString(TimestampFormat v) {
		switch (v) {
		case TimestampFormat::EpochMs:
			return "epoch_ms";
		case TimestampFormat::EpochS:
			return "epoch_s";
		case TimestampFormat::Rfc3339:
			return "rfc3339";
		}
		return "?";
	}

	std::string toString(LocalStatus v) {
		switch (v) {
		case LocalStatus::Normal:
			return "normal";
		case LocalStatus::Ambiguous:
			return "ambiguous";
		case LocalStatus::Nonexistent:
			return "nonexistent";
		}
		return "?";
	}

	Interval parseInterval(std::string_view s) {
		const auto l = lower(s);
		if (l == "day") return Interval::Day;
		if (l == "week") return Interval::Week;
		if (l == "month") return Interval::Month;
		TZBUCKET_THROW(ParseError,
					   "Invalid interval '" + std::string(s) + "'. Expected: day, week, month");
	}

	WeekStart parseWeekStart(std::string_view s) {
		const auto l = lower(s);
		if (l == "monday") return WeekStart::Monday;
		if (l == "sunday") return WeekStart::Sunday;
		TZBUCKET_THROW(ParseError,
					   "Invalid week_start '" + std::string(s) + "'. Expected: monday, sunday");
	}

	NonexistentPolicy parseNonexistentPolicy(std::string_view s) {
		const auto l = lower(s);
		if (l == "error") return NonexistentPolicy::Error;
		if (l == "shift_forward") return NonexistentPolicy::ShiftForward;
		TZBUCKET_THROW(ParseError, "Invalid policy_nonexistent '" + std::string(s) +
									   "'. Expected: error, shift_forward");
	}

	AmbiguousPolicy parseAmbiguousPolicy(std::string_view s) {
		const auto l = lower(s);
		if (l == "error") return AmbiguousPolicy::Error;
		if (l == "first") return AmbiguousPolicy::First;
		if (l == "second") return AmbiguousPolicy::Second;
		TZBUCKET_THROW(ParseError, "Invalid policy_ambiguous '" + std::string(s) +
									   "'. Expected: error, first, second");
	}

	TimestampFormat parseTimestampFormat(std::string_view s) {
		const auto l = lower(s);
		if (l == "epoch_ms") return TimestampFormat::EpochMs;
		if (l == "epoch_s") return TimestampFormat::EpochS;
		if (l == "rfc3339") return TimestampFormat::Rfc3339;
		TZBUCKET_THROW(ParseError, "Invalid format '" + std::string(s) +
									   "'. Expected: epoch_ms, epoch_s, rfc3339");
	}

} // namespace TzBucket::core
