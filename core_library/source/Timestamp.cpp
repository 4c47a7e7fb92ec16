// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TzBucket/core/Timestamp.hpp"
#include <absl/time/civil_time.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <optional>

namespace TzBucket::core {

	using exception::ParseError;

	namespace {

		constexpr int64_t auto_ms_threshold = 10'000'000'000LL;

		const absl::Time &min_instant() {
			static const absl::Time t =
				absl::FromCivil(absl::CivilSecond(0, 1, 1, 0, 0, 0), absl::UTCTimeZone());
			return t;
		}

		const absl::Time &end_instant() {
			static const absl::Time t =
				absl::FromCivil(absl::CivilSecond(10000, 1, 1, 0, 0, 0), absl::UTCTimeZone());
			return t;
		}

		std::optional<int64_t> parse_int64(std::string_view s) {
			if (!s.empty() && s.front() == '+') {
				s.remove_prefix(1);
				if (!s.empty() && s.front() == '-') return std::nullopt;
			}
			if (s.empty()) return std::nullopt;
			int64_t value = 0;
			const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
			if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
			return value;
		}

		int field(const boost::smatch &m, int i) { return std::atoi(m[i].str().c_str()); }

		absl::Time parse_epoch_ms(const std::string &input) {
			const auto ms = parse_int64(input);
			if (!ms)
				TZBUCKET_THROW(ParseError, "Invalid epoch milliseconds: '" + input +
											   "'. Expected integer value.");
			const absl::Time t = absl::FromUnixMillis(*ms);
			if (!isRepresentable(t))
				TZBUCKET_THROW(ParseError,
							   "Epoch milliseconds out of range: " + std::to_string(*ms));
			return t;
		}

		absl::Time parse_epoch_s(const std::string &input) {
			const auto s = parse_int64(input);
			if (!s)
				TZBUCKET_THROW(ParseError,
							   "Invalid epoch seconds: '" + input + "'. Expected integer value.");
			const absl::Time t = absl::FromUnixSeconds(*s);
			if (!isRepresentable(t))
				TZBUCKET_THROW(ParseError, "Epoch seconds out of range: " + std::to_string(*s));
			return t;
		}

		[[noreturn]] void rfc3339_error(const std::string &input, const std::string &complaint) {
			TZBUCKET_THROW(ParseError,
						   "Invalid RFC3339 timestamp: '" + input + "'. Error: " + complaint);
		}

		absl::Time parse_rfc3339(const std::string &input) {
			// 1:year 2:month 3:day 4:hour 5:minute 6:second 7:fraction 8:offset
			static const boost::regex pattern{
				R"(^(\d{4})-(\d{2})-(\d{2})[Tt ](\d{2}):(\d{2}):(\d{2})(?:\.(\d+))?([Zz]|[+-]\d{2}:\d{2})?$)"};

			boost::smatch m;
			if (!boost::regex_match(input, m, pattern))
				rfc3339_error(input, "expected YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM)");
			if (!m[8].matched) rfc3339_error(input, "missing UTC offset");

			const int year = field(m, 1);
			const int month = field(m, 2);
			const int day = field(m, 3);
			const int hour = field(m, 4);
			const int minute = field(m, 5);
			int second = field(m, 6);

			if (month < 1 || month > 12) rfc3339_error(input, "month out of range");
			const absl::CivilDay date(year, month, day);
			if (date.month() != month || date.day() != day) rfc3339_error(input, "day out of range");
			if (hour > 23) rfc3339_error(input, "hour out of range");
			if (minute > 59) rfc3339_error(input, "minute out of range");
			if (second > 60) rfc3339_error(input, "second out of range");
			if (second == 60) second = 59; // leap second

			int64_t nanos = 0;
			if (m[7].matched) {
				std::string frac = m[7].str().substr(0, 9);
				frac.append(9 - frac.size(), '0');
				nanos = std::atoll(frac.c_str());
			}

			int offset_seconds = 0;
			const std::string offset = m[8].str();
			if (offset != "Z" && offset != "z") {
				const int oh = std::atoi(offset.substr(1, 2).c_str());
				const int om = std::atoi(offset.substr(4, 2).c_str());
				if (oh > 23 || om > 59) rfc3339_error(input, "offset out of range");
				offset_seconds = (oh * 60 + om) * 60;
				if (offset[0] == '-') offset_seconds = -offset_seconds;
			}

			const absl::CivilSecond cs(year, month, day, hour, minute, second);
			const absl::Time t = absl::FromCivil(cs, absl::UTCTimeZone()) -
								 absl::Seconds(offset_seconds) + absl::Nanoseconds(nanos);
			if (!isRepresentable(t)) rfc3339_error(input, "timestamp out of range");
			return t;
		}

		std::string format_civil(const absl::CivilSecond &cs) {
			char buf[48];
			std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02dT%02d:%02d:%02d",
						  static_cast<long long>(cs.year()), cs.month(), cs.day(), cs.hour(),
						  cs.minute(), cs.second());
			return buf;
		}

		std::string format_offset(int offset_seconds) {
			char buf[16];
			const char sign = offset_seconds < 0 ? '-' : '+';
			const int minutes = std::abs(offset_seconds) / 60;
			std::snprintf(buf, sizeof(buf), "%c%02d:%02d", sign, minutes / 60, minutes % 60);
			return buf;
		}

	} // namespace

	std::string trim(std::string_view input) {
		return boost::algorithm::trim_copy(std::string(input));
	}

	bool isRepresentable(absl::Time instant) {
		return instant >= min_instant() && instant < end_instant();
	}

	bool isRepresentable(const LocalDateTime &local) {
		return local.year() >= 0 && local.year() <= 9999;
	}

	absl::Time parseTimestamp(std::string_view input, TimestampFormat format) {
		const std::string trimmed = trim(input);
		switch (format) {
		case TimestampFormat::EpochMs:
			return parse_epoch_ms(trimmed);
		case TimestampFormat::EpochS:
			return parse_epoch_s(trimmed);
		case TimestampFormat::Rfc3339:
			return parse_rfc3339(trimmed);
		}
		TZBUCKET_THROW(ParseError, "Unknown timestamp format");
	}

	absl::Time parseTimestampAuto(std::string_view input) {
		const std::string trimmed = trim(input);

		const bool offset_suffix = trimmed.size() > 6 && trimmed[trimmed.size() - 6] == '-';
		if (trimmed.find_first_of("TZ+") != std::string::npos || offset_suffix)
			return parse_rfc3339(trimmed);

		if (const auto num = parse_int64(trimmed)) {
			if (*num > auto_ms_threshold) return parse_epoch_ms(trimmed);
			return parse_epoch_s(trimmed);
		}

		TZBUCKET_THROW(ParseError, "Could not auto-detect format for: '" + std::string(input) + "'");
	}

	LocalDateTime parseLocalTime(std::string_view input) {
		// 1:year 2:month 3:day 4:hour 5:minute 6:second
		static const boost::regex pattern{R"(^(\d{4})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2})(?::(\d{2}))?$)"};

		const std::string trimmed = trim(input);
		const auto invalid = [&]() {
			TZBUCKET_THROW(ParseError, "Invalid local time format '" + trimmed +
										   "'. Expected: YYYY-MM-DDTHH:MM:SS");
		};

		boost::smatch m;
		if (!boost::regex_match(trimmed, m, pattern)) invalid();

		const int year = field(m, 1);
		const int month = field(m, 2);
		const int day = field(m, 3);
		const int hour = field(m, 4);
		const int minute = field(m, 5);
		const int second = m[6].matched ? field(m, 6) : 0;

		const absl::CivilDay date(year, month, day);
		if (month < 1 || month > 12 || date.month() != month || date.day() != day || hour > 23 ||
			minute > 59 || second > 59)
			invalid();

		return LocalDateTime(year, month, day, hour, minute, second);
	}

	std::string formatRfc3339Utc(absl::Time instant) {
		return format_civil(absl::ToCivilSecond(instant, absl::UTCTimeZone())) + "Z";
	}

	std::string formatRfc3339(absl::Time instant, const Zone &zone) {
		const absl::TimeZone::CivilInfo info = zone.tz().At(instant);
		return format_civil(info.cs) + format_offset(info.offset);
	}

	std::string formatLocalTime(const LocalDateTime &local) {
		return format_civil(local);
	}

	int64_t toEpochMs(absl::Time instant) {
		return absl::ToUnixMillis(instant);
	}

} // namespace TzBucket::core
