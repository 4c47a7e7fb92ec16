// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TZBUCKET_CORE_COMMON_HEADER
#define TZBUCKET_CORE_COMMON_HEADER

#if defined(__GNUC__) || defined(__clang__)
	#define TZBUCKET_EXPORT __attribute__((visibility("default")))
#else
	#define TZBUCKET_EXPORT
#endif

#include <exception>
#include <string>

namespace TzBucket::core::exception {
	enum class Kind { InvalidTimezone, Parse, Policy, InvalidRange, Runtime };

	struct TZBUCKET_EXPORT Exception : public std::exception {
		Exception(Kind kind, const std::string &msg, const char *file, unsigned long line)
			: m_kind(kind), m_message(msg), m_where(std::string(file) + ":" + std::to_string(line)) {}
		const char *what() const noexcept override { return m_message.c_str(); }
		Kind kind() const noexcept { return m_kind; }
		// throw site, for verbose diagnostics only
		const std::string &where() const noexcept { return m_where; }

	  private:
		Kind m_kind;
		std::string m_message;
		std::string m_where;
	};
	struct TZBUCKET_EXPORT InvalidTimezoneError : public Exception {
		InvalidTimezoneError(const std::string &name, const char *file, unsigned long line)
			: Exception(Kind::InvalidTimezone, "Invalid timezone: " + name, file, line) {}
	};
	struct TZBUCKET_EXPORT ParseError : public Exception {
		ParseError(const std::string &msg, const char *file, unsigned long line)
			: Exception(Kind::Parse, msg, file, line) {}
	};
	struct TZBUCKET_EXPORT PolicyError : public Exception {
		PolicyError(const std::string &msg, const char *status, const char *file, unsigned long line)
			: Exception(Kind::Policy, msg, file, line), m_status(status) {}
		// "ambiguous" or "nonexistent"
		const std::string &status() const noexcept { return m_status; }

	  private:
		std::string m_status;
	};
	struct TZBUCKET_EXPORT InvalidRangeError : public Exception {
		InvalidRangeError(const std::string &msg, const char *file, unsigned long line)
			: Exception(Kind::InvalidRange, "Invalid range: " + msg, file, line) {}
	};
	struct TZBUCKET_EXPORT RuntimeError : public Exception {
		RuntimeError(const std::string &msg, const char *file, unsigned long line)
			: Exception(Kind::Runtime, msg, file, line) {}
	};
#define TZBUCKET_THROW(TYPE, ...) throw TYPE(__VA_ARGS__, __FILE__, __LINE__)

	// process exit code: 2 for bad input, 3 for failures while computing
	constexpr int exitCodeFor(Kind kind) noexcept {
		switch (kind) {
		case Kind::InvalidTimezone:
		case Kind::Parse:
		case Kind::Policy:
		case Kind::InvalidRange:
			return 2;
		case Kind::Runtime:
			return 3;
		}
		return 3;
	}

} // namespace TzBucket::core::exception
#endif
