// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef _tzbucket_cmd_interface_HEADER__
#define _tzbucket_cmd_interface_HEADER__

#include "CLI/App.hpp"		  // IWYU pragma: export
#include "CLI/Config.hpp"	  // IWYU pragma: export
#include "CLI/Formatter.hpp"  // IWYU pragma: export
#include "CLI/Validators.hpp" // IWYU pragma: export
#include <CLI/Error.hpp>	  // IWYU pragma: export
#include <CLI/Option.hpp>	  // IWYU pragma: export

#include <iostream>
#include <mutex>
#include <string>
#include <utility>

typedef void (*init_fn)(void);
#define COMMAND_INIT(func) \
	__attribute__((retain, used, section("tzbucket_cmdinit"))) static init_fn _init_##func##_ptr = func

namespace TzBucket::cmd::interface
{
using MainAppHandle = std::pair<CLI::App &, std::unique_lock<std::mutex>>;
MainAppHandle acquireMainApp(void);

// Environment variable read as fallback for -t/--tz
inline constexpr const char *tz_env_name = "TZBUCKET_TZ";

enum class Verbosity { quiet, normal, verbose };

Verbosity get_verbosity(void);
void set_verbosity(Verbosity level);

inline bool is_verbose(void)
{
	return get_verbosity() == Verbosity::verbose;
}

inline bool is_quiet(void)
{
	return get_verbosity() == Verbosity::quiet;
}

// stdout carries results only, all diagnostics go to stderr

template <typename... Args> void log_info(Args &&...args) // hidden in quiet mode
{
	if (!is_quiet()) {
		(std::cerr << ... << std::forward<Args>(args)) << std::endl;
	}
}

template <typename... Args> void log_verbose(Args &&...args) // only in verbose mode
{
	if (is_verbose()) {
		(std::cerr << ... << std::forward<Args>(args)) << std::endl;
	}
}

template <typename... Args> void log_error(Args &&...args) // always shown
{
	(std::cerr << ... << std::forward<Args>(args)) << std::endl;
}

bool is_interrupted(void);
void reset_interrupt(void);
void install_signal_handlers(void);

const std::string &get_current_output_file(void);
void set_current_output_file(const std::string &path);
void clear_current_output_file(void);

// RAII guard for output file cleanup on interrupt
class OutputFileGuard
{
  public:
	explicit OutputFileGuard(const std::string &path) { set_current_output_file(path); }
	~OutputFileGuard() { clear_current_output_file(); }

	OutputFileGuard(const OutputFileGuard &) = delete;
	OutputFileGuard &operator=(const OutputFileGuard &) = delete;
};

} // namespace TzBucket::cmd::interface

#endif
