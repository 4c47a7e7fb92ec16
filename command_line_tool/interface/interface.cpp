// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/interface.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <string>

namespace TzBucket::cmd::interface
{

// ============================================================================
// Verbosity Control
// ============================================================================

static Verbosity g_verbosity = Verbosity::normal;

Verbosity get_verbosity(void)
{
	return g_verbosity;
}

void set_verbosity(Verbosity level)
{
	g_verbosity = level;
}

// ============================================================================
// Signal Handling
// ============================================================================

static std::atomic<bool> g_interrupted{false};
static std::string g_current_output_file{};

static void signal_handler(int /*signum*/)
{
	g_interrupted.store(true, std::memory_order_release);
}

bool is_interrupted(void)
{
	return g_interrupted.load(std::memory_order_acquire);
}

void reset_interrupt(void)
{
	g_interrupted.store(false, std::memory_order_release);
}

void install_signal_handlers(void)
{
	std::signal(SIGINT, signal_handler);
	std::signal(SIGTERM, signal_handler);
}

// ============================================================================
// Partial Output Tracking
// ============================================================================

const std::string &get_current_output_file(void)
{
	return g_current_output_file;
}

void set_current_output_file(const std::string &path)
{
	g_current_output_file = path;
}

void clear_current_output_file(void)
{
	// an interrupted run leaves no half-written result file behind
	if (is_interrupted() && !g_current_output_file.empty()) {
		std::error_code ec;
		std::filesystem::remove(g_current_output_file, ec);
		if (ec) {
			log_error("Failed to remove partial output file ", g_current_output_file, ": ",
					  ec.message());
		}
	}
	g_current_output_file.clear();
}

} // namespace TzBucket::cmd::interface
