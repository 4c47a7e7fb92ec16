// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TzBucket/version.gen.h"
#include "commands/error.hpp"
#include "commands/interface.hpp"
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

using namespace TzBucket::cmd::interface;

static void set_quiet(void)
{
	set_verbosity(Verbosity::quiet);
}

static void set_verbose(void)
{
	set_verbosity(Verbosity::verbose);
}

static void print_version(void)
{
	std::cout << "tzbucket " TZBUCKET_VERSION_STR << std::endl;
	throw CLI::Success();
}

static std::unique_ptr<CLI::App> createMainApp(void)
{
	auto app = std::make_unique<CLI::App>();
	app->name("tzbucket");
	app->description("tzbucket - DST-safe day, week and month bucketing of timestamps in IANA "
					 "timezones");

	auto *const quiet = app->add_flag_callback(
		"--quiet,-q", set_quiet, "Quiet mode: only show error messages, hide info messages");

	auto *const verbose = app->add_flag_callback(
		"--verbose,-v", set_verbose, "Verbose mode: show detailed progress and info messages");

	quiet->excludes(verbose);

	auto *const version =
		app->add_flag_callback("-V,--version", print_version, "Print version information and exit");

	version->excludes(quiet);
	version->excludes(verbose);

	app->set_config("--config", "", "Read options from an INI or TOML file");

	app->require_subcommand(0, 1);

	return app;
}

TzBucket::cmd::interface::MainAppHandle TzBucket::cmd::interface::acquireMainApp(void)
{
	static auto mainApp = createMainApp();
	static std::mutex mainAppLock{};
	return {*mainApp, std::unique_lock{mainAppLock}};
}

void call_all_init_functions(void)
{
	extern init_fn __start_tzbucket_cmdinit;
	extern init_fn __stop_tzbucket_cmdinit;
	for (init_fn *p = &__start_tzbucket_cmdinit; p < &__stop_tzbucket_cmdinit; p++) {
		(*p)();
	}
}

int main(int argc, const char **argv)
{
	install_signal_handlers();
	call_all_init_functions();
	auto [app, lock] = acquireMainApp();
	if (argc == 1) {
		std::cout << app.help() << std::endl;
		return exit_success;
	}
	try {
		app.parse(argc, argv);
	} catch (const CLI::RuntimeError &e) {
		// subcommands have already reported the failure
		return e.get_exit_code();
	} catch (const CLI::ParseError &e) {
		// usage errors are input errors, --help and --version exit cleanly
		const int code = app.exit(e);
		return code == 0 ? exit_success : exit_input_error;
	}
	return exit_success;
}
