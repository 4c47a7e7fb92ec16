// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TzBucket/core/Resolver.hpp"
#include "commands/error.hpp"
#include "commands/interface.hpp"
#include "commands/render.hpp"
#include <iostream>
#include <string>

using namespace TzBucket::cmd::interface;
namespace core = TzBucket::core;

static void add_explain_command(CLI::App &app)
{
	CLI::App *const command =
		app.add_subcommand("explain", "Explain how a local wall-clock time maps to UTC");
	command->description(
		"Classify a local time as normal, ambiguous (DST fall back) or nonexistent\n"
		"(DST spring forward) and resolve it with the selected policy.");

	static std::string tz{};
	command->add_option("--tz,-t", tz, "IANA timezone name, e.g. Europe/Berlin")
		->envname(tz_env_name)
		->required()
		->type_name("ZONE");

	static std::string local{};
	command->add_option("--local", local, "Local time, YYYY-MM-DDTHH:MM[:SS]")
		->required()
		->type_name("DATETIME");

	static std::string policy_nonexistent{"error"};
	command
		->add_option("--policy-nonexistent", policy_nonexistent,
					 "Handling of skipped times: error, shift_forward")
		->capture_default_str()
		->type_name("POLICY");

	static std::string policy_ambiguous{"error"};
	command
		->add_option("--policy-ambiguous", policy_ambiguous,
					 "Handling of repeated times: error, first, second")
		->capture_default_str()
		->type_name("POLICY");

	static std::string output_format{"json"};
	command->add_option("--output-format", output_format, "Output format: json, text")
		->capture_default_str()
		->type_name("FORMAT");

	command->callback([&]() {
		const OutputFormat rendering = resolve_output_format(output_format);
		try {
			const core::Zone zone = core::parseZone(tz);
			const auto nonexistent = core::parseNonexistentPolicy(policy_nonexistent);
			const auto ambiguous = core::parseAmbiguousPolicy(policy_ambiguous);
			const core::ExplainResult result =
				core::explainLocalTime(local, zone, nonexistent, ambiguous);
			log_verbose(result.local_time, " in ", result.tz, " is ",
						core::toString(result.status));

			switch (rendering) {
			case OutputFormat::json:
				std::cout << to_json(result) << std::endl;
				break;
			case OutputFormat::text:
				std::cout << to_text(result) << std::flush;
				break;
			}
		} catch (const core::exception::Exception &e) {
			log_verbose("thrown at ", e.where());
			fail(make_report(e), rendering);
		}
	});
}

static void init_function() noexcept
{
	auto [app, lock] = TzBucket::cmd::interface::acquireMainApp();
	add_explain_command(app);
}
COMMAND_INIT(init_function);
