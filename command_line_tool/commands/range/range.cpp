// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TzBucket/core/Bucket.hpp"
#include "TzBucket/core/Timestamp.hpp"
#include "commands/error.hpp"
#include "commands/interface.hpp"
#include "commands/output.hpp"
#include "commands/render.hpp"
#include <string>
#include <vector>

using namespace std::string_literals;

using namespace TzBucket::cmd::interface;
namespace core = TzBucket::core;

static absl::Time parse_bound(const std::string &text, const char *which)
{
	try {
		return core::parseTimestamp(text, core::TimestampFormat::Rfc3339);
	} catch (const core::exception::ParseError &e) {
		TZBUCKET_THROW(core::exception::ParseError,
					   "Invalid "s + which + " timestamp: " + e.what());
	}
}

static void print_range(const std::vector<core::Bucket> &buckets, const std::string &output_path,
						OutputFormat format)
{
	const bool to_stdout = output_path.empty() || output_path == "-";
	OutputFileGuard output_guard(to_stdout ? ""s : output_path);
	const auto output = create_output(output_path);
	if (!output)
		fail(make_io_report("Failed to open output file '" + output_path + "'"), format);

	switch (format) {
	case OutputFormat::json:
		output->write_line(to_json(buckets));
		break;
	case OutputFormat::text:
		for (const auto &bucket : buckets)
			output->write_line(to_text(bucket));
		break;
	}

	output->flush();
	if (!output->good())
		fail(make_io_report("Failed to write output to '" + (to_stdout ? "stdout"s : output_path) +
							"'"),
			 format);
}

static void add_range_command(CLI::App &app)
{
	CLI::App *const command =
		app.add_subcommand("range", "List all buckets overlapping a UTC time range");
	command->description(
		"Print every day, week or month bucket that overlaps [start, end).\n"
		"Both bounds are RFC 3339 timestamps with an explicit UTC offset.");

	static std::string tz{};
	command->add_option("--tz,-t", tz, "IANA timezone name, e.g. Europe/Berlin")
		->envname(tz_env_name)
		->required()
		->type_name("ZONE");

	static std::string interval{"day"};
	command->add_option("--interval,-i", interval, "Bucket interval: day, week, month")
		->capture_default_str()
		->type_name("INTERVAL");

	static std::string week_start{"monday"};
	command->add_option("--week-start", week_start, "First day of a week bucket: monday, sunday")
		->capture_default_str()
		->type_name("DAY");

	static std::string start{};
	command->add_option("--start", start, "Range start (inclusive), RFC 3339")
		->required()
		->type_name("TIMESTAMP");

	static std::string end{};
	command->add_option("--end", end, "Range end (exclusive), RFC 3339")
		->required()
		->type_name("TIMESTAMP");

	static std::string output_format{"json"};
	command->add_option("--output-format", output_format, "Output format: json, text")
		->capture_default_str()
		->type_name("FORMAT");

	static std::string output_file{};
	command->add_option("--output,-o", output_file, "Write results to FILE instead of stdout")
		->type_name("FILE");

	command->callback([&]() {
		const OutputFormat rendering = resolve_output_format(output_format);
		try {
			const core::Zone zone = core::parseZone(tz);
			log_verbose("Using timezone ", zone.name());
			const core::Interval parsed_interval = core::parseInterval(interval);
			const core::WeekStart parsed_week_start = core::parseWeekStart(week_start);
			const absl::Time range_start = parse_bound(start, "start");
			const absl::Time range_end = parse_bound(end, "end");

			const auto buckets = core::enumerateBuckets(range_start, range_end, zone,
														parsed_interval, parsed_week_start);
			log_verbose("Found ", buckets.size(), " bucket(s)");
			print_range(buckets, output_file, rendering);
		} catch (const core::exception::Exception &e) {
			log_verbose("thrown at ", e.where());
			fail(make_report(e), rendering);
		}
	});
}

static void init_function() noexcept
{
	auto [app, lock] = TzBucket::cmd::interface::acquireMainApp();
	add_range_command(app);
}
COMMAND_INIT(init_function);
