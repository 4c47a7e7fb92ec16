// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "TzBucket/core/Bucket.hpp"
#include "TzBucket/core/Timestamp.hpp"
#include "commands/error.hpp"
#include "commands/input.hpp"
#include "commands/interface.hpp"
#include "commands/output.hpp"
#include "commands/render.hpp"
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <optional>
#include <string>

using namespace std::string_literals;

using namespace TzBucket::cmd::interface;
namespace core = TzBucket::core;

struct BucketSettings {
	core::Interval interval;
	core::WeekStart week_start;
	std::optional<core::TimestampFormat> format;
	OutputFormat output_format;
	bool continue_on_error;
};

static std::optional<core::TimestampFormat> parse_input_format(const std::string &value)
{
	if (boost::algorithm::iequals(value, "auto"))
		return std::nullopt;
	return core::parseTimestampFormat(value);
}

static core::BucketResult process_line(const std::string &line, const core::Zone &zone,
									   const BucketSettings &settings)
{
	const absl::Time instant = settings.format ? core::parseTimestamp(line, *settings.format)
											   : core::parseTimestampAuto(line);
	core::BucketResult result;
	result.input = core::InputTimestamp{line, core::toEpochMs(instant)};
	result.tz = zone.name();
	result.interval = settings.interval;
	result.bucket = core::computeBucket(instant, zone, settings.interval, settings.week_start);
	return result;
}

static void bucket_lines(const std::string &input_path, const std::string &output_path,
						 const core::Zone &zone, const BucketSettings &settings)
{
	LineInput input(input_path);
	if (!input.is_open())
		fail(make_io_report("Failed to open file '" + input_path + "'"), settings.output_format);

	const bool to_stdout = output_path.empty() || output_path == "-";
	OutputFileGuard output_guard(to_stdout ? ""s : output_path);
	const auto output = create_output(output_path);
	if (!output)
		fail(make_io_report("Failed to open output file '" + output_path + "'"),
			 settings.output_format);

	size_t processed = 0;
	size_t failed = 0;
	int worst_exit_code = exit_success;

	std::string raw;
	while (!is_interrupted() && input.next_line(raw)) {
		const std::string line = core::trim(raw);
		if (line.empty())
			continue;

		try {
			const core::BucketResult result = process_line(line, zone, settings);
			switch (settings.output_format) {
			case OutputFormat::json:
				output->write_line(to_json_line(result));
				break;
			case OutputFormat::text:
				output->write_line(to_text(result));
				break;
			}
			processed++;
		} catch (const core::exception::Exception &e) {
			const ErrorReport report = make_report(e, "Error processing '" + line + "': ");
			log_verbose("thrown at ", e.where());
			if (!settings.continue_on_error)
				fail(report, settings.output_format);
			log_error(format_error(report, settings.output_format));
			failed++;
			worst_exit_code = std::max(worst_exit_code, report.exit_code);
		}
	}

	if (is_interrupted())
		fail(make_io_report("Interrupted, partial output discarded"), settings.output_format);
	if (input.failed())
		fail(make_io_report("Failed to read line from '" + input_path + "'"),
			 settings.output_format);

	output->flush();
	if (!output->good())
		fail(make_io_report("Failed to write output to '" +
							(to_stdout ? "stdout"s : output_path) + "'"),
			 settings.output_format);

	log_verbose("Bucketed ", processed, " timestamp(s), ", failed, " failed");
	if (failed > 0) {
		log_info(failed, " line(s) could not be processed");
		throw CLI::RuntimeError(worst_exit_code);
	}
}

static void add_bucket_command(CLI::App &app)
{
	CLI::App *const command = app.add_subcommand("bucket", "Assign timestamps to calendar buckets");
	command->description(
		"Read one timestamp per line and print the day, week or month bucket it falls into.\n"
		"Bucket boundaries are local midnights of the given timezone, so days around DST\n"
		"transitions last 23 or 25 hours.");

	static std::string tz{"UTC"};
	command->add_option("--tz,-t", tz, "IANA timezone name, e.g. Europe/Berlin")
		->envname(tz_env_name)
		->capture_default_str()
		->type_name("ZONE");

	static std::string interval{"day"};
	command->add_option("--interval,-i", interval, "Bucket interval: day, week, month")
		->capture_default_str()
		->type_name("INTERVAL");

	static std::string week_start{"monday"};
	command->add_option("--week-start", week_start, "First day of a week bucket: monday, sunday")
		->capture_default_str()
		->type_name("DAY");

	static std::string format{"epoch_ms"};
	command
		->add_option("--format,-f", format,
					 "Input timestamp format: epoch_ms, epoch_s, rfc3339, auto")
		->capture_default_str()
		->type_name("FORMAT");

	static std::string output_format{"text"};
	command->add_option("--output-format", output_format, "Output format: text, json")
		->capture_default_str()
		->type_name("FORMAT");

	static std::string input_file{"-"};
	command->add_option("--input", input_file, "Input file with one timestamp per line, - for stdin")
		->capture_default_str()
		->type_name("FILE");

	static bool from_stdin = false;
	command->add_flag("--stdin", from_stdin, "Read timestamps from stdin");

	static std::string output_file{};
	command->add_option("--output,-o", output_file, "Write results to FILE instead of stdout")
		->type_name("FILE");

	static bool continue_on_error = false;
	command->add_flag("--continue-on-error", continue_on_error,
					  "Report unparsable lines and keep going");

	command->callback([&]() {
		const OutputFormat rendering = resolve_output_format(output_format);
		try {
			const core::Zone zone = core::parseZone(tz);
			log_verbose("Using timezone ", zone.name());
			const BucketSettings settings{core::parseInterval(interval),
										  core::parseWeekStart(week_start),
										  parse_input_format(format), rendering, continue_on_error};
			bucket_lines(from_stdin ? "-"s : input_file, output_file, zone, settings);
		} catch (const core::exception::Exception &e) {
			log_verbose("thrown at ", e.where());
			fail(make_report(e), rendering);
		}
	});
}

static void init_function() noexcept
{
	auto [app, lock] = TzBucket::cmd::interface::acquireMainApp();
	add_bucket_command(app);
}
COMMAND_INIT(init_function);
