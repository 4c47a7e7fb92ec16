// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/error.hpp"
#include "commands/interface.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

using namespace std::string_literals;

namespace TzBucket::cmd::interface
{

OutputFormat parse_output_format(const std::string &value)
{
	if (boost::algorithm::iequals(value, "json"))
		return OutputFormat::json;
	if (boost::algorithm::iequals(value, "text"))
		return OutputFormat::text;
	TZBUCKET_THROW(core::exception::ParseError,
				   "Invalid output_format '"s + value + "'. Expected: json, text");
}

OutputFormat output_format_hint(const std::string &value) noexcept
{
	return boost::algorithm::iequals(value, "json") ? OutputFormat::json : OutputFormat::text;
}

ErrorReport make_report(const core::exception::Exception &e)
{
	ErrorReport report{e.what(), core::exception::exitCodeFor(e.kind()), std::nullopt};
	if (const auto *policy = dynamic_cast<const core::exception::PolicyError *>(&e))
		report.status = policy->status();
	return report;
}

ErrorReport make_report(const core::exception::Exception &e, const std::string &prefix)
{
	ErrorReport report = make_report(e);
	report.message = prefix + report.message;
	return report;
}

ErrorReport make_io_report(const std::string &message)
{
	return {message, exit_runtime_error, std::nullopt};
}

std::string format_error(const ErrorReport &report, OutputFormat format)
{
	switch (format) {
	case OutputFormat::text:
		return "Error: " + report.message;
	case OutputFormat::json:
		break;
	}

	rapidjson::Document doc;
	doc.SetObject();
	auto &allocator = doc.GetAllocator();

	rapidjson::Value error;
	error.SetString(report.message.c_str(), allocator);
	doc.AddMember("error", error, allocator);
	doc.AddMember("exit_code", rapidjson::Value(report.exit_code), allocator);
	if (report.status) {
		rapidjson::Value status;
		status.SetString(report.status->c_str(), allocator);
		doc.AddMember("status", status, allocator);
	}

	rapidjson::StringBuffer buffer;
	rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
	doc.Accept(writer);
	return buffer.GetString();
}

void fail(const ErrorReport &report, OutputFormat format)
{
	log_error(format_error(report, format));
	throw CLI::RuntimeError(report.exit_code);
}

OutputFormat resolve_output_format(const std::string &value)
{
	try {
		return parse_output_format(value);
	} catch (const core::exception::Exception &e) {
		fail(make_report(e), output_format_hint(value));
	}
}

} // namespace TzBucket::cmd::interface
