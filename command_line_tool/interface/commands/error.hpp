// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TZBUCKET_CMD_ERROR_HPP
#define TZBUCKET_CMD_ERROR_HPP

#include "TzBucket/core/Common.hpp"
#include <optional>
#include <string>

namespace TzBucket::cmd::interface
{

constexpr int exit_success = 0;
constexpr int exit_input_error = 2;
constexpr int exit_runtime_error = 3;

enum class OutputFormat { text, json };

// case-insensitive "text" or "json", anything else throws core::exception::ParseError
OutputFormat parse_output_format(const std::string &value);

// format used to report an invalid --output-format value
OutputFormat output_format_hint(const std::string &value) noexcept;

/**
 * @brief Everything needed to report a failed command
 *
 * status is only set for policy rejections ("ambiguous" / "nonexistent").
 */
struct ErrorReport {
	std::string message;
	int exit_code;
	std::optional<std::string> status;
};

ErrorReport make_report(const core::exception::Exception &e);
ErrorReport make_report(const core::exception::Exception &e, const std::string &prefix);
ErrorReport make_io_report(const std::string &message);

// text: "Error: <message>", json: pretty {"error","exit_code","status"?}
std::string format_error(const ErrorReport &report, OutputFormat format);

// print the report to stderr and abort the running subcommand with its exit code
[[noreturn]] void fail(const ErrorReport &report, OutputFormat format);

// parse_output_format, failing the subcommand with an error rendered per output_format_hint
OutputFormat resolve_output_format(const std::string &value);

} // namespace TzBucket::cmd::interface

#endif // TZBUCKET_CMD_ERROR_HPP
