// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TZBUCKET_CMD_INPUT_HPP
#define TZBUCKET_CMD_INPUT_HPP

#include <fstream>
#include <istream>
#include <memory>
#include <string>

namespace TzBucket::cmd::interface
{

/**
 * @brief Line source for the bucket command, stdin or a file
 */
class LineInput
{
  public:
	// "-" reads stdin; throws nothing, check is_open()
	explicit LineInput(const std::string &path);

	LineInput(const LineInput &) = delete;
	LineInput &operator=(const LineInput &) = delete;

	bool is_open() const { return m_stream != nullptr; }
	const std::string &path() const { return m_path; }

	// false at end of input or on a read error, see failed()
	bool next_line(std::string &line);
	bool failed() const;

  private:
	std::string m_path;
	std::unique_ptr<std::ifstream> m_file{};
	std::istream *m_stream = nullptr;
};

} // namespace TzBucket::cmd::interface

#endif // TZBUCKET_CMD_INPUT_HPP
