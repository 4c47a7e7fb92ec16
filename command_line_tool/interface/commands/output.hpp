// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#ifndef TZBUCKET_CMD_OUTPUT_HPP
#define TZBUCKET_CMD_OUTPUT_HPP

#include <cstdio>
#include <memory>
#include <string>

namespace TzBucket::cmd::interface
{

/**
 * @brief Destination for command results
 *
 * Results are written line by line. A write failure is sticky and reported
 * through good().
 */
class Output
{
  public:
	virtual ~Output() = default;
	virtual void write_line(const std::string &line) = 0;
	virtual void flush() = 0;
	virtual bool good() const = 0;
	virtual bool is_stdout() const = 0;
};

/**
 * @brief Output to stdout or to a file owned by this object
 */
class FileOutput : public Output
{
  public:
	explicit FileOutput(FILE *f, bool is_stdout) : m_file(f), m_is_stdout(is_stdout) {}
	~FileOutput() override;

	FileOutput(const FileOutput &) = delete;
	FileOutput &operator=(const FileOutput &) = delete;

	void write_line(const std::string &line) override;
	void flush() override;
	bool good() const override { return !m_failed; }
	bool is_stdout() const override { return m_is_stdout; }

  private:
	FILE *m_file;
	bool m_is_stdout;
	bool m_failed = false;
};

/**
 * @brief Create an Output instance for the given path
 *
 * @param path Output path ("" or "-" for stdout), truncated if it exists
 * @return Output instance, or nullptr if the file cannot be opened
 */
std::unique_ptr<Output> create_output(const std::string &path);

} // namespace TzBucket::cmd::interface

#endif // TZBUCKET_CMD_OUTPUT_HPP
