// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/output.hpp"

namespace TzBucket::cmd::interface
{

FileOutput::~FileOutput()
{
	if (m_is_stdout)
		std::fflush(m_file);
	else
		std::fclose(m_file);
}

void FileOutput::write_line(const std::string &line)
{
	if (m_failed)
		return;
	if (std::fwrite(line.data(), 1, line.size(), m_file) != line.size() ||
		std::fputc('\n', m_file) == EOF)
		m_failed = true;
}

void FileOutput::flush()
{
	if (std::fflush(m_file) != 0 || std::ferror(m_file))
		m_failed = true;
}

std::unique_ptr<Output> create_output(const std::string &path)
{
	const bool use_stdout = path.empty() || path == "-";

	FILE *f = use_stdout ? stdout : std::fopen(path.c_str(), "w");
	if (!f) {
		return nullptr;
	}
	return std::make_unique<FileOutput>(f, use_stdout);
}

} // namespace TzBucket::cmd::interface
