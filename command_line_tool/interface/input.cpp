// Copyright (c) 2024, International Business Machines
// SPDX-License-Identifier: BSD-2-Clause-Patent

#include "commands/input.hpp"
#include <iostream>

namespace TzBucket::cmd::interface
{

LineInput::LineInput(const std::string &path) : m_path(path)
{
	if (path == "-") {
		m_stream = &std::cin;
		return;
	}
	m_file = std::make_unique<std::ifstream>(path);
	if (m_file->is_open())
		m_stream = m_file.get();
}

bool LineInput::next_line(std::string &line)
{
	if (m_stream == nullptr)
		return false;
	return static_cast<bool>(std::getline(*m_stream, line));
}

bool LineInput::failed() const
{
	// eof sets failbit too, only badbit is a real read failure
	return m_stream == nullptr || m_stream->bad();
}

} // namespace TzBucket::cmd::interface
