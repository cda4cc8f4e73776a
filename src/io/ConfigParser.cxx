// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ConfigParser.hxx"
#include "LineParser.hxx"
#include "util/FmtError.hxx"

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <string>

#include <errno.h>
#include <string.h>

namespace fs = boost::filesystem;

bool
ConfigParser::PreParseLine(LineParser &)
{
	return false;
}

bool
CommentConfigParser::PreParseLine(LineParser &line)
{
	if (child.PreParseLine(line))
		return true;

	if (line.front() == '#' || line.IsEnd())
		/* ignore empty lines and comments */
		return true;

	return ConfigParser::PreParseLine(line);
}

void
CommentConfigParser::ParseLine(LineParser &line)
{
	child.ParseLine(line);
}

void
CommentConfigParser::Finish()
{
	child.Finish();
	ConfigParser::Finish();
}

bool
IncludeConfigParser::PreParseLine(LineParser &line)
{
	return child.PreParseLine(line);
}

void
IncludeConfigParser::ParseLine(LineParser &line)
{
	if (line.SkipWord("include")) {
		const char *p = line.NextUnescape();
		if (p == nullptr)
			throw LineParser::Error("Quoted path expected");

		line.ExpectEnd();

		IncludePath(p);
	} else if (line.SkipWord("include_optional")) {
		const char *p = line.NextUnescape();
		if (p == nullptr)
			throw LineParser::Error("Quoted path expected");

		line.ExpectEnd();

		IncludeOptionalPath(p);
	} else
		child.ParseLine(line);
}

void
IncludeConfigParser::Finish()
{
	if (finish_child)
		child.Finish();
}

static fs::path
ApplyPath(const fs::path &base, fs::path &&p)
{
	if (p.is_absolute())
		/* is already absolute */
		return std::move(p);

	return base.parent_path() / p;
}

static void
ParseConfigStream(const fs::path &path, std::istream &is,
		  ConfigParser &parser)
{
	std::string buffer;
	unsigned i = 1;
	while (std::getline(is, buffer)) {
		LineParser line_parser(buffer.data());

		try {
			if (!parser.PreParseLine(line_parser))
				parser.ParseLine(line_parser);
		} catch (...) {
			std::throw_with_nested(LineParser::Error(path.string() + ':' + std::to_string(i)));
		}

		++i;
	}
}

static void
ParseConfigFile(const fs::path &path, fs::ifstream &file,
		ConfigParser &parser)
{
	ParseConfigStream(path, file, parser);

	if (file.bad())
		throw FmtRuntimeError("Failed to read {}", path.string());
}

inline void
IncludeConfigParser::IncludePath(fs::path &&p)
{
	IncludeConfigParser sub(ApplyPath(path, std::move(p)), child, false);
	ParseConfigFile(sub.path, sub);
}

inline void
IncludeConfigParser::IncludeOptionalPath(fs::path &&p)
{
	IncludeConfigParser sub(ApplyPath(path, std::move(p)), child, false);

	fs::ifstream file(sub.path);
	if (!file.is_open()) {
		const int e = errno;
		switch (e) {
		case ENOENT:
		case ENOTDIR:
			/* silently ignore this error */
			return;

		default:
			throw FmtRuntimeError("Failed to open {}: {}",
					      sub.path.string(), strerror(e));
		}
	}

	ParseConfigFile(sub.path, file, sub);
	sub.Finish();
}

void
ParseConfigFile(const fs::path &path, ConfigParser &parser)
{
	fs::ifstream file(path);
	if (!file.is_open())
		throw FmtRuntimeError("Failed to open {}: {}",
				      path.string(), strerror(errno));

	ParseConfigFile(path, file, parser);
	parser.Finish();
}
