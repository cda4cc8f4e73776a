// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <boost/filesystem/path.hpp>

class LineParser;

class ConfigParser {
public:
	virtual ~ConfigParser() noexcept = default;

	/**
	 * Handle a line before ParseLine() sees it.  Returns true if
	 * the line has been consumed.
	 */
	virtual bool PreParseLine(LineParser &line);

	virtual void ParseLine(LineParser &line) = 0;

	/**
	 * Called at the end of the file.
	 */
	virtual void Finish() {}
};

/**
 * A #ConfigParser which ignores empty lines and lines starting with
 * '#'.
 */
class CommentConfigParser final : public ConfigParser {
	ConfigParser &child;

public:
	explicit CommentConfigParser(ConfigParser &_child) noexcept
		:child(_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;
};

/**
 * A #ConfigParser which can "include" other files.  Relative paths
 * are resolved relative to the including file.
 */
class IncludeConfigParser final : public ConfigParser {
	const boost::filesystem::path path;

	ConfigParser &child;

	/**
	 * Does our Finish() override call child.Finish()?  Included
	 * files must not finish the child, only the top-level file
	 * does.
	 */
	const bool finish_child;

public:
	IncludeConfigParser(boost::filesystem::path &&_path,
			    ConfigParser &_child,
			    bool _finish_child=true) noexcept
		:path(std::move(_path)), child(_child),
		 finish_child(_finish_child) {}

	/* virtual methods from class ConfigParser */
	bool PreParseLine(LineParser &line) override;
	void ParseLine(LineParser &line) override;
	void Finish() override;

private:
	void IncludePath(boost::filesystem::path &&p);
	void IncludeOptionalPath(boost::filesystem::path &&p);
};

/**
 * Feed all lines of the given file into the parser and call
 * ConfigParser::Finish().  Errors are wrapped in an exception
 * carrying the path and the line number.
 */
void
ParseConfigFile(const boost::filesystem::path &path, ConfigParser &parser);
