// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ReferenceTableBuilder.hxx"
#include "io/ConfigParser.hxx"
#include "Logger.hxx"

#include <boost/filesystem/path.hpp>

/**
 * Parses a reference table definition file.  See LoadReferenceTable()
 * for the syntax.
 */
class ReferenceConfigParser final : public ConfigParser, Logger {
	ReferenceTableBuilder builder;

	unsigned n_references = 0;

public:
	explicit ReferenceConfigParser(std::string_view name) noexcept
		:builder(name) {}

	/**
	 * Build the table.  Call only after Finish().
	 */
	ReferenceTable Build() const {
		return builder.Build();
	}

	/* virtual methods from class ConfigParser */
	void ParseLine(LineParser &line) override;
	void Finish() override;

private:
	void ParseSyntax(LineParser &line);
	void ParseValidator(LineParser &line);
	void ParseCanonical(LineParser &line);
	void ParseReference(LineParser &line);
	void ParseAlias(LineParser &line);
	void ParseLevel(LineParser &line);

	/* virtual methods from class Logger */
	std::string MakeLogName() const noexcept override;
};

/**
 * Load a custom reference table from a configuration file:
 *
 *     # comment
 *     syntax html|xml
 *     validator none|xml10|xml11
 *     canonical shortest|first
 *     reference "&amp;" U+0026 [U+XXXX]
 *     alias "&AMP;"
 *     level default|above|U+XXXX[-U+XXXX] N
 *     include "other.conf"
 *     include_optional "other.conf"
 *
 * Throws on error (nested with the file name and line number).
 */
ReferenceTable
LoadReferenceTable(const boost::filesystem::path &path);
