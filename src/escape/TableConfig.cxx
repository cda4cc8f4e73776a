// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "TableConfig.hxx"
#include "HTML.hxx"
#include "XML.hxx"
#include "io/LineParser.hxx"
#include "util/FmtError.hxx"
#include "util/UTF16.hxx"

#include <string.h>
#include <stdlib.h>

std::string
ReferenceConfigParser::MakeLogName() const noexcept
{
	return "table " + builder.GetName();
}

/**
 * Parse a codepoint in the form "U+0041".
 */
static char32_t
ParseCodepoint(const char *s)
{
	if (s[0] != 'U' || s[1] != '+')
		throw FmtRuntimeError("Codepoint expected: {}", s);

	char *endptr;
	const unsigned long value = strtoul(s + 2, &endptr, 16);
	if (endptr == s + 2 || *endptr != 0)
		throw FmtRuntimeError("Malformed codepoint: {}", s);

	if (value > MAX_CODEPOINT)
		throw FmtRuntimeError("Codepoint out of range: {}", s);

	return char32_t(value);
}

static ReferenceTable::Level
ParseLevelValue(LineParser &line)
{
	const unsigned value = line.NextUnsigned();
	if (value > UINT_LEAST8_MAX)
		throw FmtRuntimeError("Level {} is too large", value);

	return ReferenceTable::Level(value);
}

inline void
ReferenceConfigParser::ParseSyntax(LineParser &line)
{
	const char *value = line.ExpectValueAndEnd();
	if (strcmp(value, "html") == 0)
		builder.SetSyntax(html_reference_syntax);
	else if (strcmp(value, "xml") == 0)
		builder.SetSyntax({});
	else
		throw FmtRuntimeError("Unknown syntax: {}", value);
}

inline void
ReferenceConfigParser::ParseValidator(LineParser &line)
{
	const char *value = line.ExpectValueAndEnd();
	if (strcmp(value, "none") == 0)
		builder.SetValidator(nullptr);
	else if (strcmp(value, "xml10") == 0)
		builder.SetValidator(IsValidXml10);
	else if (strcmp(value, "xml11") == 0)
		builder.SetValidator(IsValidXml11);
	else
		throw FmtRuntimeError("Unknown validator: {}", value);
}

inline void
ReferenceConfigParser::ParseCanonical(LineParser &line)
{
	const char *value = line.ExpectValueAndEnd();
	if (strcmp(value, "shortest") == 0)
		builder.SetCanonicalNamePolicy(CanonicalNamePolicy::SHORTEST_TERMINATED);
	else if (strcmp(value, "first") == 0)
		builder.SetCanonicalNamePolicy(CanonicalNamePolicy::FIRST_DECLARED);
	else
		throw FmtRuntimeError("Unknown canonical name policy: {}", value);
}

inline void
ReferenceConfigParser::ParseReference(LineParser &line)
{
	const char *name = line.NextUnescape();
	if (name == nullptr)
		throw LineParser::Error("Quoted reference name expected");

	const char32_t first = ParseCodepoint(line.ExpectValue());

	if (line.IsEnd()) {
		builder.Add(name, first);
	} else {
		const char32_t second = ParseCodepoint(line.ExpectValueAndEnd());
		builder.Add(name, first, second);
	}

	++n_references;
}

inline void
ReferenceConfigParser::ParseAlias(LineParser &line)
{
	const char *name = line.NextUnescape();
	if (name == nullptr)
		throw LineParser::Error("Quoted reference name expected");

	line.ExpectEnd();

	builder.AddAlias(name);
}

inline void
ReferenceConfigParser::ParseLevel(LineParser &line)
{
	if (line.SkipWord("default")) {
		const auto level = ParseLevelValue(line);
		line.ExpectEnd();
		builder.SetDefaultLevel(level);
	} else if (line.SkipWord("above")) {
		const auto level = ParseLevelValue(line);
		line.ExpectEnd();
		builder.SetAboveLevel(level);
	} else {
		char *range = line.ExpectValue();
		const auto level = ParseLevelValue(line);
		line.ExpectEnd();

		char *dash = strchr(range, '-');
		if (dash == nullptr) {
			builder.SetLevel(ParseCodepoint(range), level);
		} else {
			*dash = 0;
			builder.SetLevelRange(ParseCodepoint(range),
					      ParseCodepoint(dash + 1),
					      level);
		}
	}
}

void
ReferenceConfigParser::ParseLine(LineParser &line)
{
	const char *word = line.NextWord();
	if (word == nullptr)
		throw LineParser::Error("Syntax error");

	if (strcmp(word, "syntax") == 0)
		ParseSyntax(line);
	else if (strcmp(word, "validator") == 0)
		ParseValidator(line);
	else if (strcmp(word, "canonical") == 0)
		ParseCanonical(line);
	else if (strcmp(word, "reference") == 0)
		ParseReference(line);
	else if (strcmp(word, "alias") == 0)
		ParseAlias(line);
	else if (strcmp(word, "level") == 0)
		ParseLevel(line);
	else
		throw FmtRuntimeError("Unknown option: {}", word);
}

void
ReferenceConfigParser::Finish()
{
	if (builder.empty())
		throw LineParser::Error("No references defined");

	Fmt(4, "{} references", n_references);

	ConfigParser::Finish();
}

ReferenceTable
LoadReferenceTable(const boost::filesystem::path &path)
{
	ReferenceConfigParser parser(path.stem().string());
	CommentConfigParser comment_parser(parser);
	IncludeConfigParser include_parser(boost::filesystem::path(path),
					   comment_parser);

	ParseConfigFile(path, include_parser);

	return parser.Build();
}
