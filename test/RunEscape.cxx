// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escape or unescape UTF-8 lines from stdin with one of the
 * built-in formats or with a custom table.
 */

#include "escape/Class.hxx"
#include "escape/ReferenceEscape.hxx"
#include "escape/ReferenceUnescape.hxx"
#include "escape/TableConfig.hxx"
#include "util/Exception.hxx"
#include "util/UTF8.hxx"
#include "Logger.hxx"

#include <fmt/core.h>

#include <iostream>
#include <optional>
#include <span>
#include <string>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

struct Usage {};

static unsigned
ParseLevel(const char *s)
{
	char *endptr;
	const unsigned long value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0)
		throw Usage();

	return value;
}

int
main(int argc, char **argv)
try {
	std::span<char *> args(argv + 1, argc - 1);

	const char *table_path = nullptr;
	while (!args.empty() && args.front()[0] == '-') {
		if (strcmp(args.front(), "--table") == 0 && args.size() >= 2) {
			table_path = args[1];
			args = args.subspan(2);
		} else if (strcmp(args.front(), "--verbose") == 0) {
			SetLogLevel(5);
			args = args.subspan(1);
		} else
			throw Usage();
	}

	if (args.size() < 2 || args.size() > 3)
		throw Usage();

	const char *const command = args[0];
	const char *const format = args[1];
	const char *const level_string = args.size() > 2 ? args[2] : nullptr;

	bool escape;
	if (strcmp(command, "escape") == 0)
		escape = true;
	else if (strcmp(command, "unescape") == 0)
		escape = false;
	else
		throw Usage();

	const EscapeClass *cls = nullptr;
	std::optional<ReferenceTable> custom_table;

	if (strcmp(format, "custom") == 0) {
		if (table_path == nullptr)
			throw Usage();

		custom_table.emplace(LoadReferenceTable(table_path));
	} else {
		cls = FindEscapeClass(format);
		if (cls == nullptr) {
			fmt::print(stderr, "Unknown format: {}\n", format);
			return EXIT_FAILURE;
		}
	}

	unsigned level = cls != nullptr ? cls->default_level : 1;
	if (level_string != nullptr)
		level = ParseLevel(level_string);

	std::u16string buffer;
	std::string line;
	while (std::getline(std::cin, line)) {
		const auto src = UTF8ToUTF16(line);

		std::u16string_view result;
		if (cls != nullptr)
			result = escape
				? cls->escape(src, buffer, level)
				: cls->unescape(src, buffer);
		else
			result = escape
				? EscapeReferences(*custom_table, src, buffer,
						   {true, false}, level)
				: UnescapeReferences(*custom_table, src, buffer);

		fmt::print("{}\n", UTF16ToUTF8(result));
	}

	return EXIT_SUCCESS;
} catch (Usage) {
	fprintf(stderr, "usage: %s [--verbose] [--table FILE] escape|unescape FORMAT [LEVEL]\n"
		"FORMAT: html4 html5 xml10 xml11 json javascript java css-string\n"
		"        css-identifier uri-path uri-segment uri-query uri-fragment custom\n",
		argv[0]);
	return EXIT_FAILURE;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
