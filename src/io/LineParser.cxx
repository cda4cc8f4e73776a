// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "LineParser.hxx"

#include <string>

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>

static constexpr bool
IsWhitespaceNotNull(char ch) noexcept
{
	return ch > 0 && ch <= 0x20;
}

static constexpr bool
IsWordChar(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') || ch == '_';
}

static constexpr bool
IsUnquotedChar(char ch) noexcept
{
	return IsWordChar(ch) || ch == '.' || ch == '-' || ch == ':' ||
		ch == '+' || ch == '/';
}

static constexpr bool
IsQuote(char ch) noexcept
{
	return ch == '"' || ch == '\'';
}

static char *
StripLeft(char *p) noexcept
{
	while (IsWhitespaceNotNull(*p))
		++p;
	return p;
}

static void
StripRight(char *p) noexcept
{
	char *end = p + strlen(p);
	while (end > p && IsWhitespaceNotNull(end[-1]))
		--end;
	*end = 0;
}

LineParser::LineParser(char *_p) noexcept
	:p(StripLeft(_p))
{
	StripRight(p);
}

void
LineParser::Strip() noexcept
{
	p = StripLeft(p);
}

void
LineParser::ExpectEnd()
{
	if (!IsEnd())
		throw Error(std::string("Unexpected tokens at end of line: ") + p);
}

bool
LineParser::SkipWord(const char *word) noexcept
{
	char *q = p;

	do {
		if (*q++ != *word)
			return false;
	} while (*++word != 0);

	if (*q == 0) {
		p = q;
		return true;
	} else if (IsWhitespaceNotNull(*q)) {
		p = StripLeft(q + 1);
		return true;
	} else
		return false;
}

const char *
LineParser::NextWord() noexcept
{
	if (!IsWordChar(front()))
		return nullptr;

	const char *result = p;
	do {
		++p;
	} while (IsWordChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextUnquotedValue() noexcept
{
	if (!IsUnquotedChar(front()))
		return nullptr;

	char *result = p;
	do {
		++p;
	} while (IsUnquotedChar(front()));

	if (IsWhitespaceNotNull(front())) {
		*p++ = 0;
		Strip();
	} else if (!IsEnd())
		return nullptr;

	return result;
}

inline char *
LineParser::NextQuotedValue(const char stop) noexcept
{
	char *const value = p;
	char *q = strchr(p, stop);
	if (q == nullptr)
		return nullptr;

	*q++ = 0;
	p = StripLeft(q);
	return value;
}

char *
LineParser::NextValue() noexcept
{
	const char ch = front();
	if (IsQuote(ch)) {
		++p;
		return NextQuotedValue(ch);
	} else
		return NextUnquotedValue();
}

char *
LineParser::NextUnescape() noexcept
{
	const char stop = front();
	if (!IsQuote(stop))
		return nullptr;

	char *dest = ++p;
	char *const value = dest;

	while (true) {
		char ch = *p++;

		if (ch == 0)
			return nullptr;
		else if (ch == stop) {
			*dest = 0;
			Strip();
			return value;
		} else if (ch == '\\') {
			ch = *p++;

			switch (ch) {
			case 'r':
				*dest++ = '\r';
				break;

			case 'n':
				*dest++ = '\n';
				break;

			case '\\':
			case '\'':
			case '\"':
				*dest++ = ch;
				break;

			default:
				return nullptr;
			}
		} else
			*dest++ = ch;
	}
}

unsigned
LineParser::NextUnsigned()
{
	const char *string = NextValue();
	if (string == nullptr)
		throw Error("Number expected");

	char *endptr;
	errno = 0;
	unsigned long l = strtoul(string, &endptr, 10);
	if (endptr == string || *endptr != 0 || *string == '-')
		throw Error(std::string("Not a valid number: ") + string);

	if (errno == ERANGE || l > UINT_MAX)
		throw Error(std::string("Number too large: ") + string);

	return static_cast<unsigned>(l);
}

char *
LineParser::ExpectValue()
{
	char *value = NextValue();
	if (value == nullptr || *value == 0)
		throw Error("Value expected");

	return value;
}

char *
LineParser::ExpectValueAndEnd()
{
	char *value = ExpectValue();
	ExpectEnd();
	return value;
}
