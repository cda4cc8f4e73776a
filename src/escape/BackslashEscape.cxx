// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BackslashEscape.hxx"
#include "OutputBuffer.hxx"
#include "BackslashTable.hxx"
#include "refescape/Sink.hxx"
#include "util/CharClass.hxx"
#include "util/UTF16.hxx"

#include <fmt/format.h>

#include <array>

static void
AppendHexEscape(char16_t prefix, unsigned width, char32_t value,
		RefEscape::EscapeSink &sink)
{
	std::array<char, 8> digits;
	const char *end = fmt::format_to(digits.data(), "{:0{}X}",
					 uint_least32_t(value), width);

	std::array<char16_t, 8> buffer;
	std::size_t n = 0;
	buffer[n++] = u'\\';
	buffer[n++] = prefix;
	for (const char *p = digits.data(); p != end; ++p)
		buffer[n++] = char16_t(*p);

	sink.Append(std::u16string_view{buffer.data(), n});
}

static void
AppendEscape(const BackslashTable &table, char32_t codepoint,
	     char16_t next, BackslashEscapeType type,
	     RefEscape::EscapeSink &sink)
{
	if (type.use_secs) {
		const char16_t sec = table.GetSec(codepoint);

		/* "\0" followed by a digit would be an octal escape */
		if (sec != 0 && !(sec == u'0' && IsDigitASCII(next))) {
			const char16_t s[] = {u'\\', sec};
			sink.Append(std::u16string_view{s, 2});
			return;
		}
	}

	if (type.use_xhexa && table.xhexa && codepoint <= 0xff) {
		AppendHexEscape(u'x', 2, codepoint, sink);
		return;
	}

	if (codepoint > 0xffff) {
		AppendHexEscape(u'u', 4, 0xd800 + ((codepoint - 0x10000) >> 10),
				sink);
		AppendHexEscape(u'u', 4, 0xdc00 + ((codepoint - 0x10000) & 0x3ff),
				sink);
		return;
	}

	AppendHexEscape(u'u', 4, codepoint, sink);
}

[[gnu::pure]]
static bool
MustEscape(const BackslashTable &table, std::u16string_view text,
	   std::size_t i, char32_t codepoint, unsigned level) noexcept
{
	if (level < table.GetLevel(codepoint))
		return false;

	if (codepoint == u'/' && table.slash_only_after_lt && level < 3)
		return i > 0 && text[i - 1] == u'<';

	return true;
}

bool
EscapeBackslash(const BackslashTable &table, std::u16string_view text,
		RefEscape::EscapeSink &sink,
		BackslashEscapeType type, unsigned level)
{
	std::size_t copy_from = 0;
	bool modified = false;

	for (std::size_t i = 0; i < text.size();) {
		const auto c = ReadCodepoint(text, i);
		if (!MustEscape(table, text, i, c.codepoint, level)) {
			i += c.units;
			continue;
		}

		if (i > copy_from)
			sink.Append(text.substr(copy_from, i - copy_from));
		modified = true;

		const std::size_t next_position = i + c.units;
		const char16_t next = next_position < text.size()
			? text[next_position]
			: char16_t(0);

		AppendEscape(table, c.codepoint, next, type, sink);

		i = next_position;
		copy_from = i;
	}

	if (!modified)
		return false;

	if (copy_from < text.size())
		sink.Append(text.substr(copy_from));
	return true;
}

std::u16string_view
EscapeBackslash(const BackslashTable &table, std::u16string_view text,
		std::u16string &buffer,
		BackslashEscapeType type, unsigned level)
{
	return WriteToBuffer(text, buffer, text.size() + 20,
			     [&](RefEscape::EscapeSink &sink){
				     return EscapeBackslash(table, text, sink, type, level);
			     });
}

namespace {

/**
 * A parsed escape sequence.  A length of zero means there was none.
 */
struct ParsedEscape {
	/**
	 * The resulting code unit ("\u" escapes, which may be one half
	 * of a surrogate pair) or codepoint (all others).
	 */
	char32_t value = 0;

	bool is_unit = false;

	std::size_t length = 0;
};

}

/**
 * Parse exactly #n hex digits.
 */
static bool
ParseHexDigits(std::u16string_view s, std::size_t n, char32_t &value_r) noexcept
{
	if (s.size() < n)
		return false;

	char32_t value = 0;
	for (std::size_t i = 0; i < n; ++i) {
		const int digit = ParseHexDigit(s[i]);
		if (digit < 0)
			return false;

		value = (value << 4) | unsigned(digit);
	}

	value_r = value;
	return true;
}

static ParsedEscape
ParseEscape(const BackslashTable &table,
	    std::u16string_view text, std::size_t start) noexcept
{
	ParsedEscape result;

	if (start + 1 >= text.size())
		return result;

	const char16_t ch = text[start + 1];

	if (table.octal && IsOctalDigitASCII(ch)) {
		/* the longest run of up to three octal digits whose
		   value fits in one byte */
		char32_t value = 0;
		std::size_t i = start + 1;
		for (; i < text.size() && i < start + 4 &&
			     IsOctalDigitASCII(text[i]); ++i) {
			const char32_t next = value * 8 + (text[i] - u'0');
			if (next > 0xff)
				break;

			value = next;
		}

		result.value = value;
		result.length = i - start;
		return result;
	}

	if (ch == u'u') {
		std::size_t i = start + 2;
		if (table.repeated_u)
			while (i < text.size() && text[i] == u'u')
				++i;

		if (!ParseHexDigits(text.substr(i), 4, result.value))
			return result;

		result.is_unit = true;
		result.length = i + 4 - start;
		return result;
	}

	if (ch == u'x' && table.xhexa) {
		if (!ParseHexDigits(text.substr(start + 2), 2, result.value))
			return result;

		result.length = 4;
		return result;
	}

	if (ch == 0)
		return result;

	for (char32_t i = 0; i < BackslashTable::SEC_LIMIT; ++i) {
		if (table.secs[i] == ch) {
			result.value = i;
			result.length = 2;
			return result;
		}
	}

	return result;
}

bool
UnescapeBackslash(const BackslashTable &table, std::u16string_view text,
		  RefEscape::EscapeSink &sink)
{
	std::size_t copy_from = 0;
	bool modified = false;

	for (std::size_t i = text.find(u'\\');
	     i != text.npos;
	     i = text.find(u'\\', i)) {
		const auto escape = ParseEscape(table, text, i);
		if (escape.length == 0) {
			/* skip the following character, too; it cannot
			   start another escape sequence */
			i += 2;
			continue;
		}

		if (i > copy_from)
			sink.Append(text.substr(copy_from, i - copy_from));
		modified = true;

		if (escape.is_unit) {
			sink.Append(char16_t(escape.value));
		} else {
			std::u16string value;
			AppendCodepoint(value, escape.value);
			sink.Append(value);
		}

		i += escape.length;
		copy_from = i;
	}

	if (!modified)
		return false;

	if (copy_from < text.size())
		sink.Append(text.substr(copy_from));
	return true;
}

std::u16string_view
UnescapeBackslash(const BackslashTable &table, std::u16string_view text,
		  std::u16string &buffer)
{
	return WriteToBuffer(text, buffer, text.size(),
			     [&](RefEscape::EscapeSink &sink){
				     return UnescapeBackslash(table, text, sink);
			     });
}
