// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "OutputBuffer.hxx"
#include "Range.hxx"
#include "refescape/Uri.hxx"
#include "refescape/Sink.hxx"
#include "util/CharClass.hxx"
#include "util/FmtError.hxx"
#include "util/UTF16.hxx"
#include "util/UTF8.hxx"

#include <array>
#include <stdexcept>

using namespace RefEscape;

static constexpr bool
IsUriUnreserved(char16_t ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == u'-' || ch == u'.' || ch == u'_' || ch == u'~';
}

static constexpr bool
IsUriSubDelimiter(char16_t ch) noexcept
{
	return ch == u'!' || ch == u'$' || ch == u'&' || ch == u'\'' ||
		ch == u'(' || ch == u')' || ch == u'*' || ch == u'+' ||
		ch == u',' || ch == u';' || ch == u'=';
}

/**
 * The "pchar" production of RFC 3986.
 */
static constexpr bool
IsUriPathChar(char16_t ch) noexcept
{
	return IsUriUnreserved(ch) || IsUriSubDelimiter(ch) ||
		ch == u':' || ch == u'@';
}

static constexpr bool
IsAllowed(UriEscapeType type, char32_t codepoint) noexcept
{
	if (codepoint >= 0x80)
		return false;

	const char16_t ch(codepoint);

	switch (type) {
	case UriEscapeType::PATH:
		return IsUriPathChar(ch) || ch == u'/';

	case UriEscapeType::PATH_SEGMENT:
		return IsUriPathChar(ch);

	case UriEscapeType::QUERY_PARAM:
		if (ch == u'=' || ch == u'&' || ch == u'+' || ch == u'#')
			return false;

		return IsUriPathChar(ch) || ch == u'/' || ch == u'?';

	case UriEscapeType::FRAGMENT_ID:
		return IsUriPathChar(ch) || ch == u'/' || ch == u'?';
	}

	return false;
}

static void
CheckType(UriEscapeType type)
{
	switch (type) {
	case UriEscapeType::PATH:
	case UriEscapeType::PATH_SEGMENT:
	case UriEscapeType::QUERY_PARAM:
	case UriEscapeType::FRAGMENT_ID:
		return;
	}

	throw FmtInvalidArgument("Invalid URI escape type {}", unsigned(type));
}

static constexpr char16_t hex_digits[] = u"0123456789ABCDEF";

static void
AppendPercentEncoded(char32_t codepoint, EscapeSink &sink)
{
	/* a lone surrogate has no UTF-8 representation */
	if (IsSurrogate(codepoint))
		codepoint = REPLACEMENT_CHARACTER;

	std::array<char, 4> utf8;
	const char *end = UnicodeToUTF8(codepoint, utf8.data());

	std::array<char16_t, 12> buffer;
	std::size_t n = 0;
	for (const char *i = utf8.data(); i != end; ++i) {
		const auto byte = static_cast<unsigned char>(*i);
		buffer[n++] = u'%';
		buffer[n++] = hex_digits[byte >> 4];
		buffer[n++] = hex_digits[byte & 0xf];
	}

	sink.Append(std::u16string_view{buffer.data(), n});
}

static bool
EscapeUri(std::u16string_view text, EscapeSink &sink, UriEscapeType type)
{
	std::size_t copy_from = 0;
	bool modified = false;

	for (std::size_t i = 0; i < text.size();) {
		const auto c = ReadCodepoint(text, i);
		if (IsAllowed(type, c.codepoint)) {
			i += c.units;
			continue;
		}

		if (i > copy_from)
			sink.Append(text.substr(copy_from, i - copy_from));
		modified = true;

		AppendPercentEncoded(c.codepoint, sink);

		i += c.units;
		copy_from = i;
	}

	if (!modified)
		return false;

	if (copy_from < text.size())
		sink.Append(text.substr(copy_from));
	return true;
}

/**
 * Parse the "%HH" sequence at the given position.
 *
 * Throws std::invalid_argument if it is malformed.
 */
static unsigned char
ParsePercentEncoded(std::u16string_view text, std::size_t i)
{
	if (text.size() - i < 3)
		throw std::invalid_argument("Incomplete escape sequence in URI");

	const int high = ParseHexDigit(text[i + 1]);
	const int low = ParseHexDigit(text[i + 2]);
	if (high < 0 || low < 0)
		throw std::invalid_argument("Malformed escape sequence in URI");

	return static_cast<unsigned char>((high << 4) | low);
}

static bool
UnescapeUri(std::u16string_view text, EscapeSink &sink, UriEscapeType type)
{
	const bool plus_is_space = type == UriEscapeType::QUERY_PARAM;

	std::size_t copy_from = 0;
	bool modified = false;

	for (std::size_t i = 0; i < text.size();) {
		const char16_t ch = text[i];
		if (ch != u'%' && !(ch == u'+' && plus_is_space)) {
			++i;
			continue;
		}

		if (i > copy_from)
			sink.Append(text.substr(copy_from, i - copy_from));
		modified = true;

		if (ch == u'+') {
			sink.Append(u' ');
			++i;
		} else {
			/* collect all consecutive bytes, they may form
			   one multi-byte UTF-8 sequence */
			std::string bytes;
			while (i < text.size() && text[i] == u'%') {
				bytes.push_back(char(ParsePercentEncoded(text, i)));
				i += 3;
			}

			sink.Append(UTF8ToUTF16(bytes));
		}

		copy_from = i;
	}

	if (!modified)
		return false;

	if (copy_from < text.size())
		sink.Append(text.substr(copy_from));
	return true;
}

namespace RefEscape {

std::u16string_view
UriEscape(std::u16string_view text, std::u16string &buffer,
	  UriEscapeType type)
{
	CheckType(type);
	return WriteToBuffer(text, buffer, text.size() + 20,
			     [&](EscapeSink &sink){
				     return EscapeUri(text, sink, type);
			     });
}

void
UriEscape(std::span<const char16_t> src,
	  std::size_t offset, std::size_t length,
	  EscapeSink &sink,
	  UriEscapeType type)
{
	const auto text = CheckRange(src, offset, length);
	CheckType(type);
	if (!EscapeUri(text, sink, type) && !text.empty())
		sink.Append(text);
}

std::u16string_view
UriUnescape(std::u16string_view text, std::u16string &buffer,
	    UriEscapeType type)
{
	CheckType(type);
	return WriteToBuffer(text, buffer, text.size(),
			     [&](EscapeSink &sink){
				     return UnescapeUri(text, sink, type);
			     });
}

void
UriUnescape(std::span<const char16_t> src,
	    std::size_t offset, std::size_t length,
	    EscapeSink &sink,
	    UriEscapeType type)
{
	const auto text = CheckRange(src, offset, length);
	CheckType(type);
	if (!UnescapeUri(text, sink, type) && !text.empty())
		sink.Append(text);
}

} // namespace RefEscape
