// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "OutputBuffer.hxx"
#include "BackslashTable.hxx"
#include "Range.hxx"
#include "refescape/Css.hxx"
#include "refescape/Sink.hxx"
#include "util/CharClass.hxx"
#include "util/FmtError.hxx"
#include "util/UTF16.hxx"

#include <fmt/format.h>

#include <array>

using namespace RefEscape;

/**
 * All printable ASCII punctuation except ':' can be escaped by
 * prefixing it with a backslash.
 */
static constexpr void
SetCssSecs(BackslashTable &t) noexcept
{
	for (char32_t ch = 0x20; ch < 0x7f; ++ch)
		if (!IsAlphaNumericASCII(ch) && ch != u':')
			t.SetSec(ch, char16_t(ch));
}

static constexpr BackslashTable css_string_table = [](){
	BackslashTable t;
	SetCssSecs(t);

	t.levels.fill(3);
	t.SetLevelRange('0', '9', 4);
	t.SetLevelRange('A', 'Z', 4);
	t.SetLevelRange('a', 'z', 4);
	t.SetLevelRange(0x80, 0x9f, 2);
	t.levels[BackslashTable::LEVELS_LIMIT] = 2;

	t.SetLevel(u'"', 1);
	t.SetLevel(u'\'', 1);
	t.SetLevel(u'\\', 1);
	t.SetLevel(u'/', 1);
	t.SetLevel(u'&', 1);
	t.SetLevel(u';', 1);
	t.SetLevelRange(0x00, 0x1f, 1);
	t.SetLevelRange(0x7f, 0x9f, 1);
	return t;
}();

static constexpr BackslashTable css_identifier_table = [](){
	BackslashTable t;
	SetCssSecs(t);

	t.levels.fill(3);
	t.SetLevelRange('0', '9', 4);
	t.SetLevelRange('A', 'Z', 4);
	t.SetLevelRange('a', 'z', 4);
	t.levels[BackslashTable::LEVELS_LIMIT] = 2;

	/* everything except alphanumerics is special in identifiers;
	   '-' and '_' are handled by MustEscapeIdentifier() */
	t.SetLevelRange(0x20, 0x2f, 1);
	t.SetLevelRange(0x3a, 0x40, 1);
	t.SetLevelRange(0x5b, 0x60, 1);
	t.SetLevelRange(0x7b, 0x7e, 1);
	t.SetLevelRange(0x00, 0x1f, 1);
	t.SetLevelRange(0x7f, 0x9f, 1);
	return t;
}();

namespace {

struct CssEscapeParameters {
	const BackslashTable *table;
	bool identifier;
	bool use_secs;
	bool compact;
	unsigned level;
};

}

static void
SetType(CssEscapeParameters &p, CssEscapeType type)
{
	switch (type) {
	case CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA:
		p.use_secs = true;
		p.compact = true;
		return;

	case CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_SIX_DIGIT_HEXA:
		p.use_secs = true;
		p.compact = false;
		return;

	case CssEscapeType::COMPACT_HEXA:
		p.use_secs = false;
		p.compact = true;
		return;

	case CssEscapeType::SIX_DIGIT_HEXA:
		p.use_secs = false;
		p.compact = false;
		return;
	}

	throw FmtInvalidArgument("Invalid CSS escape type {}", unsigned(type));
}

static CssEscapeParameters
GetParameters(CssEscapeType type, CssStringEscapeLevel level)
{
	if (level < CssStringEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET ||
	    level > CssStringEscapeLevel::LEVEL_4_ALL_CHARACTERS)
		throw FmtInvalidArgument("Invalid CSS string escape level {}",
					 unsigned(level));

	CssEscapeParameters p;
	p.table = &css_string_table;
	p.identifier = false;
	p.level = unsigned(level);
	SetType(p, type);
	return p;
}

static CssEscapeParameters
GetParameters(CssEscapeType type, CssIdentifierEscapeLevel level)
{
	if (level < CssIdentifierEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET ||
	    level > CssIdentifierEscapeLevel::LEVEL_4_ALL_CHARACTERS)
		throw FmtInvalidArgument("Invalid CSS identifier escape level {}",
					 unsigned(level));

	CssEscapeParameters p;
	p.table = &css_identifier_table;
	p.identifier = true;
	p.level = unsigned(level);
	SetType(p, type);
	return p;
}

/**
 * An identifier must not begin with a digit or with "-" followed by
 * a digit or "-".  Below level 3, "-" and "_" are allowed anywhere
 * else.
 */
[[gnu::pure]]
static bool
MustEscapeIdentifier(const BackslashTable &table, std::u16string_view text,
		     std::size_t i, char32_t codepoint, unsigned level) noexcept
{
	const bool leading = i == 0;

	if (level < table.GetLevel(codepoint))
		return leading && codepoint < 0x80 &&
			IsDigitASCII(char16_t(codepoint));

	if (level < 3) {
		if (codepoint == u'-')
			return leading && text.size() > 1 &&
				(text[1] == u'-' || IsDigitASCII(text[1]));

		if (codepoint == u'_')
			return leading;
	}

	return true;
}

/**
 * A hexadecimal escape is terminated by the first character which
 * is not a hex digit; a single space after it is swallowed by the
 * parser.  Does the next character require a separating space?
 */
[[gnu::pure]]
static bool
NeedTrailingSpace(const CssEscapeParameters &p, char16_t next) noexcept
{
	if (p.compact && p.level < 4 && IsHexDigitASCII(next))
		return true;

	return !p.identifier && p.level < 3 && next == u' ';
}

static void
AppendCssEscape(const CssEscapeParameters &p, char32_t codepoint,
		char16_t next, EscapeSink &sink)
{
	if (p.use_secs) {
		const char16_t sec = p.table->GetSec(codepoint);
		if (sec != 0) {
			const char16_t s[] = {u'\\', sec};
			sink.Append(std::u16string_view{s, 2});
			return;
		}
	}

	std::array<char, 8> digits;
	const char *end = p.compact
		? fmt::format_to(digits.data(), "{:X}", uint_least32_t(codepoint))
		: fmt::format_to(digits.data(), "{:06X}", uint_least32_t(codepoint));

	std::array<char16_t, 9> buffer;
	std::size_t n = 0;
	buffer[n++] = u'\\';
	for (const char *i = digits.data(); i != end; ++i)
		buffer[n++] = char16_t(*i);
	if (NeedTrailingSpace(p, next))
		buffer[n++] = u' ';

	sink.Append(std::u16string_view{buffer.data(), n});
}

static bool
EscapeCss(const CssEscapeParameters &p, std::u16string_view text,
	  EscapeSink &sink)
{
	std::size_t copy_from = 0;
	bool modified = false;

	for (std::size_t i = 0; i < text.size();) {
		const auto c = ReadCodepoint(text, i);
		const bool must_escape = p.identifier
			? MustEscapeIdentifier(*p.table, text, i,
					       c.codepoint, p.level)
			: p.level >= p.table->GetLevel(c.codepoint);
		if (!must_escape) {
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

		AppendCssEscape(p, c.codepoint, next, sink);

		i = next_position;
		copy_from = i;
	}

	if (!modified)
		return false;

	if (copy_from < text.size())
		sink.Append(text.substr(copy_from));
	return true;
}

static std::u16string_view
EscapeCss(const CssEscapeParameters &p, std::u16string_view text,
	  std::u16string &buffer)
{
	return WriteToBuffer(text, buffer, text.size() + 20,
			     [&](EscapeSink &sink){
				     return EscapeCss(p, text, sink);
			     });
}

static void
EscapeCss(const CssEscapeParameters &p, std::span<const char16_t> src,
	  std::size_t offset, std::size_t length, EscapeSink &sink)
{
	const auto text = CheckRange(src, offset, length);
	if (!EscapeCss(p, text, sink) && !text.empty())
		sink.Append(text);
}

static constexpr bool
IsCssNewline(char16_t ch) noexcept
{
	return ch == u'\n' || ch == u'\r' || ch == u'\f';
}

static bool
UnescapeCss(std::u16string_view text, EscapeSink &sink)
{
	std::size_t copy_from = 0;
	bool modified = false;

	for (std::size_t i = text.find(u'\\');
	     i != text.npos && i + 1 < text.size();
	     i = text.find(u'\\', i)) {
		const char16_t ch = text[i + 1];

		if (IsCssNewline(ch)) {
			/* an escaped newline is left alone */
			i += 2;
			continue;
		}

		if (i > copy_from)
			sink.Append(text.substr(copy_from, i - copy_from));
		modified = true;

		if (IsHexDigitASCII(ch)) {
			char32_t value = 0;
			std::size_t end = i + 1;
			for (; end < text.size() && end < i + 7 &&
				     IsHexDigitASCII(text[end]); ++end)
				value = (value << 4) | unsigned(ParseHexDigit(text[end]));

			if (end < text.size() && text[end] == u' ')
				++end;

			if (value == 0 || !IsScalarValue(value))
				value = REPLACEMENT_CHARACTER;

			std::u16string s;
			AppendCodepoint(s, value);
			sink.Append(s);

			i = end;
		} else {
			/* any other character stands for itself */
			sink.Append(ch);
			i += 2;
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
CssStringEscape(std::u16string_view text, std::u16string &buffer,
		CssEscapeType type, CssStringEscapeLevel level)
{
	return EscapeCss(GetParameters(type, level), text, buffer);
}

void
CssStringEscape(std::span<const char16_t> src,
		std::size_t offset, std::size_t length,
		EscapeSink &sink,
		CssEscapeType type, CssStringEscapeLevel level)
{
	EscapeCss(GetParameters(type, level), src, offset, length, sink);
}

std::u16string_view
CssIdentifierEscape(std::u16string_view text, std::u16string &buffer,
		    CssEscapeType type, CssIdentifierEscapeLevel level)
{
	return EscapeCss(GetParameters(type, level), text, buffer);
}

void
CssIdentifierEscape(std::span<const char16_t> src,
		    std::size_t offset, std::size_t length,
		    EscapeSink &sink,
		    CssEscapeType type, CssIdentifierEscapeLevel level)
{
	EscapeCss(GetParameters(type, level), src, offset, length, sink);
}

std::u16string_view
CssUnescape(std::u16string_view text, std::u16string &buffer)
{
	return WriteToBuffer(text, buffer, text.size(),
			     [&](EscapeSink &sink){
				     return UnescapeCss(text, sink);
			     });
}

void
CssUnescape(std::span<const char16_t> src,
	    std::size_t offset, std::size_t length,
	    EscapeSink &sink)
{
	const auto text = CheckRange(src, offset, length);
	if (!UnescapeCss(text, sink) && !text.empty())
		sink.Append(text);
}

} // namespace RefEscape
