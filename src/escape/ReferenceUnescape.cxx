// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ReferenceUnescape.hxx"
#include "OutputBuffer.hxx"
#include "ReferenceTable.hxx"
#include "NameSearch.hxx"
#include "refescape/Sink.hxx"
#include "util/CharClass.hxx"
#include "util/UTF16.hxx"

#include <array>

namespace {

/**
 * A parsed reference: the codepoints it expands to and the number of
 * code units it occupies in the source text.  A length of zero means
 * there was no reference.
 */
struct ParsedReference {
	std::array<char32_t, 2> codepoints;
	unsigned n_codepoints = 0;
	std::size_t length = 0;

	constexpr bool IsDefined() const noexcept {
		return length > 0;
	}
};

}

/**
 * Characters which, when following the marker, mean that this is
 * certainly not a reference.
 */
static constexpr bool
IsNoReferenceStart(char16_t ch, char16_t marker) noexcept
{
	return ch == u' ' || ch == u'\n' || ch == u'\t' || ch == u'\f' ||
		ch == u'<' || ch == marker;
}

/**
 * Parse a digit run; the value saturates at one above
 * #MAX_CODEPOINT.
 *
 * @return the number of digits
 */
static std::size_t
ParseNumber(std::u16string_view s, bool hexa, char32_t &value_r) noexcept
{
	static constexpr char32_t SATURATED = MAX_CODEPOINT + 1;

	const unsigned base = hexa ? 16 : 10;
	char32_t value = 0;

	std::size_t n = 0;
	for (; n < s.size(); ++n) {
		int digit;
		if (hexa)
			digit = ParseHexDigit(s[n]);
		else
			digit = IsDigitASCII(s[n]) ? s[n] - u'0' : -1;

		if (digit < 0)
			break;

		value = value * base + unsigned(digit);
		if (value > SATURATED)
			value = SATURATED;
	}

	value_r = value;
	return n;
}

static ParsedReference
ParseNumericReference(const ReferenceTable &table,
		      std::u16string_view text, std::size_t start) noexcept
{
	const auto &syntax = table.GetSyntax();

	/* skip the marker and the numeric marker */
	std::size_t position = start + 2;
	if (position >= text.size())
		return {};

	bool hexa = false;
	if (text[position] == u'x' ||
	    (syntax.upper_hex_prefix && text[position] == u'X')) {
		hexa = true;
		++position;
	}

	char32_t value;
	const std::size_t n_digits =
		ParseNumber(text.substr(position), hexa, value);
	if (n_digits == 0)
		return {};

	position += n_digits;

	if (position < text.size() && text[position] == syntax.terminator)
		++position;
	else if (!syntax.lenient_numeric)
		return {};

	if (syntax.translate_numeric != nullptr)
		value = syntax.translate_numeric(value);
	else if (!IsScalarValue(value))
		return {};

	ParsedReference result;
	result.codepoints = {value, 0};
	result.n_codepoints = 1;
	result.length = position - start;
	return result;
}

static ParsedReference
ParseNamedReference(const ReferenceTable &table,
		    std::u16string_view text, std::size_t start) noexcept
{
	const auto &syntax = table.GetSyntax();

	std::size_t end = start + 1;
	while (end < text.size() && IsAlphaNumericASCII(text[end]))
		++end;

	if (end == start + 1)
		return {};

	if (end < text.size() && text[end] == syntax.terminator)
		++end;

	const auto names = table.GetSortedNames();
	const auto match = SearchReferenceName(names,
					       text.substr(start, end - start),
					       syntax.partial_names);

	ParsedReference result;

	switch (match.type) {
	case NameMatch::Type::NOT_FOUND:
		return {};

	case NameMatch::Type::FOUND:
		result.length = end - start;
		break;

	case NameMatch::Type::PARTIAL:
		result.length = names[match.index].size();
		break;
	}

	const auto c = table.GetCodepoints(match.index);
	result.codepoints = c.codepoints;
	result.n_codepoints = c.n;
	return result;
}

static ParsedReference
ParseReference(const ReferenceTable &table,
	       std::u16string_view text, std::size_t start) noexcept
{
	const auto &syntax = table.GetSyntax();

	if (start + 1 >= text.size())
		return {};

	const char16_t next = text[start + 1];
	if (IsNoReferenceStart(next, syntax.marker))
		return {};

	if (next == syntax.numeric_marker)
		return ParseNumericReference(table, text, start);

	return ParseNamedReference(table, text, start);
}

bool
UnescapeReferences(const ReferenceTable &table, std::u16string_view text,
		   RefEscape::EscapeSink &sink)
{
	const char16_t marker = table.GetSyntax().marker;

	std::size_t copy_from = 0;
	bool modified = false;

	for (std::size_t i = text.find(marker);
	     i != text.npos;
	     i = text.find(marker, i)) {
		const auto reference = ParseReference(table, text, i);
		if (!reference.IsDefined()) {
			++i;
			continue;
		}

		if (i > copy_from)
			sink.Append(text.substr(copy_from, i - copy_from));
		modified = true;

		std::u16string value;
		for (unsigned j = 0; j < reference.n_codepoints; ++j)
			AppendCodepoint(value, reference.codepoints[j]);
		sink.Append(value);

		i += reference.length;
		copy_from = i;
	}

	if (!modified)
		return false;

	if (copy_from < text.size())
		sink.Append(text.substr(copy_from));
	return true;
}

std::u16string_view
UnescapeReferences(const ReferenceTable &table, std::u16string_view text,
		   std::u16string &buffer)
{
	return WriteToBuffer(text, buffer, text.size(),
			     [&](RefEscape::EscapeSink &sink){
				     return UnescapeReferences(table, text, sink);
			     });
}
