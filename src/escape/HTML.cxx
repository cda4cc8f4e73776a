// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "HTML.hxx"
#include "HtmlReferences.hxx"
#include "NameSearch.hxx"
#include "ReferenceTableBuilder.hxx"
#include "ReferenceEscape.hxx"
#include "ReferenceUnescape.hxx"
#include "Range.hxx"
#include "refescape/Html.hxx"
#include "refescape/Sink.hxx"
#include "util/FmtError.hxx"
#include "util/UTF16.hxx"

using namespace RefEscape;

char32_t
TranslateHtmlNumeric(char32_t value) noexcept
{
	switch (value) {
	case 0x00: return REPLACEMENT_CHARACTER;
	case 0x80: return 0x20ac;
	case 0x82: return 0x201a;
	case 0x83: return 0x0192;
	case 0x84: return 0x201e;
	case 0x85: return 0x2026;
	case 0x86: return 0x2020;
	case 0x87: return 0x2021;
	case 0x88: return 0x02c6;
	case 0x89: return 0x2030;
	case 0x8a: return 0x0160;
	case 0x8b: return 0x2039;
	case 0x8c: return 0x0152;
	case 0x8e: return 0x017d;
	case 0x91: return 0x2018;
	case 0x92: return 0x2019;
	case 0x93: return 0x201c;
	case 0x94: return 0x201d;
	case 0x95: return 0x2022;
	case 0x96: return 0x2013;
	case 0x97: return 0x2014;
	case 0x98: return 0x02dc;
	case 0x99: return 0x2122;
	case 0x9a: return 0x0161;
	case 0x9b: return 0x203a;
	case 0x9c: return 0x0153;
	case 0x9e: return 0x017e;
	case 0x9f: return 0x0178;
	}

	if (IsSurrogate(value) || value > MAX_CODEPOINT)
		return REPLACEMENT_CHARACTER;

	return value;
}

/**
 * Does the given name decode to exactly these codepoints with the
 * specified table?
 */
[[gnu::pure]]
static bool
DecodesTo(const ReferenceTable &decoder, const NamedReferenceData &ref) noexcept
{
	const std::u16string name(ref.name.begin(), ref.name.end());
	const auto match = SearchReferenceName(decoder.GetSortedNames(),
					       name, false);
	if (match.type != NameMatch::Type::FOUND)
		return false;

	const auto cps = decoder.GetCodepoints(match.index);
	if (cps.codepoints[0] != ref.first)
		return false;

	return ref.second != 0
		? cps.n == 2 && cps.codepoints[1] == ref.second
		: cps.n == 1;
}

/**
 * @param decoder if not nullptr, then names which have a different
 * meaning in this table are omitted, because the escaper output is
 * always decoded with it
 */
static ReferenceTable
BuildHtmlTable(std::string_view name,
	       std::span<const NamedReferenceData> references,
	       const ReferenceTable *decoder=nullptr)
{
	ReferenceTableBuilder builder(name, html_reference_syntax);

	for (const auto &i : references) {
		if (decoder != nullptr && !DecodesTo(*decoder, i))
			/* e.g. "&lang;" is U+2329 in HTML 4, but
			   U+27E8 in HTML5 */
			continue;

		if (i.second != 0)
			builder.Add(i.name, i.first, i.second);
		else
			builder.Add(i.name, i.first);
	}

	/* level 4: everything; level 3: all but ASCII alphanumerics;
	   level 2: non-ASCII; level 1: apostrophe; level 0: markup */
	builder.SetDefaultLevel(3);
	builder.SetLevelRange(u'0', u'9', 4);
	builder.SetLevelRange(u'A', u'Z', 4);
	builder.SetLevelRange(u'a', u'z', 4);
	builder.SetLevelRange(0x80, 0x9f, 2);
	builder.SetAboveLevel(2);
	builder.SetLevel(u'\'', 1);
	builder.SetLevel(u'"', 0);
	builder.SetLevel(u'<', 0);
	builder.SetLevel(u'>', 0);
	builder.SetLevel(u'&', 0);

	return builder.Build();
}

const ReferenceTable &
GetHtml4ReferenceTable()
{
	static const ReferenceTable table =
		BuildHtmlTable("html4", GetHtml4References(),
			       &GetHtml5ReferenceTable());
	return table;
}

const ReferenceTable &
GetHtml5ReferenceTable()
{
	static const ReferenceTable table =
		BuildHtmlTable("html5", GetHtml5References());
	return table;
}

namespace {

struct HtmlEscapeParameters {
	const ReferenceTable *table;
	ReferenceEscapeType type;
	unsigned level;
};

}

static HtmlEscapeParameters
GetParameters(HtmlEscapeType type, HtmlEscapeLevel level)
{
	HtmlEscapeParameters p;

	switch (type) {
	case HtmlEscapeType::HTML4_NAMED_REFERENCES_DEFAULT_TO_DECIMAL:
		p.table = &GetHtml4ReferenceTable();
		p.type = {true, false};
		break;

	case HtmlEscapeType::HTML4_NAMED_REFERENCES_DEFAULT_TO_HEXA:
		p.table = &GetHtml4ReferenceTable();
		p.type = {true, true};
		break;

	case HtmlEscapeType::HTML5_NAMED_REFERENCES_DEFAULT_TO_DECIMAL:
		p.table = &GetHtml5ReferenceTable();
		p.type = {true, false};
		break;

	case HtmlEscapeType::HTML5_NAMED_REFERENCES_DEFAULT_TO_HEXA:
		p.table = &GetHtml5ReferenceTable();
		p.type = {true, true};
		break;

	case HtmlEscapeType::DECIMAL_REFERENCES:
		p.table = &GetHtml4ReferenceTable();
		p.type = {false, false};
		break;

	case HtmlEscapeType::HEXADECIMAL_REFERENCES:
		p.table = &GetHtml4ReferenceTable();
		p.type = {false, true};
		break;

	default:
		throw FmtInvalidArgument("Invalid HTML escape type {}",
					 unsigned(type));
	}

	if (level > HtmlEscapeLevel::LEVEL_4_ALL_CHARACTERS)
		throw FmtInvalidArgument("Invalid HTML escape level {}",
					 unsigned(level));

	p.level = unsigned(level);
	return p;
}

namespace RefEscape {

std::u16string_view
HtmlEscape(std::u16string_view text, std::u16string &buffer,
	   HtmlEscapeType type, HtmlEscapeLevel level)
{
	const auto p = GetParameters(type, level);
	return EscapeReferences(*p.table, text, buffer, p.type, p.level);
}

void
HtmlEscape(std::span<const char16_t> src,
	   std::size_t offset, std::size_t length,
	   EscapeSink &sink,
	   HtmlEscapeType type, HtmlEscapeLevel level)
{
	const auto text = CheckRange(src, offset, length);
	const auto p = GetParameters(type, level);
	if (!EscapeReferences(*p.table, text, sink, p.type, p.level) &&
	    !text.empty())
		sink.Append(text);
}

std::u16string_view
HtmlEscape5(std::u16string_view text, std::u16string &buffer)
{
	return HtmlEscape(text, buffer,
			  HtmlEscapeType::HTML5_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,
			  HtmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT);
}

std::u16string_view
HtmlEscape5Xml(std::u16string_view text, std::u16string &buffer)
{
	return HtmlEscape(text, buffer,
			  HtmlEscapeType::HTML5_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,
			  HtmlEscapeLevel::LEVEL_1_ONLY_MARKUP_SIGNIFICANT);
}

std::u16string_view
HtmlEscape4(std::u16string_view text, std::u16string &buffer)
{
	return HtmlEscape(text, buffer,
			  HtmlEscapeType::HTML4_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,
			  HtmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT);
}

std::u16string_view
HtmlEscape4Xml(std::u16string_view text, std::u16string &buffer)
{
	return HtmlEscape(text, buffer,
			  HtmlEscapeType::HTML4_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,
			  HtmlEscapeLevel::LEVEL_1_ONLY_MARKUP_SIGNIFICANT);
}

std::u16string_view
HtmlUnescape(std::u16string_view text, std::u16string &buffer)
{
	return UnescapeReferences(GetHtml5ReferenceTable(), text, buffer);
}

void
HtmlUnescape(std::span<const char16_t> src,
	     std::size_t offset, std::size_t length,
	     EscapeSink &sink)
{
	const auto text = CheckRange(src, offset, length);
	if (!UnescapeReferences(GetHtml5ReferenceTable(), text, sink) &&
	    !text.empty())
		sink.Append(text);
}

} // namespace RefEscape
