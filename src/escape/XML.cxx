// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "XML.hxx"
#include "ReferenceTableBuilder.hxx"
#include "ReferenceEscape.hxx"
#include "ReferenceUnescape.hxx"
#include "Range.hxx"
#include "refescape/Xml.hxx"
#include "refescape/Sink.hxx"
#include "util/FmtError.hxx"
#include "util/UTF16.hxx"

using namespace RefEscape;

bool
IsValidXml10(char32_t codepoint) noexcept
{
	if (codepoint < 0x20)
		return codepoint == '\t' || codepoint == '\n' || codepoint == '\r';

	if (codepoint <= 0xd7ff)
		return true;

	if (codepoint < 0xe000)
		return false;

	if (codepoint <= 0xfffd)
		return true;

	return codepoint >= 0x10000 && codepoint <= MAX_CODEPOINT;
}

bool
IsValidXml11(char32_t codepoint) noexcept
{
	return codepoint != 0 && !IsSurrogate(codepoint) &&
		codepoint != 0xfffe && codepoint != 0xffff &&
		codepoint <= MAX_CODEPOINT;
}

/* only "&#x", a terminator is required, and numeric values which
   are not scalar values are not references */
static constexpr ReferenceSyntax xml_syntax{};

static ReferenceTableBuilder
MakeXmlTableBuilder(std::string_view name, CodepointValidator validator)
{
	ReferenceTableBuilder builder(name, xml_syntax);
	builder.SetValidator(validator);

	builder.Add("&quot;", u'"');
	builder.Add("&amp;", u'&');
	builder.Add("&apos;", u'\'');
	builder.Add("&lt;", u'<');
	builder.Add("&gt;", u'>');

	builder.SetDefaultLevel(3);
	builder.SetLevelRange(u'0', u'9', 4);
	builder.SetLevelRange(u'A', u'Z', 4);
	builder.SetLevelRange(u'a', u'z', 4);
	builder.SetLevelRange(0x80, 0x9f, 2);
	builder.SetAboveLevel(2);

	for (const char16_t ch : std::u16string_view{u"'\"<>&"})
		builder.SetLevel(ch, 1);

	/* C1 control characters except NEL are discouraged in both
	   versions */
	builder.SetLevelRange(0x7f, 0x84, 1);
	builder.SetLevelRange(0x86, 0x9f, 1);

	return builder;
}

const ReferenceTable &
GetXml10ReferenceTable()
{
	static const ReferenceTable table =
		MakeXmlTableBuilder("xml10", IsValidXml10).Build();
	return table;
}

const ReferenceTable &
GetXml11ReferenceTable()
{
	static const ReferenceTable table = [](){
		auto builder = MakeXmlTableBuilder("xml11", IsValidXml11);

		/* XML 1.1 allows these only as references */
		builder.SetLevelRange(0x01, 0x08, 1);
		builder.SetLevel(0x0b, 1);
		builder.SetLevel(0x0c, 1);
		builder.SetLevelRange(0x0e, 0x1f, 1);

		return builder.Build();
	}();

	return table;
}

static ReferenceEscapeType
ToReferenceEscapeType(XmlEscapeType type)
{
	switch (type) {
	case XmlEscapeType::CHARACTER_ENTITY_REFERENCES_DEFAULT_TO_DECIMAL:
		return {true, false};

	case XmlEscapeType::CHARACTER_ENTITY_REFERENCES_DEFAULT_TO_HEXA:
		return {true, true};

	case XmlEscapeType::DECIMAL_REFERENCES:
		return {false, false};

	case XmlEscapeType::HEXADECIMAL_REFERENCES:
		return {false, true};
	}

	throw FmtInvalidArgument("Invalid XML escape type {}", unsigned(type));
}

static unsigned
CheckLevel(XmlEscapeLevel level)
{
	if (level < XmlEscapeLevel::LEVEL_1_ONLY_MARKUP_SIGNIFICANT ||
	    level > XmlEscapeLevel::LEVEL_4_ALL_CHARACTERS)
		throw FmtInvalidArgument("Invalid XML escape level {}",
					 unsigned(level));

	return unsigned(level);
}

static std::u16string_view
XmlEscape(const ReferenceTable &table,
	  std::u16string_view text, std::u16string &buffer,
	  XmlEscapeType type, XmlEscapeLevel level)
{
	const auto t = ToReferenceEscapeType(type);
	return EscapeReferences(table, text, buffer, t, CheckLevel(level));
}

static void
XmlEscape(const ReferenceTable &table,
	  std::span<const char16_t> src,
	  std::size_t offset, std::size_t length,
	  EscapeSink &sink,
	  XmlEscapeType type, XmlEscapeLevel level)
{
	const auto text = CheckRange(src, offset, length);
	const auto t = ToReferenceEscapeType(type);
	if (!EscapeReferences(table, text, sink, t, CheckLevel(level)) &&
	    !text.empty())
		sink.Append(text);
}

namespace RefEscape {

std::u16string_view
Xml10Escape(std::u16string_view text, std::u16string &buffer,
	    XmlEscapeType type, XmlEscapeLevel level)
{
	return XmlEscape(GetXml10ReferenceTable(), text, buffer, type, level);
}

void
Xml10Escape(std::span<const char16_t> src,
	    std::size_t offset, std::size_t length,
	    EscapeSink &sink,
	    XmlEscapeType type, XmlEscapeLevel level)
{
	XmlEscape(GetXml10ReferenceTable(), src, offset, length, sink,
		  type, level);
}

std::u16string_view
Xml11Escape(std::u16string_view text, std::u16string &buffer,
	    XmlEscapeType type, XmlEscapeLevel level)
{
	return XmlEscape(GetXml11ReferenceTable(), text, buffer, type, level);
}

void
Xml11Escape(std::span<const char16_t> src,
	    std::size_t offset, std::size_t length,
	    EscapeSink &sink,
	    XmlEscapeType type, XmlEscapeLevel level)
{
	XmlEscape(GetXml11ReferenceTable(), src, offset, length, sink,
		  type, level);
}

std::u16string_view
XmlUnescape(std::u16string_view text, std::u16string &buffer)
{
	/* both versions share the same entities and syntax */
	return UnescapeReferences(GetXml10ReferenceTable(), text, buffer);
}

void
XmlUnescape(std::span<const char16_t> src,
	    std::size_t offset, std::size_t length,
	    EscapeSink &sink)
{
	const auto text = CheckRange(src, offset, length);
	if (!UnescapeReferences(GetXml10ReferenceTable(), text, sink) &&
	    !text.empty())
		sink.Append(text);
}

} // namespace RefEscape
