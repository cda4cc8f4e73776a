// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BackslashEscape.hxx"
#include "BackslashTable.hxx"
#include "Range.hxx"
#include "refescape/JavaScript.hxx"
#include "refescape/Sink.hxx"
#include "util/FmtError.hxx"

using namespace RefEscape;

static constexpr BackslashTable javascript_table = [](){
	BackslashTable t;
	t.SetSec(0x00, u'0');
	t.SetSec(0x08, u'b');
	t.SetSec(0x09, u't');
	t.SetSec(0x0a, u'n');
	t.SetSec(0x0c, u'f');
	t.SetSec(0x0d, u'r');
	t.SetSec(u'"', u'"');
	t.SetSec(u'\'', u'\'');
	t.SetSec(u'\\', u'\\');
	t.SetSec(u'/', u'/');
	t.SetCommonLevels();
	t.slash_only_after_lt = true;
	t.xhexa = true;
	t.octal = true;
	return t;
}();

static BackslashEscapeType
ToBackslashEscapeType(JavaScriptEscapeType type)
{
	switch (type) {
	case JavaScriptEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_XHEXA_AND_UHEXA:
		return {true, true};

	case JavaScriptEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_UHEXA:
		return {true, false};

	case JavaScriptEscapeType::XHEXA_DEFAULT_TO_UHEXA:
		return {false, true};

	case JavaScriptEscapeType::UHEXA:
		return {false, false};
	}

	throw FmtInvalidArgument("Invalid JavaScript escape type {}",
				 unsigned(type));
}

static unsigned
CheckLevel(JavaScriptEscapeLevel level)
{
	if (level < JavaScriptEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET ||
	    level > JavaScriptEscapeLevel::LEVEL_4_ALL_CHARACTERS)
		throw FmtInvalidArgument("Invalid JavaScript escape level {}",
					 unsigned(level));

	return unsigned(level);
}

namespace RefEscape {

std::u16string_view
JavaScriptEscape(std::u16string_view text, std::u16string &buffer,
		 JavaScriptEscapeType type, JavaScriptEscapeLevel level)
{
	return EscapeBackslash(javascript_table, text, buffer,
			       ToBackslashEscapeType(type), CheckLevel(level));
}

void
JavaScriptEscape(std::span<const char16_t> src,
		 std::size_t offset, std::size_t length,
		 EscapeSink &sink,
		 JavaScriptEscapeType type, JavaScriptEscapeLevel level)
{
	const auto text = CheckRange(src, offset, length);
	if (!EscapeBackslash(javascript_table, text, sink,
			     ToBackslashEscapeType(type), CheckLevel(level)) &&
	    !text.empty())
		sink.Append(text);
}

std::u16string_view
JavaScriptUnescape(std::u16string_view text, std::u16string &buffer)
{
	return UnescapeBackslash(javascript_table, text, buffer);
}

void
JavaScriptUnescape(std::span<const char16_t> src,
		   std::size_t offset, std::size_t length,
		   EscapeSink &sink)
{
	const auto text = CheckRange(src, offset, length);
	if (!UnescapeBackslash(javascript_table, text, sink) &&
	    !text.empty())
		sink.Append(text);
}

} // namespace RefEscape
