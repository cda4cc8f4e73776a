// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BackslashEscape.hxx"
#include "BackslashTable.hxx"
#include "Range.hxx"
#include "refescape/Java.hxx"
#include "refescape/Sink.hxx"
#include "util/FmtError.hxx"

using namespace RefEscape;

static constexpr BackslashTable java_table = [](){
	BackslashTable t;
	t.SetSec(0x08, u'b');
	t.SetSec(0x09, u't');
	t.SetSec(0x0a, u'n');
	t.SetSec(0x0c, u'f');
	t.SetSec(0x0d, u'r');
	t.SetSec(u'"', u'"');
	t.SetSec(u'\'', u'\'');
	t.SetSec(u'\\', u'\\');
	t.SetCommonLevels();
	t.octal = true;
	t.repeated_u = true;
	return t;
}();

/* Java string literals always use single escape characters */
static constexpr BackslashEscapeType java_type{true, false};

static unsigned
CheckLevel(JavaEscapeLevel level)
{
	if (level < JavaEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET ||
	    level > JavaEscapeLevel::LEVEL_3_ALL_NON_ALPHANUMERIC)
		throw FmtInvalidArgument("Invalid Java escape level {}",
					 unsigned(level));

	return unsigned(level);
}

namespace RefEscape {

std::u16string_view
JavaEscape(std::u16string_view text, std::u16string &buffer,
	   JavaEscapeLevel level)
{
	return EscapeBackslash(java_table, text, buffer,
			       java_type, CheckLevel(level));
}

void
JavaEscape(std::span<const char16_t> src,
	   std::size_t offset, std::size_t length,
	   EscapeSink &sink, JavaEscapeLevel level)
{
	const auto text = CheckRange(src, offset, length);
	if (!EscapeBackslash(java_table, text, sink,
			     java_type, CheckLevel(level)) &&
	    !text.empty())
		sink.Append(text);
}

std::u16string_view
JavaUnescape(std::u16string_view text, std::u16string &buffer)
{
	return UnescapeBackslash(java_table, text, buffer);
}

void
JavaUnescape(std::span<const char16_t> src,
	     std::size_t offset, std::size_t length,
	     EscapeSink &sink)
{
	const auto text = CheckRange(src, offset, length);
	if (!UnescapeBackslash(java_table, text, sink) && !text.empty())
		sink.Append(text);
}

} // namespace RefEscape
