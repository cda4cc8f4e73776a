// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "BackslashEscape.hxx"
#include "BackslashTable.hxx"
#include "Range.hxx"
#include "refescape/Json.hxx"
#include "refescape/Sink.hxx"
#include "util/FmtError.hxx"

using namespace RefEscape;

static constexpr BackslashTable json_table = [](){
	BackslashTable t;
	t.SetSec(0x08, u'b');
	t.SetSec(0x09, u't');
	t.SetSec(0x0a, u'n');
	t.SetSec(0x0c, u'f');
	t.SetSec(0x0d, u'r');
	t.SetSec(u'"', u'"');
	t.SetSec(u'\\', u'\\');
	t.SetSec(u'/', u'/');
	t.SetCommonLevels();
	t.slash_only_after_lt = true;
	return t;
}();

static BackslashEscapeType
ToBackslashEscapeType(JsonEscapeType type)
{
	switch (type) {
	case JsonEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_UHEXA:
		return {true, false};

	case JsonEscapeType::UHEXA:
		return {false, false};
	}

	throw FmtInvalidArgument("Invalid JSON escape type {}", unsigned(type));
}

static unsigned
CheckLevel(JsonEscapeLevel level)
{
	if (level < JsonEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET ||
	    level > JsonEscapeLevel::LEVEL_4_ALL_CHARACTERS)
		throw FmtInvalidArgument("Invalid JSON escape level {}",
					 unsigned(level));

	return unsigned(level);
}

namespace RefEscape {

std::u16string_view
JsonEscape(std::u16string_view text, std::u16string &buffer,
	   JsonEscapeType type, JsonEscapeLevel level)
{
	return EscapeBackslash(json_table, text, buffer,
			       ToBackslashEscapeType(type), CheckLevel(level));
}

void
JsonEscape(std::span<const char16_t> src,
	   std::size_t offset, std::size_t length,
	   EscapeSink &sink,
	   JsonEscapeType type, JsonEscapeLevel level)
{
	const auto text = CheckRange(src, offset, length);
	if (!EscapeBackslash(json_table, text, sink,
			     ToBackslashEscapeType(type), CheckLevel(level)) &&
	    !text.empty())
		sink.Append(text);
}

std::u16string_view
JsonUnescape(std::u16string_view text, std::u16string &buffer)
{
	return UnescapeBackslash(json_table, text, buffer);
}

void
JsonUnescape(std::span<const char16_t> src,
	     std::size_t offset, std::size_t length,
	     EscapeSink &sink)
{
	const auto text = CheckRange(src, offset, length);
	if (!UnescapeBackslash(json_table, text, sink) && !text.empty())
		sink.Append(text);
}

} // namespace RefEscape
