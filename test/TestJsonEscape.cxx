// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "refescape/Json.hxx"
#include "refescape/Sink.hxx"
#include "util/UTF8.hxx"

#include <gtest/gtest.h>

using namespace RefEscape;

static std::string
json_escape(std::u16string_view src,
	    JsonEscapeLevel level=JsonEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,
	    JsonEscapeType type=JsonEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_UHEXA)
{
	std::u16string buffer;
	return UTF16ToUTF8(JsonEscape(src, buffer, type, level));
}

static std::string
json_unescape(std::string_view src)
{
	const auto s = UTF8ToUTF16(src);
	std::u16string buffer;
	return UTF16ToUTF8(JsonUnescape(s, buffer));
}

TEST(JsonEscape, Basic)
{
	EXPECT_EQ(json_escape(u"foo"), "foo");
	EXPECT_EQ(json_escape(u"a\"b\\c"), "a\\\"b\\\\c");
	EXPECT_EQ(json_escape(u"\b\t\n\f\r"), "\\b\\t\\n\\f\\r");
	EXPECT_EQ(json_escape(u"\u0001\u001f\u007f"), "\\u0001\\u001F\\u007F");
	EXPECT_EQ(json_escape(u"caf\u00e9"), "caf\\u00E9");
	EXPECT_EQ(json_escape(u"\U0001F600"), "\\uD83D\\uDE00");
	EXPECT_EQ(json_escape(u"'&"), "'&");
}

TEST(JsonEscape, Slash)
{
	EXPECT_EQ(json_escape(u"a/b"), "a/b");
	EXPECT_EQ(json_escape(u"</script>"), "<\\/script>");
	EXPECT_EQ(json_escape(u"a/b", JsonEscapeLevel::LEVEL_3_ALL_NON_ALPHANUMERIC),
		  "a\\/b");
}

TEST(JsonEscape, Levels)
{
	const std::u16string_view s = u"a,\u00e9\n";
	EXPECT_EQ(json_escape(s, JsonEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET),
		  "a,\xc3\xa9\\n");
	EXPECT_EQ(json_escape(s, JsonEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET),
		  "a,\\u00E9\\n");
	EXPECT_EQ(json_escape(s, JsonEscapeLevel::LEVEL_3_ALL_NON_ALPHANUMERIC),
		  "a\\u002C\\u00E9\\n");
	EXPECT_EQ(json_escape(s, JsonEscapeLevel::LEVEL_4_ALL_CHARACTERS),
		  "\\u0061\\u002C\\u00E9\\n");
}

TEST(JsonEscape, Uhexa)
{
	EXPECT_EQ(json_escape(u"\n\"", JsonEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET,
			      JsonEscapeType::UHEXA),
		  "\\u000A\\u0022");
}

TEST(JsonEscape, Unescape)
{
	EXPECT_EQ(json_unescape("a\\nb"), "a\nb");
	EXPECT_EQ(json_unescape("\\\"\\\\\\/\\b\\f\\r\\t"), "\"\\/\b\f\r\t");
	EXPECT_EQ(json_unescape("\\u0041\\u00e9"), "A\xc3\xa9");
	EXPECT_EQ(json_unescape("\\uD83D\\uDE00"), "\xf0\x9f\x98\x80");

	/* not escape sequences in JSON */
	EXPECT_EQ(json_unescape("\\x41"), "\\x41");
	EXPECT_EQ(json_unescape("\\101"), "\\101");
	EXPECT_EQ(json_unescape("\\'"), "\\'");
	EXPECT_EQ(json_unescape("\\u00"), "\\u00");
	EXPECT_EQ(json_unescape("\\u004g"), "\\u004g");
	EXPECT_EQ(json_unescape("a\\"), "a\\");

	/* the character after an unknown escape is never the start of
	   another one */
	EXPECT_EQ(json_unescape("\\\\n"), "\\n");
	EXPECT_EQ(json_unescape("\\q\\n"), "\\q\n");
}

TEST(JsonEscape, Identity)
{
	std::u16string buffer;
	const std::u16string_view s = u"plain";
	EXPECT_EQ(JsonEscape(s, buffer).data(), s.data());
	EXPECT_EQ(JsonUnescape(s, buffer).data(), s.data());
	EXPECT_EQ(JsonEscape({}, buffer).data(), nullptr);
	EXPECT_EQ(JsonUnescape({}, buffer).data(), nullptr);
}

TEST(JsonEscape, ReuseBuffer)
{
	std::u16string buffer;
	auto result = JsonEscape(u"a\"b", buffer);
	EXPECT_EQ(result, u"a\\\"b");
	result = JsonEscape(result, buffer);
	EXPECT_EQ(result, u"a\\\\\\\"b");
	result = JsonUnescape(result, buffer);
	EXPECT_EQ(result, u"a\\\"b");
	result = JsonUnescape(result, buffer);
	EXPECT_EQ(result, u"a\"b");
	EXPECT_EQ(buffer, u"a\"b");
}

TEST(JsonEscape, InvalidArguments)
{
	std::u16string buffer;
	EXPECT_THROW(JsonEscape(u"x", buffer, JsonEscapeType(2)),
		     std::invalid_argument);
	EXPECT_THROW(JsonEscape(u"x", buffer, JsonEscapeType::UHEXA,
				JsonEscapeLevel(0)),
		     std::invalid_argument);
}

TEST(JsonEscape, Sink)
{
	const std::u16string_view src = u"ab\ncd";
	std::u16string dest;
	StringEscapeSink sink(dest);

	JsonEscape(src, 1, 3, sink,
		   JsonEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_UHEXA,
		   JsonEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET);
	EXPECT_EQ(UTF16ToUTF8(dest), "b\\nc");

	dest.clear();
	JsonUnescape(src, 0, 2, sink);
	EXPECT_EQ(UTF16ToUTF8(dest), "ab");

	EXPECT_THROW(JsonUnescape(src, 6, 0, sink), std::invalid_argument);
}
