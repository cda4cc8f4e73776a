// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "refescape/JavaScript.hxx"
#include "refescape/Sink.hxx"
#include "util/UTF8.hxx"

#include <gtest/gtest.h>

using namespace RefEscape;

static std::string
js_escape(std::u16string_view src,
	  JavaScriptEscapeType type=JavaScriptEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_XHEXA_AND_UHEXA,
	  JavaScriptEscapeLevel level=JavaScriptEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET)
{
	std::u16string buffer;
	return UTF16ToUTF8(JavaScriptEscape(src, buffer, type, level));
}

static std::string
js_unescape(std::string_view src)
{
	const auto s = UTF8ToUTF16(src);
	std::u16string buffer;
	return UTF16ToUTF8(JavaScriptUnescape(s, buffer));
}

TEST(JavaScriptEscape, Basic)
{
	EXPECT_EQ(js_escape(u"it's \"x\""), "it\\'s \\\"x\\\"");
	EXPECT_EQ(js_escape(u"\t\n"), "\\t\\n");
	EXPECT_EQ(js_escape(u"café"), "caf\\xE9");
	EXPECT_EQ(js_escape(u"€"), "\\u20AC");
	EXPECT_EQ(js_escape(u"\U0001F600"), "\\uD83D\\uDE00");
	EXPECT_EQ(js_escape(u"</script>"), "<\\/script>");
	EXPECT_EQ(js_escape(u"\u0001"), "\\x01");
}

TEST(JavaScriptEscape, Zero)
{
	const std::u16string_view zero{u"\0", 1};
	EXPECT_EQ(js_escape(zero), "\\0");

	/* "\01" would be an octal escape */
	const std::u16string_view zero_digit{u"\0" u"1", 2};
	EXPECT_EQ(js_escape(zero_digit), "\\x001");

	EXPECT_EQ(js_escape(zero_digit,
			    JavaScriptEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_UHEXA),
		  "\\u00001");
}

TEST(JavaScriptEscape, Types)
{
	const std::u16string_view s = u"\né€";

	EXPECT_EQ(js_escape(s, JavaScriptEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_UHEXA),
		  "\\n\\u00E9\\u20AC");
	EXPECT_EQ(js_escape(s, JavaScriptEscapeType::XHEXA_DEFAULT_TO_UHEXA),
		  "\\x0A\\xE9\\u20AC");
	EXPECT_EQ(js_escape(s, JavaScriptEscapeType::UHEXA),
		  "\\u000A\\u00E9\\u20AC");
}

TEST(JavaScriptEscape, Levels)
{
	const std::u16string_view s = u"a,é'";
	EXPECT_EQ(js_escape(s, JavaScriptEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_XHEXA_AND_UHEXA,
			    JavaScriptEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET),
		  "a,\xc3\xa9\\'");
	EXPECT_EQ(js_escape(s, JavaScriptEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_XHEXA_AND_UHEXA,
			    JavaScriptEscapeLevel::LEVEL_3_ALL_NON_ALPHANUMERIC),
		  "a\\x2C\\xE9\\'");
	EXPECT_EQ(js_escape(s, JavaScriptEscapeType::SINGLE_ESCAPE_CHARS_DEFAULT_TO_XHEXA_AND_UHEXA,
			    JavaScriptEscapeLevel::LEVEL_4_ALL_CHARACTERS),
		  "\\x61\\x2C\\xE9\\'");
}

TEST(JavaScriptEscape, Unescape)
{
	EXPECT_EQ(js_unescape("\\'\\\"\\n\\/"), "'\"\n/");
	EXPECT_EQ(js_unescape("\\x41\\xe9"), "A\xc3\xa9");
	EXPECT_EQ(js_unescape("\\u0041"), "A");
	EXPECT_EQ(js_unescape("\\uD83D\\uDE00"), "\xf0\x9f\x98\x80");

	/* octal */
	EXPECT_EQ(js_unescape("\\101"), "A");
	EXPECT_EQ(js_unescape("\\0"), std::string("\0", 1));
	EXPECT_EQ(js_unescape("\\377"), "\xc3\xbf");
	EXPECT_EQ(js_unescape("\\400"), " 0");
	EXPECT_EQ(js_unescape("\\18"), "\x01" "8");

	/* malformed */
	EXPECT_EQ(js_unescape("\\x4"), "\\x4");
	EXPECT_EQ(js_unescape("\\xzz"), "\\xzz");
	EXPECT_EQ(js_unescape("\\uuu0041"), "\\uuu0041");
	EXPECT_EQ(js_unescape("\\8"), "\\8");
}

TEST(JavaScriptEscape, InvalidArguments)
{
	std::u16string buffer;
	EXPECT_THROW(JavaScriptEscape(u"x", buffer, JavaScriptEscapeType(4)),
		     std::invalid_argument);
	EXPECT_THROW(JavaScriptEscape(u"x", buffer, JavaScriptEscapeType::UHEXA,
				      JavaScriptEscapeLevel(5)),
		     std::invalid_argument);
}

TEST(JavaScriptEscape, Sink)
{
	const std::u16string_view src = u"x\\ty";
	std::u16string dest;
	StringEscapeSink sink(dest);

	JavaScriptUnescape(src, 0, src.size(), sink);
	EXPECT_EQ(UTF16ToUTF8(dest), "x\ty");

	dest.clear();
	JavaScriptEscape(src, 3, 1, sink,
			 JavaScriptEscapeType::UHEXA,
			 JavaScriptEscapeLevel::LEVEL_4_ALL_CHARACTERS);
	EXPECT_EQ(UTF16ToUTF8(dest), "\\u0079");
}
