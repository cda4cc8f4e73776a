// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "refescape/Html.hxx"
#include "refescape/Sink.hxx"
#include "escape/HTML.hxx"
#include "util/UTF8.hxx"

#include <gtest/gtest.h>

#include <string_view>

using namespace RefEscape;

static std::string
html_unescape(std::string_view p)
{
	const auto src = UTF8ToUTF16(p);
	std::u16string buffer;
	return UTF16ToUTF8(HtmlUnescape(src, buffer));
}

static std::string
html_escape(std::string_view p, HtmlEscapeType type, HtmlEscapeLevel level)
{
	const auto src = UTF8ToUTF16(p);
	std::u16string buffer;
	return UTF16ToUTF8(HtmlEscape(src, buffer, type, level));
}

static std::string
html_escape5(std::string_view p)
{
	const auto src = UTF8ToUTF16(p);
	std::u16string buffer;
	return UTF16ToUTF8(HtmlEscape5(src, buffer));
}

TEST(HtmlEscape, Basic)
{
	ASSERT_EQ(html_unescape("foo bar"), "foo bar");
	ASSERT_EQ(html_unescape("foo&amp;bar"), "foo&bar");
	ASSERT_EQ(html_unescape("&lt;&gt;"), "<>");
	ASSERT_EQ(html_unescape("&quot;"), "\"");
	ASSERT_EQ(html_unescape("&amp;amp;"), "&amp;");
	ASSERT_EQ(html_unescape("&amp;&&quot;"), "&&\"");
	ASSERT_EQ(html_unescape("&gt&lt;&apos;"), "><'");
	ASSERT_EQ(html_unescape("&#10;"), "\n");
	ASSERT_EQ(html_unescape("&#xa;"), "\n");
	ASSERT_EQ(html_unescape("&#xfc;"), "\xc3\xbc");
	ASSERT_EQ(html_unescape("&#x10ffff;"), "\xf4\x8f\xbf\xbf");
	ASSERT_EQ(html_unescape("&quot"), "\"");
	ASSERT_EQ(html_unescape("&amp;&lt;&gt;"), "&<>");
}

TEST(HtmlEscape, Legacy)
{
	/* names without terminator */
	ASSERT_EQ(html_unescape("&copy 2024"), "\xc2\xa9 2024");
	ASSERT_EQ(html_unescape("&ampx"), "&x");

	/* the longest matching name wins */
	ASSERT_EQ(html_unescape("&notin;"), "\xe2\x88\x89");
	ASSERT_EQ(html_unescape("&notit;"), "\xc2\xacit;");

	/* names which are only valid with terminator */
	ASSERT_EQ(html_unescape("&euro"), "&euro");
	ASSERT_EQ(html_unescape("&euro;"), "\xe2\x82\xac");

	/* two codepoints */
	ASSERT_EQ(html_unescape("&NotEqualTilde;"), "\xe2\x89\x82\xcc\xb8");
}

TEST(HtmlEscape, Numeric)
{
	ASSERT_EQ(html_unescape("&#65"), "A");
	ASSERT_EQ(html_unescape("&#X41;"), "A");
	ASSERT_EQ(html_unescape("&#zz;"), "&#zz;");
	ASSERT_EQ(html_unescape("&#x80;"), "\xe2\x82\xac");
	ASSERT_EQ(html_unescape("&#150;"), "\xe2\x80\x93");
	ASSERT_EQ(html_unescape("&#x81;"), "\xc2\x81");
	ASSERT_EQ(html_unescape("&#0;"), "\xef\xbf\xbd");
	ASSERT_EQ(html_unescape("&#xd800;"), "\xef\xbf\xbd");
	ASSERT_EQ(html_unescape("&#x110000;"), "\xef\xbf\xbd");
	ASSERT_EQ(html_unescape("&#4294967361;"), "\xef\xbf\xbd");
}

TEST(HtmlEscape, TranslateNumeric)
{
	EXPECT_EQ(TranslateHtmlNumeric(0x41), 0x41u);
	EXPECT_EQ(TranslateHtmlNumeric(0x80), 0x20acu);
	EXPECT_EQ(TranslateHtmlNumeric(0x9f), 0x178u);
	EXPECT_EQ(TranslateHtmlNumeric(0x8d), 0x8du);
	EXPECT_EQ(TranslateHtmlNumeric(0), 0xfffdu);
	EXPECT_EQ(TranslateHtmlNumeric(0xdfff), 0xfffdu);
	EXPECT_EQ(TranslateHtmlNumeric(0x10ffff), 0x10ffffu);
	EXPECT_EQ(TranslateHtmlNumeric(0x110000), 0xfffdu);
}

TEST(HtmlEscape, Escape)
{
	std::u16string buffer;
	const std::u16string_view markup = u"<a href=\"x\">";
	EXPECT_EQ(UTF16ToUTF8(HtmlEscape5Xml(markup, buffer)),
		  "&lt;a href=&quot;x&quot;&gt;");
	EXPECT_EQ(UTF16ToUTF8(HtmlEscape4Xml(markup, buffer)),
		  "&lt;a href=&quot;x&quot;&gt;");

	EXPECT_EQ(html_escape5("caf\xc3\xa9 \xe2\x82\xac"), "caf&eacute; &euro;");
	EXPECT_EQ(html_escape5("\xc2\xa0"), "&nbsp;");
	EXPECT_EQ(html_escape5("\xc2\xa9"), "&copy;");
	EXPECT_EQ(html_escape5("'"), "&apos;");

	/* HTML 4 has no "&apos;" */
	EXPECT_EQ(UTF16ToUTF8(HtmlEscape4(u"'", buffer)), "&#39;");
}

TEST(HtmlEscape, Types)
{
	EXPECT_EQ(html_escape("<\xc3\xa9\xf0\x9f\x98\x80",
			      HtmlEscapeType::HTML5_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,
			      HtmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT),
		  "&lt;&eacute;&#128512;");
	EXPECT_EQ(html_escape("<\xc3\xa9\xf0\x9f\x98\x80",
			      HtmlEscapeType::HTML5_NAMED_REFERENCES_DEFAULT_TO_HEXA,
			      HtmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT),
		  "&lt;&eacute;&#x1f600;");
	EXPECT_EQ(html_escape("<\xc3\xa9\xf0\x9f\x98\x80",
			      HtmlEscapeType::DECIMAL_REFERENCES,
			      HtmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT),
		  "&#60;&#233;&#128512;");
	EXPECT_EQ(html_escape("<\xc3\xa9\xf0\x9f\x98\x80",
			      HtmlEscapeType::HEXADECIMAL_REFERENCES,
			      HtmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT),
		  "&#x3c;&#xe9;&#x1f600;");
	EXPECT_EQ(html_escape("\xe2\x88\x89",
			      HtmlEscapeType::HTML4_NAMED_REFERENCES_DEFAULT_TO_HEXA,
			      HtmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT),
		  "&notin;");
	EXPECT_EQ(html_escape("\xe2\x89\xa0",
			      HtmlEscapeType::HTML4_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,
			      HtmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT),
		  "&ne;");
}

TEST(HtmlEscape, Html4AngleBrackets)
{
	/* HTML5 redefined "&lang;" and "&rang;" as U+27E8/U+27E9, so
	   the HTML 4 escaper must not use these names for U+2329 and
	   U+232A */
	std::u16string buffer;
	EXPECT_EQ(UTF16ToUTF8(HtmlEscape4(u"\u2329x\u232a", buffer)),
		  "&#9001;x&#9002;");
	EXPECT_EQ(html_escape("\xe2\x8c\xa9",
			      HtmlEscapeType::HTML4_NAMED_REFERENCES_DEFAULT_TO_HEXA,
			      HtmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT),
		  "&#x2329;");

	std::u16string unescaped;
	EXPECT_EQ(HtmlUnescape(HtmlEscape4(u"\u2329\u232a", buffer), unescaped),
		  u"\u2329\u232a");

	/* the HTML5 escaper still knows them */
	EXPECT_EQ(UTF16ToUTF8(HtmlEscape5(u"\u27e8\u27e9", buffer)),
		  "&lang;&rang;");
}

TEST(HtmlEscape, ReuseBuffer)
{
	/* the input may be a view on the output buffer */
	std::u16string buffer;
	auto result = HtmlEscape5(u"a<b", buffer);
	EXPECT_EQ(result, u"a&lt;b");
	result = HtmlUnescape(result, buffer);
	EXPECT_EQ(result, u"a<b");
	EXPECT_EQ(buffer, u"a<b");

	result = HtmlEscape5(HtmlEscape5(u"&", buffer), buffer);
	EXPECT_EQ(result, u"&amp;amp;");

	/* a view on a part of the buffer */
	buffer = u"xx&lt;yy";
	result = HtmlUnescape(std::u16string_view{buffer}.substr(2, 4), buffer);
	EXPECT_EQ(result, u"<");
}

TEST(HtmlEscape, Levels)
{
	const auto type = HtmlEscapeType::HTML5_NAMED_REFERENCES_DEFAULT_TO_DECIMAL;
	const std::string_view s = "a,'\xc3\xa9<";

	EXPECT_EQ(html_escape(s, type, HtmlEscapeLevel::LEVEL_0_ONLY_MARKUP_SIGNIFICANT_EXCEPT_APOS),
		  "a,'\xc3\xa9&lt;");
	EXPECT_EQ(html_escape(s, type, HtmlEscapeLevel::LEVEL_1_ONLY_MARKUP_SIGNIFICANT),
		  "a,&apos;\xc3\xa9&lt;");
	EXPECT_EQ(html_escape(s, type, HtmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT),
		  "a,&apos;&eacute;&lt;");
	EXPECT_EQ(html_escape(s, type, HtmlEscapeLevel::LEVEL_3_ALL_NON_ALPHANUMERIC),
		  "a&comma;&apos;&eacute;&lt;");
	EXPECT_EQ(html_escape(s, type, HtmlEscapeLevel::LEVEL_4_ALL_CHARACTERS),
		  "&#97;&comma;&apos;&eacute;&lt;");
}

TEST(HtmlEscape, Identity)
{
	std::u16string buffer;

	const std::u16string_view s = u"plain text";
	EXPECT_EQ(HtmlEscape5(s, buffer).data(), s.data());
	EXPECT_EQ(HtmlUnescape(s, buffer).data(), s.data());

	EXPECT_EQ(HtmlEscape5({}, buffer).data(), nullptr);
	EXPECT_EQ(HtmlUnescape({}, buffer).data(), nullptr);

	const std::u16string_view empty = u"";
	EXPECT_TRUE(HtmlEscape5(empty, buffer).empty());
	EXPECT_TRUE(HtmlUnescape(empty, buffer).empty());
}

TEST(HtmlEscape, InvalidArguments)
{
	std::u16string buffer;

	EXPECT_THROW(HtmlEscape(u"x", buffer, HtmlEscapeType(42),
				HtmlEscapeLevel::LEVEL_1_ONLY_MARKUP_SIGNIFICANT),
		     std::invalid_argument);
	EXPECT_THROW(HtmlEscape(u"x", buffer,
				HtmlEscapeType::DECIMAL_REFERENCES,
				HtmlEscapeLevel(5)),
		     std::invalid_argument);
}

TEST(HtmlEscape, Sink)
{
	const std::u16string_view src = u"ab<cd&amp;";

	std::u16string dest;
	StringEscapeSink sink(dest);

	HtmlEscape(src, 2, 3, sink,
		   HtmlEscapeType::HTML5_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,
		   HtmlEscapeLevel::LEVEL_1_ONLY_MARKUP_SIGNIFICANT);
	EXPECT_EQ(UTF16ToUTF8(dest), "&lt;cd");

	/* unmodified text is copied */
	dest.clear();
	HtmlEscape(src, 0, 2, sink,
		   HtmlEscapeType::HTML5_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,
		   HtmlEscapeLevel::LEVEL_1_ONLY_MARKUP_SIGNIFICANT);
	EXPECT_EQ(UTF16ToUTF8(dest), "ab");

	dest.clear();
	HtmlUnescape(src, 5, 5, sink);
	EXPECT_EQ(UTF16ToUTF8(dest), "&");

	EXPECT_THROW(HtmlEscape(src, 8, 5, sink,
				HtmlEscapeType::DECIMAL_REFERENCES,
				HtmlEscapeLevel::LEVEL_1_ONLY_MARKUP_SIGNIFICANT),
		     std::invalid_argument);
	EXPECT_THROW(HtmlUnescape(src, 11, 0, sink), std::invalid_argument);

	/* an empty range at the end is allowed */
	dest.clear();
	HtmlUnescape(src, 10, 0, sink);
	EXPECT_TRUE(dest.empty());
}
