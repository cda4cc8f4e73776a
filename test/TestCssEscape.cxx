// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "refescape/Css.hxx"
#include "refescape/Sink.hxx"
#include "util/UTF8.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace RefEscape;

static std::string
css_string_escape(std::u16string_view src,
		  CssStringEscapeLevel level=CssStringEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,
		  CssEscapeType type=CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA)
{
	std::u16string buffer;
	return UTF16ToUTF8(CssStringEscape(src, buffer, type, level));
}

static std::string
css_identifier_escape(std::u16string_view src,
		      CssIdentifierEscapeLevel level=CssIdentifierEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,
		      CssEscapeType type=CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA)
{
	std::u16string buffer;
	return UTF16ToUTF8(CssIdentifierEscape(src, buffer, type, level));
}

static std::string
css_unescape(std::string_view src)
{
	const auto s = UTF8ToUTF16(src);
	std::u16string buffer;
	return UTF16ToUTF8(CssUnescape(s, buffer));
}

TEST(CssEscape, String)
{
	EXPECT_EQ(css_string_escape(u"foo"), "foo");
	EXPECT_EQ(css_string_escape(u"a'b\"c\\d"), "a\\'b\\\"c\\\\d");
	EXPECT_EQ(css_string_escape(u"a/b&c;d"), "a\\/b\\&c\\;d");
	EXPECT_EQ(css_string_escape(u"caf\u00e9"), "caf\\E9");
	EXPECT_EQ(css_string_escape(u"\U0001F600"), "\\1F600");

	/* other ASCII punctuation is left alone below level 3 */
	EXPECT_EQ(css_string_escape(u"a-b:c#d"), "a-b:c#d");
}

TEST(CssEscape, CompactHexaSeparator)
{
	/* a following hex digit would be parsed as part of the
	   escape */
	EXPECT_EQ(css_string_escape(u"\nb"), "\\A b");
	EXPECT_EQ(css_string_escape(u"\nx"), "\\Ax");
	EXPECT_EQ(css_string_escape(u"\u00e91"), "\\E9 1");

	/* a following space would be swallowed */
	EXPECT_EQ(css_string_escape(u"\n "), "\\A  ");
	EXPECT_EQ(css_string_escape(u"\n"), "\\A");
}

TEST(CssEscape, StringLevels)
{
	const std::u16string_view s = u"a b'\u00e9";

	EXPECT_EQ(css_string_escape(s, CssStringEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET),
		  "a b\\'\xc3\xa9");
	EXPECT_EQ(css_string_escape(s, CssStringEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET),
		  "a b\\'\\E9");
	EXPECT_EQ(css_string_escape(s, CssStringEscapeLevel::LEVEL_3_ALL_NON_ALPHANUMERIC),
		  "a\\ b\\'\\E9");
	EXPECT_EQ(css_string_escape(s, CssStringEscapeLevel::LEVEL_4_ALL_CHARACTERS),
		  "\\61\\ \\62\\'\\E9");
}

TEST(CssEscape, Types)
{
	const std::u16string_view s = u"'\u00e9";

	EXPECT_EQ(css_string_escape(s, CssStringEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,
				    CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_SIX_DIGIT_HEXA),
		  "\\'\\0000E9");
	EXPECT_EQ(css_string_escape(s, CssStringEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,
				    CssEscapeType::COMPACT_HEXA),
		  "\\27\\E9");
	EXPECT_EQ(css_string_escape(s, CssStringEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,
				    CssEscapeType::SIX_DIGIT_HEXA),
		  "\\000027\\0000E9");

	/* six digits never need a separator before a hex digit */
	EXPECT_EQ(css_string_escape(u"\u00e9a", CssStringEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,
				    CssEscapeType::SIX_DIGIT_HEXA),
		  "\\0000E9a");
	EXPECT_EQ(css_string_escape(u"\u00e9 ", CssStringEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,
				    CssEscapeType::SIX_DIGIT_HEXA),
		  "\\0000E9  ");
}

TEST(CssEscape, Identifier)
{
	EXPECT_EQ(css_identifier_escape(u"foo-bar_baz"), "foo-bar_baz");
	EXPECT_EQ(css_identifier_escape(u"a b"), "a\\ b");
	EXPECT_EQ(css_identifier_escape(u"a.b#c"), "a\\.b\\#c");
	EXPECT_EQ(css_identifier_escape(u"a:b"), "a\\3A b");
	EXPECT_EQ(css_identifier_escape(u"\u00e9"), "\\E9");
	EXPECT_EQ(css_identifier_escape(u"\u00e9",
					CssIdentifierEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET),
		  "\xc3\xa9");
}

TEST(CssEscape, IdentifierStart)
{
	/* an identifier must not begin with a digit */
	EXPECT_EQ(css_identifier_escape(u"1a"), "\\31 a");
	EXPECT_EQ(css_identifier_escape(u"12"), "\\31 2");
	EXPECT_EQ(css_identifier_escape(u"a1"), "a1");

	/* ... or with "-" followed by a digit or "-" */
	EXPECT_EQ(css_identifier_escape(u"-1"), "\\-1");
	EXPECT_EQ(css_identifier_escape(u"--x"), "\\--x");
	EXPECT_EQ(css_identifier_escape(u"-x"), "-x");
	EXPECT_EQ(css_identifier_escape(u"-"), "-");

	EXPECT_EQ(css_identifier_escape(u"_x"), "\\_x");
	EXPECT_EQ(css_identifier_escape(u"x_"), "x_");

	/* level 3 escapes '-' and '_' everywhere */
	EXPECT_EQ(css_identifier_escape(u"a-b_c",
					CssIdentifierEscapeLevel::LEVEL_3_ALL_NON_ALPHANUMERIC),
		  "a\\-b\\_c");
}

TEST(CssEscape, Unescape)
{
	EXPECT_EQ(css_unescape("a\\'b"), "a'b");
	EXPECT_EQ(css_unescape("\\:\\g"), ":g");
	EXPECT_EQ(css_unescape("\\E9 t"), "\xc3\xa9t");
	EXPECT_EQ(css_unescape("\\e9t"), "\xc3\xa9t");
	EXPECT_EQ(css_unescape("\\0000e9ab"), "\xc3\xa9" "ab");
	EXPECT_EQ(css_unescape("\\1F600"), "\xf0\x9f\x98\x80");

	/* only one space is part of the escape */
	EXPECT_EQ(css_unescape("\\A  x"), "\n x");

	/* values which are not Unicode scalar values */
	EXPECT_EQ(css_unescape("\\0"), "\xef\xbf\xbd");
	EXPECT_EQ(css_unescape("\\D800"), "\xef\xbf\xbd");
	EXPECT_EQ(css_unescape("\\110000"), "\xef\xbf\xbd");

	/* an escaped newline and a trailing backslash are left alone */
	EXPECT_EQ(css_unescape("a\\\nb"), "a\\\nb");
	EXPECT_EQ(css_unescape("a\\"), "a\\");
}

TEST(CssEscape, RoundTrip)
{
	const std::u16string_view s = u"a\nb 'c\" \u00e9\U0001F600 1-2;x\\";

	for (unsigned level = 1; level <= 4; ++level) {
		std::u16string escaped, unescaped;
		EXPECT_EQ(CssUnescape(CssStringEscape(s, escaped,
						      CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA,
						      CssStringEscapeLevel(level)),
				      unescaped),
			  s) << "level=" << level;
		EXPECT_EQ(CssUnescape(CssIdentifierEscape(s, escaped,
							  CssEscapeType::SIX_DIGIT_HEXA,
							  CssIdentifierEscapeLevel(level)),
				      unescaped),
			  s) << "level=" << level;
	}
}

TEST(CssEscape, Identity)
{
	std::u16string buffer;
	const std::u16string_view s = u"plain";
	EXPECT_EQ(CssStringEscape(s, buffer).data(), s.data());
	EXPECT_EQ(CssIdentifierEscape(s, buffer).data(), s.data());
	EXPECT_EQ(CssUnescape(s, buffer).data(), s.data());
	EXPECT_EQ(CssUnescape({}, buffer).data(), nullptr);
}

TEST(CssEscape, InvalidArguments)
{
	std::u16string buffer;
	EXPECT_THROW(CssStringEscape(u"x", buffer, CssEscapeType(42)),
		     std::invalid_argument);
	EXPECT_THROW(CssStringEscape(u"x", buffer,
				     CssEscapeType::COMPACT_HEXA,
				     CssStringEscapeLevel(0)),
		     std::invalid_argument);
	EXPECT_THROW(CssIdentifierEscape(u"x", buffer,
					 CssEscapeType::COMPACT_HEXA,
					 CssIdentifierEscapeLevel(5)),
		     std::invalid_argument);
}

TEST(CssEscape, ReuseBuffer)
{
	std::u16string buffer;
	auto result = CssStringEscape(u"a'b", buffer);
	EXPECT_EQ(result, u"a\\'b");
	result = CssUnescape(result, buffer);
	EXPECT_EQ(result, u"a'b");
}

TEST(CssEscape, Sink)
{
	const std::u16string_view src = u"x'y\\27z";

	std::u16string dest;
	StringEscapeSink sink(dest);

	CssStringEscape(src, 0, 3, sink,
			CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA,
			CssStringEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET);
	EXPECT_EQ(dest, u"x\\'y");

	dest.clear();
	CssIdentifierEscape(src, 0, 1, sink,
			    CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA,
			    CssIdentifierEscapeLevel::LEVEL_1_BASIC_ESCAPE_SET);
	EXPECT_EQ(dest, u"x");

	dest.clear();
	CssUnescape(src, 3, 4, sink);
	EXPECT_EQ(dest, u"'z");

	EXPECT_THROW(CssUnescape(src, 5, 5, sink), std::invalid_argument);
}
