// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "escape/ReferenceUnescape.hxx"
#include "escape/ReferenceTableBuilder.hxx"
#include "refescape/Sink.hxx"
#include "util/UTF8.hxx"

#include <gtest/gtest.h>

static ReferenceTable
MakeTestTable(const ReferenceSyntax &syntax)
{
	ReferenceTableBuilder builder("test", syntax);
	builder.Add({"&lt;", "&lt"}, U'<');
	builder.Add({"&amp;", "&amp"}, U'&');
	builder.Add("&not", 0xac);
	builder.Add("&notin;", 0x2209);
	builder.Add("&nvlt;", U'<', 0x20d2);
	return builder.Build();
}

static constexpr char32_t
TranslateZero(char32_t value) noexcept
{
	return value == 0 || value > 0x10ffff ? 0xfffd : value;
}

static const ReferenceSyntax strict_syntax{};

static const ReferenceSyntax lenient_syntax{
	.upper_hex_prefix = true,
	.lenient_numeric = true,
	.partial_names = true,
	.translate_numeric = TranslateZero,
};

static std::string
Unescape(const ReferenceTable &table, std::string_view src)
{
	const auto src16 = UTF8ToUTF16(src);
	std::u16string buffer;
	return UTF16ToUTF8(UnescapeReferences(table, src16, buffer));
}

TEST(ReferenceUnescape, Named)
{
	const auto table = MakeTestTable(strict_syntax);

	EXPECT_EQ(Unescape(table, "a &lt; b"), "a < b");
	EXPECT_EQ(Unescape(table, "&amp;lt;"), "&lt;");
	EXPECT_EQ(Unescape(table, "&notin;"), "\xe2\x88\x89");
	EXPECT_EQ(Unescape(table, "&nvlt;"), "<\xe2\x83\x92");
	EXPECT_EQ(Unescape(table, "&unknown;"), "&unknown;");

	/* names without terminator are matched exactly */
	EXPECT_EQ(Unescape(table, "&lt x"), "< x");
	EXPECT_EQ(Unescape(table, "&not"), "\xc2\xac");
}

TEST(ReferenceUnescape, NoPartial)
{
	const auto table = MakeTestTable(strict_syntax);

	EXPECT_EQ(Unescape(table, "&ltx"), "&ltx");
	EXPECT_EQ(Unescape(table, "&notit;"), "&notit;");
}

TEST(ReferenceUnescape, Partial)
{
	const auto table = MakeTestTable(lenient_syntax);

	EXPECT_EQ(Unescape(table, "&ltx"), "<x");
	EXPECT_EQ(Unescape(table, "&notit;"), "\xc2\xacit;");
	EXPECT_EQ(Unescape(table, "&notin;"), "\xe2\x88\x89");
	EXPECT_EQ(Unescape(table, "&ampamp;"), "&amp;");
	EXPECT_EQ(Unescape(table, "&foo;"), "&foo;");
}

TEST(ReferenceUnescape, NotAReference)
{
	const auto table = MakeTestTable(lenient_syntax);

	EXPECT_EQ(Unescape(table, "&"), "&");
	EXPECT_EQ(Unescape(table, "a&"), "a&");
	EXPECT_EQ(Unescape(table, "& lt;"), "& lt;");
	EXPECT_EQ(Unescape(table, "&\nlt;"), "&\nlt;");
	EXPECT_EQ(Unescape(table, "&\tlt;"), "&\tlt;");
	EXPECT_EQ(Unescape(table, "&\flt;"), "&\flt;");
	EXPECT_EQ(Unescape(table, "&<"), "&<");
	EXPECT_EQ(Unescape(table, "&&lt;"), "&<");
	EXPECT_EQ(Unescape(table, "&;"), "&;");
	EXPECT_EQ(Unescape(table, "&#"), "&#");
	EXPECT_EQ(Unescape(table, "&#;"), "&#;");
	EXPECT_EQ(Unescape(table, "&#x;"), "&#x;");
	EXPECT_EQ(Unescape(table, "&#zz;"), "&#zz;");
	EXPECT_EQ(Unescape(table, "&#xzz;"), "&#xzz;");
}

TEST(ReferenceUnescape, NumericStrict)
{
	const auto table = MakeTestTable(strict_syntax);

	EXPECT_EQ(Unescape(table, "&#65;"), "A");
	EXPECT_EQ(Unescape(table, "&#x41;&#x4a;&#x4A;"), "AJJ");
	EXPECT_EQ(Unescape(table, "&#x1F600;"), "\xf0\x9f\x98\x80");

	/* terminator required */
	EXPECT_EQ(Unescape(table, "&#65 "), "&#65 ");

	/* lower case 'x' only */
	EXPECT_EQ(Unescape(table, "&#X41;"), "&#X41;");

	/* not a Unicode scalar value */
	EXPECT_EQ(Unescape(table, "&#xd800;"), "&#xd800;");
	EXPECT_EQ(Unescape(table, "&#x110000;"), "&#x110000;");
	EXPECT_EQ(Unescape(table, "&#99999999999999999999;"),
		  "&#99999999999999999999;");
}

TEST(ReferenceUnescape, NumericLenient)
{
	const auto table = MakeTestTable(lenient_syntax);

	EXPECT_EQ(Unescape(table, "&#65"), "A");
	EXPECT_EQ(Unescape(table, "&#65x"), "Ax");
	EXPECT_EQ(Unescape(table, "&#X41;"), "A");
	EXPECT_EQ(Unescape(table, "&#0;"), "\xef\xbf\xbd");

	/* saturated instead of overflowing */
	EXPECT_EQ(Unescape(table, "&#99999999999999999999;"), "\xef\xbf\xbd");
	EXPECT_EQ(Unescape(table, "&#x7fffffffffffffff41;"), "\xef\xbf\xbd");
}

TEST(ReferenceUnescape, Identity)
{
	const auto table = MakeTestTable(lenient_syntax);
	std::u16string buffer;

	const std::u16string_view s = u"no references & here";
	EXPECT_EQ(UnescapeReferences(table, s, buffer).data(), s.data());

	const std::u16string_view empty = u"";
	EXPECT_EQ(UnescapeReferences(table, empty, buffer).data(),
		  empty.data());

	EXPECT_EQ(UnescapeReferences(table, {}, buffer).data(), nullptr);
}

TEST(ReferenceUnescape, Sink)
{
	const auto table = MakeTestTable(strict_syntax);

	std::u16string dest;
	RefEscape::StringEscapeSink sink(dest);

	EXPECT_FALSE(UnescapeReferences(table, u"a & b", sink));
	EXPECT_TRUE(dest.empty());

	EXPECT_TRUE(UnescapeReferences(table, u"a &amp; b", sink));
	EXPECT_EQ(UTF16ToUTF8(dest), "a & b");
}
