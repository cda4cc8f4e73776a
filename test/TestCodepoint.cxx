// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "util/UTF16.hxx"

#include <gtest/gtest.h>

TEST(Codepoint, Basic)
{
	const std::u16string_view s = u"aé€";

	auto c = ReadCodepoint(s, 0);
	EXPECT_EQ(c.codepoint, U'a');
	EXPECT_EQ(c.units, 1u);

	c = ReadCodepoint(s, 1);
	EXPECT_EQ(c.codepoint, 0xe9u);
	EXPECT_EQ(c.units, 1u);

	c = ReadCodepoint(s, 2);
	EXPECT_EQ(c.codepoint, 0x20acu);
	EXPECT_EQ(c.units, 1u);
}

TEST(Codepoint, SurrogatePair)
{
	const std::u16string_view s = u"x\U0001F600y";

	auto c = ReadCodepoint(s, 1);
	EXPECT_EQ(c.codepoint, 0x1f600u);
	EXPECT_EQ(c.units, 2u);

	c = ReadCodepoint(s, 3);
	EXPECT_EQ(c.codepoint, U'y');
}

TEST(Codepoint, LoneSurrogate)
{
	/* high surrogate at the end */
	const char16_t a[] = {u'x', 0xd83d};
	auto c = ReadCodepoint({a, 2}, 1);
	EXPECT_EQ(c.codepoint, 0xd83du);
	EXPECT_EQ(c.units, 1u);

	/* high surrogate followed by a regular character */
	const char16_t b[] = {0xd83d, u'x'};
	c = ReadCodepoint({b, 2}, 0);
	EXPECT_EQ(c.codepoint, 0xd83du);
	EXPECT_EQ(c.units, 1u);

	/* low surrogate without high surrogate */
	const char16_t d[] = {0xde00, 0xd83d};
	c = ReadCodepoint({d, 2}, 0);
	EXPECT_EQ(c.codepoint, 0xde00u);
	EXPECT_EQ(c.units, 1u);
}

TEST(Codepoint, Append)
{
	std::u16string s;
	AppendCodepoint(s, U'a');
	AppendCodepoint(s, 0x1f600);
	AppendCodepoint(s, 0xdc00);
	EXPECT_EQ(s.size(), 4u);
	EXPECT_EQ(s[0], u'a');
	EXPECT_EQ(s[1], 0xd83d);
	EXPECT_EQ(s[2], 0xde00);
	EXPECT_EQ(s[3], 0xdc00);

	EXPECT_EQ(ReadCodepoint(s, 1).codepoint, 0x1f600u);
}
