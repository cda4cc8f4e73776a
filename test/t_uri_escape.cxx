// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "refescape/Uri.hxx"
#include "refescape/Sink.hxx"
#include "util/UTF8.hxx"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace RefEscape;

static constexpr struct UriEscapeData {
    UriEscapeType type;
    const char *escaped, *unescaped;
} uri_escape_data[] = {
    { UriEscapeType::PATH, "", "" },
    { UriEscapeType::PATH, "%20", " " },
    { UriEscapeType::PATH, "foo", "foo" },
    { UriEscapeType::PATH, "foo/bar%20baz", "foo/bar baz" },
    { UriEscapeType::PATH, "foo%25bar", "foo%bar" },
    { UriEscapeType::PATH, "foo%2525bar", "foo%25bar" },
    { UriEscapeType::PATH, "a%3Fb%23c", "a?b#c" },
    { UriEscapeType::PATH, "caf%C3%A9", "caf\xc3\xa9" },
    { UriEscapeType::PATH, "%F0%9F%98%80", "\xf0\x9f\x98\x80" },
    { UriEscapeType::PATH, "a+b:c@d;e=f", "a+b:c@d;e=f" },
    { UriEscapeType::PATH_SEGMENT, "a%2Fb", "a/b" },
    { UriEscapeType::QUERY_PARAM, "a%3Db%26c%2Bd%20e", "a=b&c+d e" },
    { UriEscapeType::QUERY_PARAM, "/x?y", "/x?y" },
    { UriEscapeType::FRAGMENT_ID, "a/b?c%23d", "a/b?c#d" },
};

TEST(UriEscapeTest, Escape)
{
    for (const auto &i : uri_escape_data) {
        const auto src = UTF8ToUTF16(i.unescaped);
        std::u16string buffer;
        EXPECT_EQ(UTF16ToUTF8(UriEscape(src, buffer, i.type)), i.escaped);
    }
}

TEST(UriEscapeTest, Unescape)
{
    for (const auto &i : uri_escape_data) {
        const auto src = UTF8ToUTF16(i.escaped);
        std::u16string buffer;
        EXPECT_EQ(UTF16ToUTF8(UriUnescape(src, buffer, i.type)), i.unescaped);
    }
}

TEST(UriEscapeTest, UnescapeDetails)
{
    std::u16string buffer;

    /* lower case hex digits */
    EXPECT_EQ(UriUnescape(u"%c3%a9", buffer, UriEscapeType::PATH), u"\u00e9");

    /* '+' is a space only in query parameters */
    EXPECT_EQ(UriUnescape(u"a+b", buffer, UriEscapeType::QUERY_PARAM), u"a b");
    EXPECT_EQ(UriUnescape(u"a+b", buffer, UriEscapeType::PATH), u"a+b");

    /* malformed UTF-8 */
    EXPECT_EQ(UriUnescape(u"%ff", buffer, UriEscapeType::PATH), u"\ufffd");

    const auto nul = UriUnescape(u"%00", buffer, UriEscapeType::PATH);
    ASSERT_EQ(nul.size(), 1u);
    EXPECT_EQ(nul[0], 0);
}

TEST(UriEscapeTest, Malformed)
{
    std::u16string buffer;
    EXPECT_THROW(UriUnescape(u"%", buffer, UriEscapeType::PATH),
                 std::invalid_argument);
    EXPECT_THROW(UriUnescape(u"a%1", buffer, UriEscapeType::PATH),
                 std::invalid_argument);
    EXPECT_THROW(UriUnescape(u"%gg", buffer, UriEscapeType::PATH),
                 std::invalid_argument);
    EXPECT_THROW(UriEscape(u"x", buffer, UriEscapeType(42)),
                 std::invalid_argument);
}

TEST(UriEscapeTest, LoneSurrogate)
{
    const std::u16string src(1, char16_t(0xd800));
    std::u16string buffer;
    EXPECT_EQ(UriEscape(src, buffer, UriEscapeType::PATH), u"%EF%BF%BD");
}

TEST(UriEscapeTest, Identity)
{
    std::u16string buffer;
    const std::u16string_view s = u"plain";
    EXPECT_EQ(UriEscape(s, buffer, UriEscapeType::PATH).data(), s.data());
    EXPECT_EQ(UriUnescape(s, buffer, UriEscapeType::PATH).data(), s.data());
    EXPECT_EQ(UriEscape({}, buffer, UriEscapeType::PATH).data(), nullptr);
}

TEST(UriEscapeTest, ReuseBuffer)
{
    std::u16string buffer;
    auto result = UriEscape(u"a b", buffer, UriEscapeType::PATH);
    EXPECT_EQ(result, u"a%20b");
    result = UriEscape(result, buffer, UriEscapeType::PATH);
    EXPECT_EQ(result, u"a%2520b");
    result = UriUnescape(result, buffer, UriEscapeType::PATH);
    EXPECT_EQ(result, u"a%20b");
}

TEST(UriEscapeTest, Sink)
{
    const std::u16string_view src = u"x a/b%41";

    std::u16string dest;
    StringEscapeSink sink(dest);

    UriEscape(src, 1, 4, sink, UriEscapeType::PATH_SEGMENT);
    EXPECT_EQ(dest, u"%20a%2Fb");

    dest.clear();
    UriUnescape(src, 5, 3, sink, UriEscapeType::PATH);
    EXPECT_EQ(dest, u"A");

    EXPECT_THROW(UriUnescape(src, 7, 5, sink, UriEscapeType::PATH),
                 std::invalid_argument);
}
