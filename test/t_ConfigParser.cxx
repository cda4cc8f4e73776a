// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "io/ConfigParser.hxx"
#include "io/LineParser.hxx"
#include "escape/TableConfig.hxx"
#include "escape/ReferenceEscape.hxx"
#include "escape/ReferenceUnescape.hxx"
#include "util/Exception.hxx"
#include "util/UTF8.hxx"

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace fs = boost::filesystem;

class MyConfigParser final
    : public ConfigParser, public std::vector<std::string> {
public:
    bool finished = false;

    void ParseLine(LineParser &line) override {
        const char *value = line.NextUnescape();
        if (value == nullptr)
            throw LineParser::Error("Quoted value expected");
        line.ExpectEnd();
        emplace_back(value);
    }

    void Finish() override {
        finished = true;
    }
};

static void
ParseConfigLines(ConfigParser &parser, const char *const*lines)
{
    while (*lines != nullptr) {
        std::string line(*lines++);

        LineParser line_parser(line.data());
        if (!parser.PreParseLine(line_parser))
            parser.ParseLine(line_parser);
    }

    parser.Finish();
}

/**
 * A temporary directory which is deleted recursively by the
 * destructor.
 */
class TempDirectory {
    fs::path path;

public:
    TempDirectory()
        :path(fs::temp_directory_path() /
              fs::unique_path("refescape-%%%%-%%%%-%%%%")) {
        fs::create_directories(path);
    }

    ~TempDirectory() noexcept {
        boost::system::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDirectory(const TempDirectory &) = delete;
    TempDirectory &operator=(const TempDirectory &) = delete;

    fs::path Write(const char *name, const char *contents) const {
        fs::path p = path / name;
        fs::ofstream file(p);
        file << contents;
        return p;
    }
};

static std::string
Escape(const ReferenceTable &table, std::u16string_view src, unsigned level)
{
    std::u16string buffer;
    return UTF16ToUTF8(EscapeReferences(table, src, buffer,
                                        {true, false}, level));
}

static std::string
Unescape(const ReferenceTable &table, std::u16string_view src)
{
    std::u16string buffer;
    return UTF16ToUTF8(UnescapeReferences(table, src, buffer));
}

TEST(LineParserTest, Values)
{
    std::string s = "  level U+0080-U+009F 2  ";
    LineParser line(s.data());

    ASSERT_STREQ(line.NextWord(), "level");
    ASSERT_FALSE(line.SkipWord("default"));
    ASSERT_STREQ(line.ExpectValue(), "U+0080-U+009F");
    ASSERT_EQ(line.NextUnsigned(), 2u);
    ASSERT_TRUE(line.IsEnd());
    ASSERT_NO_THROW(line.ExpectEnd());
}

TEST(LineParserTest, Unescape)
{
    std::string s = "'a\\'b\\n' \"x\\\\y\" \"bad\\q\"";
    LineParser line(s.data());

    ASSERT_STREQ(line.NextUnescape(), "a'b\n");
    ASSERT_STREQ(line.NextUnescape(), "x\\y");
    ASSERT_EQ(line.NextUnescape(), nullptr);
}

TEST(LineParserTest, Errors)
{
    std::string s = "-1 foo";
    LineParser line(s.data());
    ASSERT_THROW(line.NextUnsigned(), LineParser::Error);
    ASSERT_THROW(line.ExpectEnd(), LineParser::Error);

    std::string t = "";
    LineParser empty(t.data());
    ASSERT_THROW(empty.ExpectValue(), LineParser::Error);
    ASSERT_EQ(empty.NextWord(), nullptr);

    /* values which do not fit into "unsigned" are not truncated */
    std::string big = "4294967297 4294967295 99999999999999999999999";
    LineParser numbers(big.data());
    ASSERT_THROW(numbers.NextUnsigned(), LineParser::Error);
    ASSERT_EQ(numbers.NextUnsigned(), 4294967295u);
    ASSERT_THROW(numbers.NextUnsigned(), LineParser::Error);
}

TEST(ConfigParserTest, CommentConfigParser)
{
    static const char *const data[] = {
        "# a comment",
        "",
        "   ",
        "'foo'",
        "  \"bar\"  # trailing text is not a comment",
        nullptr
    };

    MyConfigParser p;
    CommentConfigParser c(p);

    ASSERT_THROW(ParseConfigLines(c, data), LineParser::Error);
    ASSERT_EQ(p.size(), 1u);
    ASSERT_EQ(p.front(), "foo");
}

TEST(ConfigParserTest, Finish)
{
    static const char *const data[] = {
        "# only comments",
        "'a'",
        nullptr
    };

    MyConfigParser p;
    CommentConfigParser c(p);
    ParseConfigLines(c, data);
    ASSERT_TRUE(p.finished);
    ASSERT_EQ(p.size(), 1u);
}

TEST(TableConfigTest, Load)
{
    TempDirectory dir;

    dir.Write("common.conf",
              "# shared entities\n"
              "reference \"&lt;\" U+003C\n"
              "reference \"&gt;\" U+003E\n");

    const auto path = dir.Write("custom.conf",
                                "syntax html\n"
                                "include \"common.conf\"\n"
                                "include_optional \"missing.conf\"\n"
                                "\n"
                                "reference \"&amp;\" U+0026\n"
                                "alias \"&amp\"\n"
                                "reference \"&smile;\" U+263A\n"
                                "reference \"&nvlt;\" U+003C U+20D2\n"
                                "level default 3\n"
                                "level U+0026 1\n"
                                "level U+003C-U+003E 1\n"
                                "level above 2\n");

    const auto table = LoadReferenceTable(path);
    EXPECT_EQ(table.GetName(), "custom");
    EXPECT_EQ(table.GetSortedNames().size(), 6u);
    EXPECT_EQ(table.GetDoubleCount(), 1u);

    EXPECT_EQ(Escape(table, u"<a&b>", 1), "&lt;a&amp;b&gt;");
    EXPECT_EQ(Escape(table, u"=", 1), "&#61;");
    EXPECT_EQ(Escape(table, u"x☺", 1), "x\xe2\x98\xba");
    EXPECT_EQ(Escape(table, u"x☺", 2), "x&smile;");
    EXPECT_EQ(Escape(table, u"x☺", 3), "&#120;&smile;");

    /* HTML syntax: legacy names and partial matches */
    EXPECT_EQ(Unescape(table, u"&ampx &#65 &nvlt;"),
              "&x A <\xe2\x83\x92");
}

TEST(TableConfigTest, XmlSyntax)
{
    TempDirectory dir;

    const auto path = dir.Write("strict.conf",
                                "syntax xml\n"
                                "validator xml10\n"
                                "canonical first\n"
                                "reference \"&apos;\" U+0027\n"
                                "alias \"&sq;\"\n"
                                "level U+0027 1\n");

    const auto table = LoadReferenceTable(path);
    EXPECT_EQ(Escape(table, u"'\u0001", 1), "&apos;");
    EXPECT_EQ(Unescape(table, u"&sq;&#65"), "'&#65");
}

TEST(TableConfigTest, Errors)
{
    TempDirectory dir;

    const auto bad = dir.Write("bad.conf",
                               "reference \"&a;\" U+0041\n"
                               "reference \"&b;\" 0042\n");

    try {
        LoadReferenceTable(bad);
        FAIL() << "Exception expected";
    } catch (const std::runtime_error &) {
        const auto msg = GetFullMessage(std::current_exception());
        EXPECT_NE(msg.find("bad.conf:2"), msg.npos) << msg;
        EXPECT_NE(msg.find("Codepoint expected"), msg.npos) << msg;
    }

    const auto empty = dir.Write("empty.conf", "# nothing\n");
    ASSERT_THROW(LoadReferenceTable(empty), std::runtime_error);

    const auto unknown = dir.Write("unknown.conf", "frobnicate 1\n");
    ASSERT_THROW(LoadReferenceTable(unknown), std::runtime_error);

    const auto range = dir.Write("range.conf",
                                 "reference \"&a;\" U+0041\n"
                                 "level U+0050-U+0040 1\n");
    ASSERT_THROW(LoadReferenceTable(range), std::runtime_error);

    const auto include = dir.Write("include.conf",
                                   "include \"does-not-exist.conf\"\n");
    ASSERT_THROW(LoadReferenceTable(include), std::runtime_error);

    /* 4294967297 would be 1 after truncation to 32 bit */
    const auto level = dir.Write("level.conf",
                                 "reference \"&a;\" U+0041\n"
                                 "level default 4294967297\n");
    ASSERT_THROW(LoadReferenceTable(level), std::runtime_error);

    ASSERT_THROW(LoadReferenceTable(dir.Write("dup.conf",
                                              "reference \"&a;\" U+0041\n"
                                              "reference \"&a;\" U+0042\n")),
                 std::runtime_error);
}
