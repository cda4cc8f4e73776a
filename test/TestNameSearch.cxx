// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "escape/NameSearch.hxx"

#include <gtest/gtest.h>

#include <string>
#include <vector>

static const std::vector<std::u16string> not_names{
	u"&not",
	u"&not;",
	u"&notin;",
};

static void
CheckMatch(const std::vector<std::u16string> &names,
	   std::u16string_view candidate,
	   NameMatch::Type type, std::size_t index=0)
{
	const auto match = SearchReferenceName(names, candidate);
	ASSERT_EQ(match.type, type);
	if (type != NameMatch::Type::NOT_FOUND) {
		ASSERT_EQ(match.index, index);
	}
}

TEST(NameSearch, Exact)
{
	CheckMatch(not_names, u"&notin;", NameMatch::Type::FOUND, 2);
	CheckMatch(not_names, u"&not;", NameMatch::Type::FOUND, 1);
	CheckMatch(not_names, u"&not", NameMatch::Type::FOUND, 0);
}

TEST(NameSearch, Partial)
{
	CheckMatch(not_names, u"&notfoo;", NameMatch::Type::PARTIAL, 0);
	CheckMatch(not_names, u"&notin", NameMatch::Type::PARTIAL, 0);
	CheckMatch(not_names, u"&notinfoo", NameMatch::Type::PARTIAL, 0);
}

TEST(NameSearch, NotFound)
{
	CheckMatch(not_names, u"&no", NameMatch::Type::NOT_FOUND);
	CheckMatch(not_names, u"&no;", NameMatch::Type::NOT_FOUND);
	CheckMatch(not_names, u"&amp;", NameMatch::Type::NOT_FOUND);
	CheckMatch(not_names, u"&zzz", NameMatch::Type::NOT_FOUND);
	CheckMatch({}, u"&not", NameMatch::Type::NOT_FOUND);
}

TEST(NameSearch, NoPartial)
{
	EXPECT_EQ(SearchReferenceName(not_names, u"&notin;", false).type,
		  NameMatch::Type::FOUND);
	EXPECT_EQ(SearchReferenceName(not_names, u"&notfoo;", false).type,
		  NameMatch::Type::NOT_FOUND);
}

/**
 * The longest prefix wins, even if the binary search does not visit
 * it.
 */
TEST(NameSearch, Longest)
{
	const std::vector<std::u16string> names{
		u"&a",
		u"&ab",
		u"&abc;",
		u"&abd",
		u"&abz",
		u"&b",
	};

	CheckMatch(names, u"&abdx", NameMatch::Type::PARTIAL, 3);
	CheckMatch(names, u"&abcx", NameMatch::Type::PARTIAL, 1);
	CheckMatch(names, u"&abc;", NameMatch::Type::FOUND, 2);
	CheckMatch(names, u"&aa", NameMatch::Type::PARTIAL, 0);
	CheckMatch(names, u"&az;", NameMatch::Type::PARTIAL, 0);
	CheckMatch(names, u"&bcd", NameMatch::Type::PARTIAL, 5);
	CheckMatch(names, u"&c", NameMatch::Type::NOT_FOUND);
}

/**
 * The marker is not compared.
 */
TEST(NameSearch, Marker)
{
	const std::vector<std::u16string> names{u"%foo;"};
	CheckMatch(names, u"%foo;", NameMatch::Type::FOUND, 0);
	CheckMatch(names, u"&foo;", NameMatch::Type::FOUND, 0);
}
