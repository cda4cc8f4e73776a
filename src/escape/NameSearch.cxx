// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "NameSearch.hxx"

#include <algorithm>

#include <assert.h>

namespace {

enum class NameOrder : uint_least8_t {
	LESS,
	GREATER,
	EQUAL,

	/**
	 * The table name is a strict prefix of the candidate.
	 */
	PREFIX,
};

}

/**
 * Three-way comparison of a table name with a candidate, skipping the
 * marker.  For #NameOrder::PREFIX, #excess is set to the number of
 * candidate characters beyond the name.
 */
[[gnu::pure]]
static NameOrder
CompareName(std::u16string_view name, std::u16string_view candidate,
	    std::size_t &excess) noexcept
{
	const std::size_t common = std::min(name.size(), candidate.size());

	std::size_t i = 1;
	for (; i < common; ++i) {
		if (name[i] < candidate[i])
			return NameOrder::LESS;
		else if (name[i] > candidate[i])
			return NameOrder::GREATER;
	}

	if (name.size() > i)
		return NameOrder::GREATER;

	if (candidate.size() > i) {
		excess = candidate.size() - i;
		return NameOrder::PREFIX;
	}

	return NameOrder::EQUAL;
}

[[gnu::pure]]
static bool
IsStrictPrefix(std::u16string_view name, std::u16string_view candidate) noexcept
{
	return name.size() < candidate.size() &&
		candidate.substr(1, name.size() - 1) == name.substr(1);
}

NameMatch
SearchReferenceName(std::span<const std::u16string> sorted_names,
		    std::u16string_view candidate,
		    bool allow_partial) noexcept
{
	assert(candidate.size() >= 2);

	static constexpr std::size_t NONE = SIZE_MAX;

	std::size_t low = 0, high = sorted_names.size();
	std::size_t partial = NONE, partial_excess = 0;

	while (low < high) {
		const std::size_t mid = (low + high) / 2;

		std::size_t excess;
		switch (CompareName(sorted_names[mid], candidate, excess)) {
		case NameOrder::LESS:
			low = mid + 1;
			break;

		case NameOrder::GREATER:
			high = mid;
			break;

		case NameOrder::EQUAL:
			return {NameMatch::Type::FOUND, mid};

		case NameOrder::PREFIX:
			low = mid + 1;
			if (partial == NONE || excess < partial_excess) {
				partial = mid;
				partial_excess = excess;
			}

			break;
		}
	}

	if (!allow_partial)
		return NameMatch::NotFound();

	/* the search path does not necessarily visit every prefix of
	   the candidate; all entries between the longest prefix and
	   the insertion point begin with that prefix, so walk back
	   from the insertion point until the first prefix is found */
	for (std::size_t i = low; i > 0;) {
		--i;

		if (i == partial)
			break;

		const std::u16string_view name = sorted_names[i];
		if (name.size() < 2 || name[1] != candidate[1])
			break;

		if (IsStrictPrefix(name, candidate))
			return {NameMatch::Type::PARTIAL, i};
	}

	if (partial != NONE)
		return {NameMatch::Type::PARTIAL, partial};

	return NameMatch::NotFound();
}
