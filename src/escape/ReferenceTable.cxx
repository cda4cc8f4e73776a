// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ReferenceTable.hxx"

#include <assert.h>

ReferenceTable::NameIndex
ReferenceTable::FindNameIndex(char32_t codepoint) const noexcept
{
	if (codepoint < DENSE_LIMIT)
		return dense_names[codepoint];

	const auto i = overflow_names.find(codepoint);
	return i != overflow_names.end()
		? i->second
		: NO_NAME;
}

ReferenceCodepoints
ReferenceTable::GetCodepoints(std::size_t i) const noexcept
{
	assert(i < codepoint_for_name.size());

	const auto value = codepoint_for_name[i];
	if (value >= 0)
		return {{char32_t(value), 0}, 1};

	const auto &pair = double_codepoints[-value - 1];
	return {pair, 2};
}
