// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "ReferenceTableBuilder.hxx"
#include "Logger.hxx"
#include "util/FmtError.hxx"
#include "util/UTF16.hxx"
#include "util/UTF8.hxx"

#include <algorithm>

ReferenceTableBuilder::ReferenceTableBuilder(std::string_view _name,
					     const ReferenceSyntax &_syntax) noexcept
	:name(_name), syntax(_syntax)
{
	levels.fill(UINT_LEAST8_MAX);
}

void
ReferenceTableBuilder::SetDefaultLevel(ReferenceTable::Level level) noexcept
{
	levels.fill(level);
}

void
ReferenceTableBuilder::SetLevel(char32_t codepoint, ReferenceTable::Level level)
{
	if (codepoint >= ReferenceTable::LEVELS_LIMIT)
		throw FmtRuntimeError("Codepoint U+{:04X} is above the level table",
				      uint_least32_t(codepoint));

	levels[codepoint] = level;
}

void
ReferenceTableBuilder::SetLevelRange(char32_t first, char32_t last,
				     ReferenceTable::Level level)
{
	if (first > last)
		throw FmtRuntimeError("Invalid codepoint range U+{:04X}-U+{:04X}",
				      uint_least32_t(first),
				      uint_least32_t(last));

	for (char32_t ch = first; ch <= last; ++ch)
		SetLevel(ch, level);
}

std::u16string
ReferenceTableBuilder::MakeName(std::string_view src) const
{
	auto result = UTF8ToUTF16(src);
	if (result.size() < 2 || result.front() != syntax.marker)
		throw FmtRuntimeError("Malformed reference name '{}'", src);

	return result;
}

void
ReferenceTableBuilder::AddRecord(std::span<const std::string_view> names,
				 std::span<const char32_t> codepoints)
{
	if (names.empty())
		throw std::runtime_error("Reference without a name");

	if (codepoints.empty() || codepoints.size() > 2)
		throw FmtRuntimeError("Unsupported number of codepoints ({}) for reference '{}'",
				      codepoints.size(), names.front());

	for (const char32_t ch : codepoints)
		if (ch > MAX_CODEPOINT)
			throw FmtRuntimeError("Codepoint {:#x} of reference '{}' is out of range",
					      uint_least32_t(ch), names.front());

	Record record;
	record.names.reserve(names.size());
	for (const auto i : names)
		record.names.emplace_back(MakeName(i));

	record.n_codepoints = codepoints.size();
	record.codepoints = {codepoints[0], record.n_codepoints > 1 ? codepoints[1] : char32_t(0)};

	records.emplace_back(std::move(record));
}

void
ReferenceTableBuilder::AddAlias(std::string_view alias)
{
	if (records.empty())
		throw FmtRuntimeError("Alias '{}' without a reference", alias);

	records.back().names.emplace_back(MakeName(alias));
}

namespace {

struct BuildEntry {
	const std::u16string *name;
	int_least32_t value;

	/**
	 * The declaration order, for #CanonicalNamePolicy.
	 */
	std::size_t order;
};

}

[[gnu::pure]]
static bool
IsBetterName(const BuildEntry &a, const BuildEntry &b,
	     CanonicalNamePolicy policy) noexcept
{
	if (policy == CanonicalNamePolicy::SHORTEST_TERMINATED &&
	    a.name->size() != b.name->size())
		return a.name->size() < b.name->size();

	return a.order < b.order;
}

ReferenceTable
ReferenceTableBuilder::Build() const
{
	ReferenceTable table;
	table.name = name;
	table.syntax = syntax;
	table.validator = validator;
	table.levels = levels;

	std::vector<BuildEntry> entries;

	for (const auto &record : records) {
		int_least32_t value;
		if (record.n_codepoints == 1) {
			value = int_least32_t(record.codepoints[0]);
		} else {
			table.double_codepoints.push_back(record.codepoints);
			value = -int_least32_t(table.double_codepoints.size());
		}

		for (const auto &i : record.names)
			entries.push_back({&i, value, entries.size()});
	}

	if (entries.size() >= ReferenceTable::NO_NAME)
		throw FmtRuntimeError("Too many references in table '{}'", name);

	std::sort(entries.begin(), entries.end(),
		  [](const BuildEntry &a, const BuildEntry &b){
			  return *a.name < *b.name;
		  });

	const auto duplicate =
		std::adjacent_find(entries.begin(), entries.end(),
				   [](const BuildEntry &a, const BuildEntry &b){
					   return *a.name == *b.name;
				   });
	if (duplicate != entries.end())
		throw FmtRuntimeError("Duplicate reference '{}' in table '{}'",
				      UTF16ToUTF8(*duplicate->name), name);

	table.sorted_names.reserve(entries.size());
	table.codepoint_for_name.reserve(entries.size());
	table.dense_names.assign(ReferenceTable::DENSE_LIMIT,
				 ReferenceTable::NO_NAME);

	for (std::size_t i = 0; i < entries.size(); ++i) {
		const auto &entry = entries[i];
		table.sorted_names.push_back(*entry.name);
		table.codepoint_for_name.push_back(entry.value);

		/* double-codepoint names are for unescaping only, and
		   names without terminator are legacy aliases */
		if (entry.value < 0 ||
		    entry.name->back() != syntax.terminator)
			continue;

		const char32_t codepoint = entry.value;
		auto &slot = codepoint < ReferenceTable::DENSE_LIMIT
			? table.dense_names[codepoint]
			: table.overflow_names.try_emplace(codepoint,
							   ReferenceTable::NO_NAME).first->second;

		if (slot == ReferenceTable::NO_NAME ||
		    IsBetterName(entry, entries[slot], canonical_policy))
			slot = ReferenceTable::NameIndex(i);
	}

	LogFmt(5, "ReferenceTable",
	       "built '{}': {} names, {} double-codepoint names, {} overflow codepoints",
	       name, table.sorted_names.size(),
	       table.double_codepoints.size(),
	       table.overflow_names.size());

	return table;
}
