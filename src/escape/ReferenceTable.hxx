// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/**
 * Describes what references look like in a markup format and how
 * tolerant the unescaper is with malformed ones.
 */
struct ReferenceSyntax {
	char16_t marker = u'&';
	char16_t numeric_marker = u'#';
	char16_t terminator = u';';

	/**
	 * Accept "&#X..." in addition to "&#x...".
	 */
	bool upper_hex_prefix = false;

	/**
	 * Accept numeric references without a terminator.
	 */
	bool lenient_numeric = false;

	/**
	 * Allow a table name to match a prefix of a longer
	 * alphanumeric run (HTML5 legacy references like "&not").
	 */
	bool partial_names = false;

	/**
	 * Remap a parsed numeric reference value before it is emitted.
	 * If this is nullptr, values which are not Unicode scalar
	 * values are not considered references at all.
	 */
	char32_t (*translate_numeric)(char32_t value) noexcept = nullptr;
};

/**
 * Returns false for codepoints which are not allowed in the format
 * at all.  Such codepoints are dropped by the escaper.
 */
using CodepointValidator = bool (*)(char32_t codepoint) noexcept;

/**
 * The one or two codepoints a named reference expands to.
 */
struct ReferenceCodepoints {
	std::array<char32_t, 2> codepoints;
	unsigned n;
};

/**
 * An immutable lookup structure for one markup format variant: the
 * sorted list of named references (for unescaping), the
 * codepoint-to-name index (for escaping) and the escape level
 * policy.  Instances are created by #ReferenceTableBuilder and may be
 * shared by any number of threads.
 */
class ReferenceTable {
	friend class ReferenceTableBuilder;

public:
	using NameIndex = uint_least16_t;
	using Level = uint_least8_t;

	static constexpr NameIndex NO_NAME = UINT_LEAST16_MAX;

	/**
	 * Codepoints below this value are indexed in a dense array,
	 * all others in a hash map.
	 */
	static constexpr char32_t DENSE_LIMIT = 0x2fff;

	/**
	 * Codepoints below this value have their own escape level;
	 * all others share one level.
	 */
	static constexpr char32_t LEVELS_LIMIT = 0xa0;

private:
	std::string name;

	ReferenceSyntax syntax;

	CodepointValidator validator = nullptr;

	/**
	 * All names including the marker and (if present) the
	 * terminator, sorted ordinally.
	 */
	std::vector<std::u16string> sorted_names;

	/**
	 * Parallel to #sorted_names: the codepoint, or a negative
	 * value -(i+1) referring to double_codepoints[i].
	 */
	std::vector<int_least32_t> codepoint_for_name;

	std::vector<std::array<char32_t, 2>> double_codepoints;

	/**
	 * Index into #sorted_names for each codepoint below
	 * #DENSE_LIMIT, or #NO_NAME.
	 */
	std::vector<NameIndex> dense_names;

	std::unordered_map<char32_t, NameIndex> overflow_names;

	/**
	 * Minimum escape level per codepoint; the last element applies
	 * to all codepoints from #LEVELS_LIMIT on.
	 */
	std::array<Level, LEVELS_LIMIT + 1> levels;

	ReferenceTable() = default;

public:
	ReferenceTable(ReferenceTable &&) = default;
	ReferenceTable &operator=(ReferenceTable &&) = default;

	ReferenceTable(const ReferenceTable &) = delete;
	ReferenceTable &operator=(const ReferenceTable &) = delete;

	const std::string &GetName() const noexcept {
		return name;
	}

	const ReferenceSyntax &GetSyntax() const noexcept {
		return syntax;
	}

	std::span<const std::u16string> GetSortedNames() const noexcept {
		return sorted_names;
	}

	std::size_t GetDoubleCount() const noexcept {
		return double_codepoints.size();
	}

	std::size_t GetOverflowCount() const noexcept {
		return overflow_names.size();
	}

	[[gnu::pure]]
	Level GetLevel(char32_t codepoint) const noexcept {
		return levels[codepoint < LEVELS_LIMIT
			      ? codepoint
			      : LEVELS_LIMIT];
	}

	/**
	 * Must this codepoint be escaped at the given level?
	 */
	[[gnu::pure]]
	bool MustEscape(char32_t codepoint, unsigned level) const noexcept {
		return level >= GetLevel(codepoint);
	}

	[[gnu::pure]]
	bool IsValid(char32_t codepoint) const noexcept {
		return validator == nullptr || validator(codepoint);
	}

	/**
	 * Look up the canonical name for escaping the given codepoint.
	 * Returns #NO_NAME if there is none.
	 */
	[[gnu::pure]]
	NameIndex FindNameIndex(char32_t codepoint) const noexcept;

	/**
	 * Like FindNameIndex(), but return the name itself (or an empty
	 * string).
	 */
	[[gnu::pure]]
	std::u16string_view FindName(char32_t codepoint) const noexcept {
		const auto i = FindNameIndex(codepoint);
		return i != NO_NAME
			? std::u16string_view{sorted_names[i]}
			: std::u16string_view{};
	}

	/**
	 * Obtain the codepoints the name at the given index of
	 * GetSortedNames() expands to.
	 */
	[[gnu::pure]]
	ReferenceCodepoints GetCodepoints(std::size_t i) const noexcept;
};
