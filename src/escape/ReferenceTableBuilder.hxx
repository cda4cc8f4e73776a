// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "ReferenceTable.hxx"

#include <array>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * Chooses the name used for escaping when several names map to the
 * same codepoint.  Names without the terminator are never chosen.
 */
enum class CanonicalNamePolicy : uint_least8_t {
	/**
	 * The shortest name wins; ties are broken by declaration
	 * order.
	 */
	SHORTEST_TERMINATED,

	/**
	 * The first declared name wins.
	 */
	FIRST_DECLARED,
};

/**
 * Collects the definition of a markup format (named references,
 * escape levels, validator, syntax) and builds a #ReferenceTable.
 * Definition errors throw std::runtime_error.
 */
class ReferenceTableBuilder {
	struct Record {
		std::vector<std::u16string> names;
		std::array<char32_t, 2> codepoints;
		unsigned n_codepoints;
	};

	std::string name;

	ReferenceSyntax syntax;

	CodepointValidator validator = nullptr;

	CanonicalNamePolicy canonical_policy =
		CanonicalNamePolicy::SHORTEST_TERMINATED;

	std::vector<Record> records;

	std::array<ReferenceTable::Level, ReferenceTable::LEVELS_LIMIT + 1> levels;

public:
	/**
	 * Initially, all codepoints have the level UINT_LEAST8_MAX,
	 * i.e. they are escaped only at that level; call
	 * SetDefaultLevel() and SetLevel() to change that.
	 */
	explicit ReferenceTableBuilder(std::string_view _name,
				       const ReferenceSyntax &_syntax={}) noexcept;

	const std::string &GetName() const noexcept {
		return name;
	}

	void SetSyntax(const ReferenceSyntax &_syntax) noexcept {
		syntax = _syntax;
	}

	const ReferenceSyntax &GetSyntax() const noexcept {
		return syntax;
	}

	void SetValidator(CodepointValidator _validator) noexcept {
		validator = _validator;
	}

	void SetCanonicalNamePolicy(CanonicalNamePolicy policy) noexcept {
		canonical_policy = policy;
	}

	/**
	 * Set the level of all codepoints, including those above the
	 * indexed range.
	 */
	void SetDefaultLevel(ReferenceTable::Level level) noexcept;

	/**
	 * Set the level shared by all codepoints from
	 * ReferenceTable::LEVELS_LIMIT on.
	 */
	void SetAboveLevel(ReferenceTable::Level level) noexcept {
		levels[ReferenceTable::LEVELS_LIMIT] = level;
	}

	void SetLevel(char32_t codepoint, ReferenceTable::Level level);

	void SetLevelRange(char32_t first, char32_t last,
			   ReferenceTable::Level level);

	/**
	 * Add a record: one or more names which all expand to the same
	 * one or two codepoints.  Within a record, the order of names
	 * is the declaration order used by #CanonicalNamePolicy.
	 */
	void AddRecord(std::span<const std::string_view> names,
		       std::span<const char32_t> codepoints);

	void Add(std::string_view _name, char32_t codepoint) {
		AddRecord({&_name, 1}, {&codepoint, 1});
	}

	void Add(std::string_view _name, char32_t a, char32_t b) {
		const char32_t codepoints[] = {a, b};
		AddRecord({&_name, 1}, codepoints);
	}

	void Add(std::initializer_list<std::string_view> names,
		 char32_t codepoint) {
		AddRecord({names.begin(), names.size()}, {&codepoint, 1});
	}

	/**
	 * Add another name to the most recently added record.
	 */
	void AddAlias(std::string_view alias);

	bool empty() const noexcept {
		return records.empty();
	}

	ReferenceTable Build() const;

private:
	std::u16string MakeName(std::string_view src) const;
};
