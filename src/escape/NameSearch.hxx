// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

struct NameMatch {
	enum class Type : uint_least8_t {
		NOT_FOUND,

		/**
		 * The whole candidate is a name in the table.
		 */
		FOUND,

		/**
		 * A table name matches a prefix of the candidate; the
		 * remaining characters are not part of the reference.
		 */
		PARTIAL,
	} type;

	/**
	 * The index into the sorted name list (undefined for
	 * #NOT_FOUND).
	 */
	std::size_t index;

	static constexpr NameMatch NotFound() noexcept {
		return {Type::NOT_FOUND, 0};
	}

	constexpr bool IsDefined() const noexcept {
		return type != Type::NOT_FOUND;
	}
};

/**
 * Search a reference name in a sorted name table.  Both the candidate
 * and the table entries begin with the same marker character, which
 * is not compared.
 *
 * If there is no exact match and #allow_partial is set, the longest
 * table entry which is a strict prefix of the candidate is returned
 * as #NameMatch::Type::PARTIAL.
 */
[[gnu::pure]]
NameMatch
SearchReferenceName(std::span<const std::u16string> sorted_names,
		    std::u16string_view candidate,
		    bool allow_partial=true) noexcept;
