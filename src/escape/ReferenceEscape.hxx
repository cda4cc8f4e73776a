// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

class ReferenceTable;
namespace RefEscape { class EscapeSink; }

/**
 * How a codepoint which must be escaped is written.
 */
struct ReferenceEscapeType {
	/**
	 * Prefer the canonical named reference if the table has one.
	 */
	bool use_names;

	/**
	 * Numeric references are hexadecimal ("&#x..;") instead of
	 * decimal ("&#..;").
	 */
	bool use_hexa;
};

/**
 * Escape all codepoints of the given text which must be escaped at
 * the given level.  Codepoints rejected by the table's validator are
 * dropped.
 *
 * @return false if nothing needed to be changed; in that case,
 * nothing has been written to the sink
 */
bool
EscapeReferences(const ReferenceTable &table, std::u16string_view text,
		 RefEscape::EscapeSink &sink,
		 ReferenceEscapeType type, unsigned level);

/**
 * Like the other overload, but write into the given buffer.
 *
 * @return the unmodified #text if nothing needed to be changed (this
 * includes a null view), or a view on #buffer
 */
std::u16string_view
EscapeReferences(const ReferenceTable &table, std::u16string_view text,
		 std::u16string &buffer,
		 ReferenceEscapeType type, unsigned level);

/**
 * Write a numeric reference for the given codepoint, using the
 * table's syntax.
 */
void
AppendNumericReference(const ReferenceTable &table, char32_t codepoint,
		       bool hexa, RefEscape::EscapeSink &sink);
