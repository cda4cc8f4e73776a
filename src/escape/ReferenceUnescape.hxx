// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

class ReferenceTable;
namespace RefEscape { class EscapeSink; }

/**
 * Replace all named and numeric references in the given text with
 * the codepoints they stand for.  Malformed or unknown references
 * are copied literally; this function never fails because of its
 * input.
 *
 * @return false if there was nothing to unescape; in that case,
 * nothing has been written to the sink
 */
bool
UnescapeReferences(const ReferenceTable &table, std::u16string_view text,
		   RefEscape::EscapeSink &sink);

/**
 * Like the other overload, but write into the given buffer.
 *
 * @return the unmodified #text if there was nothing to unescape
 * (this includes a null view), or a view on #buffer
 */
std::u16string_view
UnescapeReferences(const ReferenceTable &table, std::u16string_view text,
		   std::u16string &buffer);
