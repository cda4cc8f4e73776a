// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string>
#include <string_view>

struct BackslashTable;
struct BackslashEscapeType;
namespace RefEscape { class EscapeSink; }

/**
 * Escape all codepoints which must be escaped at the given level.
 * Codepoints above U+FFFF which need "\u" are written as two
 * escaped surrogates.
 *
 * @return false if nothing needed to be changed; in that case,
 * nothing has been written to the sink
 */
bool
EscapeBackslash(const BackslashTable &table, std::u16string_view text,
		RefEscape::EscapeSink &sink,
		BackslashEscapeType type, unsigned level);

std::u16string_view
EscapeBackslash(const BackslashTable &table, std::u16string_view text,
		std::u16string &buffer,
		BackslashEscapeType type, unsigned level);

/**
 * Resolve all escape sequences.  Unknown or malformed sequences are
 * copied literally.
 *
 * @return false if there was nothing to unescape; in that case,
 * nothing has been written to the sink
 */
bool
UnescapeBackslash(const BackslashTable &table, std::u16string_view text,
		  RefEscape::EscapeSink &sink);

std::u16string_view
UnescapeBackslash(const BackslashTable &table, std::u16string_view text,
		  std::u16string &buffer);
