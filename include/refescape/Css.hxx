// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escaping and unescaping of CSS string literals and identifiers.
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace RefEscape {

class EscapeSink;

enum class CssEscapeType : uint_least8_t {
	/**
	 * Use "\'", "\;" etc. for ASCII punctuation, and the shortest
	 * hexadecimal escape ("\E9 ") for everything else.
	 */
	BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA,

	/**
	 * Like #BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA, but with
	 * six-digit hexadecimal escapes ("\0000E9").
	 */
	BACKSLASH_ESCAPES_DEFAULT_TO_SIX_DIGIT_HEXA,

	COMPACT_HEXA,

	SIX_DIGIT_HEXA,
};

enum class CssStringEscapeLevel : uint_least8_t {
	/**
	 * Escape quotes, backslash, '/', '&', ';' and all control
	 * characters.
	 */
	LEVEL_1_BASIC_ESCAPE_SET = 1,

	LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,

	LEVEL_3_ALL_NON_ALPHANUMERIC,

	LEVEL_4_ALL_CHARACTERS,
};

enum class CssIdentifierEscapeLevel : uint_least8_t {
	/**
	 * Escape all ASCII characters which are not allowed in an
	 * identifier, a leading digit and a leading "-" followed by a
	 * digit or another "-".
	 */
	LEVEL_1_BASIC_ESCAPE_SET = 1,

	LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET,

	LEVEL_3_ALL_NON_ALPHANUMERIC,

	LEVEL_4_ALL_CHARACTERS,
};

/**
 * Escape text for use inside a quoted CSS string.
 *
 * Throws std::invalid_argument if #type or #level is not a valid
 * enum value.
 *
 * @return #text if nothing needed to be escaped (this includes a
 * null view), or a view on #buffer
 *
 * #text may itself be a view on #buffer (i.e. the result of a
 * previous call).
 */
std::u16string_view
CssStringEscape(std::u16string_view text, std::u16string &buffer,
		CssEscapeType type=CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA,
		CssStringEscapeLevel level=CssStringEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET);

void
CssStringEscape(std::span<const char16_t> src,
		std::size_t offset, std::size_t length,
		EscapeSink &sink,
		CssEscapeType type, CssStringEscapeLevel level);

/**
 * Escape text so it can be used as a CSS identifier (e.g. a class
 * name in a selector).
 */
std::u16string_view
CssIdentifierEscape(std::u16string_view text, std::u16string &buffer,
		    CssEscapeType type=CssEscapeType::BACKSLASH_ESCAPES_DEFAULT_TO_COMPACT_HEXA,
		    CssIdentifierEscapeLevel level=CssIdentifierEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_BASIC_ESCAPE_SET);

void
CssIdentifierEscape(std::span<const char16_t> src,
		    std::size_t offset, std::size_t length,
		    EscapeSink &sink,
		    CssEscapeType type, CssIdentifierEscapeLevel level);

/**
 * Resolve all CSS escape sequences (in strings and identifiers
 * alike).  A hexadecimal escape which does not describe a Unicode
 * scalar value (or describes U+0000) yields U+FFFD.
 */
std::u16string_view
CssUnescape(std::u16string_view text, std::u16string &buffer);

void
CssUnescape(std::span<const char16_t> src,
	    std::size_t offset, std::size_t length,
	    EscapeSink &sink);

} // namespace RefEscape
