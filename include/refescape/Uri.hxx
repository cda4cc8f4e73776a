// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Percent-encoding of URI components (RFC 3986).  Non-ASCII
 * characters are encoded as UTF-8.
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace RefEscape {

class EscapeSink;

/**
 * The URI component being escaped; it determines which characters
 * may appear unescaped.
 */
enum class UriEscapeType : uint_least8_t {
	/**
	 * A path: segment characters plus '/'.
	 */
	PATH,

	/**
	 * A single path segment: "pchar" only.
	 */
	PATH_SEGMENT,

	/**
	 * The name or value of a query parameter.  '=', '&', '+' and
	 * '#' are escaped; '+' is unescaped to a space.
	 */
	QUERY_PARAM,

	/**
	 * A fragment identifier: "pchar" plus '/' and '?'.
	 */
	FRAGMENT_ID,
};

/**
 * Throws std::invalid_argument if #type is not a valid enum value.
 *
 * @return #text if nothing needed to be escaped (this includes a
 * null view), or a view on #buffer
 *
 * #text may itself be a view on #buffer (i.e. the result of a
 * previous call).
 */
std::u16string_view
UriEscape(std::u16string_view text, std::u16string &buffer,
	  UriEscapeType type);

void
UriEscape(std::span<const char16_t> src,
	  std::size_t offset, std::size_t length,
	  EscapeSink &sink,
	  UriEscapeType type);

/**
 * Decode all "%HH" sequences.  Consecutive sequences are combined and
 * decoded as UTF-8; malformed UTF-8 yields U+FFFD.
 *
 * Throws std::invalid_argument if a '%' is not followed by two hex
 * digits.
 */
std::u16string_view
UriUnescape(std::u16string_view text, std::u16string &buffer,
	    UriEscapeType type);

void
UriUnescape(std::span<const char16_t> src,
	    std::size_t offset, std::size_t length,
	    EscapeSink &sink,
	    UriEscapeType type);

} // namespace RefEscape
