// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escaping and unescaping of HTML character references.
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace RefEscape {

class EscapeSink;

enum class HtmlEscapeType : uint_least8_t {
	/**
	 * Use the HTML 4 named references where available, decimal
	 * references for everything else.
	 */
	HTML4_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,

	HTML4_NAMED_REFERENCES_DEFAULT_TO_HEXA,

	/**
	 * Use the HTML5 named references where available, decimal
	 * references for everything else.
	 */
	HTML5_NAMED_REFERENCES_DEFAULT_TO_DECIMAL,

	HTML5_NAMED_REFERENCES_DEFAULT_TO_HEXA,

	/**
	 * Only decimal references ("&#225;").
	 */
	DECIMAL_REFERENCES,

	/**
	 * Only hexadecimal references ("&#xe1;").
	 */
	HEXADECIMAL_REFERENCES,
};

enum class HtmlEscapeLevel : uint_least8_t {
	/**
	 * Escape only '<', '>', '&' and '"'.
	 */
	LEVEL_0_ONLY_MARKUP_SIGNIFICANT_EXCEPT_APOS,

	/**
	 * Like level 0, and also the apostrophe.
	 */
	LEVEL_1_ONLY_MARKUP_SIGNIFICANT,

	/**
	 * Like level 1, and also all non-ASCII characters.
	 */
	LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT,

	/**
	 * Escape everything except ASCII letters and digits.
	 */
	LEVEL_3_ALL_NON_ALPHANUMERIC,

	LEVEL_4_ALL_CHARACTERS,
};

/**
 * Escape the given text.
 *
 * Throws std::invalid_argument if #type or #level is not a valid
 * enum value.
 *
 * @param buffer a buffer which may be used for the result
 * @return #text if nothing needed to be escaped (this includes a
 * null view), or a view on #buffer
 *
 * #text may itself be a view on #buffer (i.e. the result of a
 * previous call).
 */
std::u16string_view
HtmlEscape(std::u16string_view text, std::u16string &buffer,
	   HtmlEscapeType type, HtmlEscapeLevel level);

/**
 * Escape a range of the given buffer and write the result to the
 * sink.  Unmodified text is copied to the sink.
 *
 * Throws std::invalid_argument if the range exceeds the buffer or
 * if #type or #level is not a valid enum value.
 */
void
HtmlEscape(std::span<const char16_t> src,
	   std::size_t offset, std::size_t length,
	   EscapeSink &sink,
	   HtmlEscapeType type, HtmlEscapeLevel level);

/**
 * Escape with HTML5 named references (decimal fallback) at level 2.
 */
std::u16string_view
HtmlEscape5(std::u16string_view text, std::u16string &buffer);

/**
 * Escape with HTML5 named references (decimal fallback) at level 1,
 * i.e. only markup-significant characters.
 */
std::u16string_view
HtmlEscape5Xml(std::u16string_view text, std::u16string &buffer);

/**
 * Escape with HTML 4 named references (decimal fallback) at level 2.
 */
std::u16string_view
HtmlEscape4(std::u16string_view text, std::u16string &buffer);

std::u16string_view
HtmlEscape4Xml(std::u16string_view text, std::u16string &buffer);

/**
 * Replace all HTML5 named references and all numeric references.
 * Malformed references are copied literally.
 */
std::u16string_view
HtmlUnescape(std::u16string_view text, std::u16string &buffer);

void
HtmlUnescape(std::span<const char16_t> src,
	     std::size_t offset, std::size_t length,
	     EscapeSink &sink);

} // namespace RefEscape
