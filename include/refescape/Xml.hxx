// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Escaping and unescaping of XML 1.0 and XML 1.1 character
 * references.
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace RefEscape {

class EscapeSink;

enum class XmlEscapeType : uint_least8_t {
	/**
	 * Use the five predefined entities ("&lt;" etc.) where
	 * possible, decimal references for everything else.
	 */
	CHARACTER_ENTITY_REFERENCES_DEFAULT_TO_DECIMAL,

	CHARACTER_ENTITY_REFERENCES_DEFAULT_TO_HEXA,

	DECIMAL_REFERENCES,

	HEXADECIMAL_REFERENCES,
};

enum class XmlEscapeLevel : uint_least8_t {
	/**
	 * Escape the five markup-significant characters and the
	 * characters which are discouraged in the given XML version.
	 */
	LEVEL_1_ONLY_MARKUP_SIGNIFICANT = 1,

	LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT,

	LEVEL_3_ALL_NON_ALPHANUMERIC,

	LEVEL_4_ALL_CHARACTERS,
};

/**
 * Escape the given text for XML 1.0.  Characters which are not
 * allowed in XML 1.0 documents are removed.
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
Xml10Escape(std::u16string_view text, std::u16string &buffer,
	    XmlEscapeType type=XmlEscapeType::CHARACTER_ENTITY_REFERENCES_DEFAULT_TO_HEXA,
	    XmlEscapeLevel level=XmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT);

void
Xml10Escape(std::span<const char16_t> src,
	    std::size_t offset, std::size_t length,
	    EscapeSink &sink,
	    XmlEscapeType type, XmlEscapeLevel level);

/**
 * Like Xml10Escape(), but for XML 1.1.
 */
std::u16string_view
Xml11Escape(std::u16string_view text, std::u16string &buffer,
	    XmlEscapeType type=XmlEscapeType::CHARACTER_ENTITY_REFERENCES_DEFAULT_TO_HEXA,
	    XmlEscapeLevel level=XmlEscapeLevel::LEVEL_2_ALL_NON_ASCII_PLUS_MARKUP_SIGNIFICANT);

void
Xml11Escape(std::span<const char16_t> src,
	    std::size_t offset, std::size_t length,
	    EscapeSink &sink,
	    XmlEscapeType type, XmlEscapeLevel level);

/**
 * Replace the predefined entities and all well-formed numeric
 * references (XML 1.0 and 1.1).
 */
std::u16string_view
XmlUnescape(std::u16string_view text, std::u16string &buffer);

void
XmlUnescape(std::span<const char16_t> src,
	    std::size_t offset, std::size_t length,
	    EscapeSink &sink);

} // namespace RefEscape
